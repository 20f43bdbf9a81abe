#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <QtGlobal>
#include "gamecontroller.h"
#include "logging.h"
#include "playerstore.h"
#include "storage.h"
#include "wordsource.h"

static const char *const USAGE_ERROR = "play, settings, or stats subcommand required";

static int exitGracefully(const QString& message)
{
    QTextStream err(stderr);
    err << "error: " << message << "\n";
    err.flush();
    return 1;
}

static bool parseBool(const QString& text, bool *ok)
{
    const QString value = text.trimmed().toLower();
    *ok = true;
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    *ok = false;
    return false;
}

static QString storePath(const QCommandLineParser& parser, const QCommandLineOption& dbOption)
{
    if (parser.isSet(dbOption)) return parser.value(dbOption);
    const QString env = qEnvironmentVariable("CLIORDLE_DB");
    if (!env.isEmpty()) return env;
    return QStringLiteral("cliordle.db");
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("cliordle");
    QCoreApplication::setApplicationVersion("1.0.0");
    qSetMessagePattern("%{category}: %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Guess the hidden five-letter word in six tries.");
    // -highContrast=true works as well as --highContrast=true
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "play, settings, or stats");

    const QCommandLineOption dbOption("db", "Player store file (default: cliordle.db, or $CLIORDLE_DB).", "path");
    const QCommandLineOption wordsOption("words", "Directory holding answers.txt and allowed.txt.", "dir");
    const QCommandLineOption verboseOption("verbose", "Print debug logging to stderr.");
    const QCommandLineOption noColorOption("no-color", "Mark letters with brackets instead of colours.");
    const QCommandLineOption contrastOption("highContrast", "settings: turn high-contrast mode on/off.", "bool");
    const QCommandLineOption hardModeOption("hardMode", "settings: turn hard mode on/off.", "bool");
    const QCommandLineOption standardOption("standard-duplicates",
                                            "play: credit repeated letters only as often as the answer has them.");
    parser.addOptions({dbOption, wordsOption, verboseOption, noColorOption,
                       contrastOption, hardModeOption, standardOption});

    parser.process(app);

    if (parser.isSet(verboseOption))
        enableVerboseLogging();

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1)
        return exitGracefully(USAGE_ERROR);

    const QString command = args.first();
    if (command != "play" && command != "settings" && command != "stats")
        return exitGracefully(USAGE_ERROR);

    SettingsStorage storage(storePath(parser, dbOption));
    StorageError storageError;
    if (!storage.open(&storageError))
        return exitGracefully(storageError.message);

    PlayerStore store(storage);
    Player player;
    if (!store.load(&player, &storageError))
        return exitGracefully(storageError.message);

    QTextStream in(stdin);
    QTextStream out(stdout);
    GameController controller(player, store, in, out);
    if (parser.isSet(noColorOption) || qEnvironmentVariableIsSet("NO_COLOR"))
        controller.setTheme(Theme::plain());

    QString error;
    if (command == "play") {
        DictionaryWordSource words;
        const bool loaded = parser.isSet(wordsOption)
                ? words.load_directory(parser.value(wordsOption), &error)
                : words.load_default(&error);
        if (!loaded)
            return exitGracefully(error);

        if (parser.isSet(standardOption))
            controller.setDuplicateRule(DuplicateRule::Standard);
        if (!controller.play(words, &error))
            return exitGracefully(error);
    } else if (command == "settings") {
        bool highContrast = player.highContrast;
        bool hardMode = player.hardMode;
        bool ok = true;
        if (parser.isSet(contrastOption)) {
            highContrast = parseBool(parser.value(contrastOption), &ok);
            if (!ok) return exitGracefully(QString("invalid value for --highContrast: %1").arg(parser.value(contrastOption)));
        }
        if (parser.isSet(hardModeOption)) {
            hardMode = parseBool(parser.value(hardModeOption), &ok);
            if (!ok) return exitGracefully(QString("invalid value for --hardMode: %1").arg(parser.value(hardModeOption)));
        }
        if (!controller.applySettings(highContrast, hardMode, &error))
            return exitGracefully(error);
    } else {
        controller.showStats();
    }

    return 0;
}
