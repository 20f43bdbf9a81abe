#include "gamecontroller.h"
#include "logging.h"
#include "playerstore.h"
#include "wordsource.h"

#include <QTextStream>

GameController::GameController(Player& player, PlayerStore& store, QTextStream& in, QTextStream& out,
                               QObject *parent)
    : QObject(parent)
    , m_player(player)
    , m_store(store)
    , m_in(in)
    , m_out(out)
    , m_game(nullptr)
    , m_rule(DuplicateRule::Classic)
    , m_theme(Theme::ansi(player.highContrast))
    , m_themeOverridden(false)
{
    m_gameStatus = "Ready";
}

GameController::~GameController()
{
    delete m_game;
}

void GameController::setGameStatus(const QString& status)
{
    if (m_gameStatus == status) return;
    m_gameStatus = status;
    emit gameStatusChanged();
}

bool GameController::play(WordSource& words, QString *errorString)
{
    delete m_game;
    m_game = nullptr;

    const std::string answer = words.getRandomAnswer();
    if (answer.empty()) {
        if (errorString) *errorString = QStringLiteral("could not pick an answer: the word list is empty");
        setGameStatus("No answer available");
        return false;
    }

    qCDebug(lcGame) << "Starting new game";

    m_game = new WordleGame(m_player, words, answer, m_rule);
    if (!m_themeOverridden)
        m_theme = Theme::ansi(m_player.highContrast);
    emit attemptChanged();
    setGameStatus("Game started");

    m_out << "--- START OF CLIORDLE GAME ---\n";
    while (!m_game->is_terminal()) {
        m_out << "Guess " << m_game->currentAttempt() << "/" << MAX_GUESSES << ": ";
        m_out.flush();

        QString line;
        if (!readGuess(line)) {
            m_out << "\n";
            m_out.flush();
            qCDebug(lcGame) << "Input closed on guess" << m_game->currentAttempt();
            if (errorString) *errorString = QStringLiteral("input closed before the game finished");
            setGameStatus("Game abandoned");
            return false;
        }

        const GuessResult result = m_game->submitGuess(line.toStdString());
        if (!result.accepted) {
            const QString guess = QString::fromStdString(result.guess);
            if (result.reason == RejectReason::HardMode) {
                m_out << "Hard mode: " << QString::fromStdString(result.detail) << ", try again\n";
                emit guessRejected(guess, QStringLiteral("hard-mode"));
            } else {
                m_out << guess << " is an invalid guess, try again\n";
                emit guessRejected(guess, QStringLiteral("invalid-guess"));
            }
            continue;
        }

        printBoard(m_out, m_game->renderBoard(), m_theme);
        emit boardChanged();
        emit attemptChanged();
    }

    const std::optional<GameOutcome> outcome = m_game->finish();
    if (!outcome) {
        if (errorString) *errorString = QStringLiteral("game ended in an unfinished state");
        return false;
    }

    if (!handleResults(*outcome)) {
        if (errorString) *errorString = QStringLiteral("game outcome could not be recorded");
        return false;
    }
    return saveStats(errorString);
}

bool GameController::readGuess(QString& line)
{
    return m_in.readLineInto(&line);
}

bool GameController::handleResults(const GameOutcome& outcome)
{
    if (outcome.solved) {
        m_out << "Impressive! You got the word in " << outcome.attempts << " guesses\n";
        setGameStatus("Solved");
    } else {
        m_out << "The answer was " << QString::fromStdString(outcome.answer) << "\n";
        setGameStatus("Failed");
    }
    m_out.flush();

    if (!m_player.applyOutcome(outcome))
        return false;

    qCDebug(lcGame) << "Game over, solved:" << outcome.solved << "attempts:" << outcome.attempts;
    emit gameOver(outcome.solved, outcome.attempts);
    return true;
}

bool GameController::saveStats(QString *errorString)
{
    StorageError error;
    if (!m_store.save(m_player, &error)) {
        if (errorString) *errorString = error.message;
        return false;
    }
    return true;
}

bool GameController::applySettings(bool highContrast, bool hardMode, QString *errorString)
{
    qCDebug(lcGame) << "Applying settings, high contrast:" << highContrast << "hard mode:" << hardMode;

    m_player.highContrast = highContrast;
    m_player.hardMode = hardMode;
    if (!m_themeOverridden)
        m_theme = Theme::ansi(m_player.highContrast);

    printSettings(m_out, m_player);
    return saveStats(errorString);
}

void GameController::showStats()
{
    printStatistics(m_out, m_player);
}
