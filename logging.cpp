#include "logging.h"

// Only warnings and above are shown unless --verbose or QT_LOGGING_RULES says otherwise.
Q_LOGGING_CATEGORY(lcGame, "cliordle.game", QtWarningMsg)
Q_LOGGING_CATEGORY(lcStore, "cliordle.store", QtWarningMsg)
Q_LOGGING_CATEGORY(lcWords, "cliordle.words", QtWarningMsg)

void enableVerboseLogging()
{
    QLoggingCategory::setFilterRules(QStringLiteral("cliordle.*.debug=true\n"
                                                    "cliordle.*.info=true"));
}
