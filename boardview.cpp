#include "boardview.h"

#include <QTextStream>

// --- COLORS ---
const char* const C_RESET = "\033[0m";
const char* const C_GREEN_BG = "\033[42m";
const char* const C_YELLOW_BG = "\033[43m";
const char* const C_ORANGE_BG = "\033[48;5;202m";
const char* const C_BLUE_BG = "\033[46m";

const char* const ROW_TOP = " ___  ___  ___  ___  ___";
const char* const ROW_RULE = " ---  ---  ---  ---  ---";

QString Theme::token(CellState state) const
{
    switch (state) {
    case CellState::Exact: return exactOpen;
    case CellState::Present: return presentOpen;
    case CellState::Absent:
    case CellState::Empty:
        break;
    }
    return QString();
}

QString Theme::cell(const BoardCell& cell) const
{
    if (cell.state == CellState::Empty) return QStringLiteral("   ");

    const QChar letter = QLatin1Char(cell.letter);
    const QString open = token(cell.state);
    if (open.isEmpty()) return QStringLiteral(" %1 ").arg(letter);

    const QString close = cell.state == CellState::Exact ? exactClose : presentClose;
    if (!padded) return open + letter + close;
    return open + QLatin1Char(' ') + letter + QLatin1Char(' ') + close;
}

Theme Theme::ansi(bool highContrast)
{
    Theme theme;
    theme.exactOpen = QLatin1String(highContrast ? C_ORANGE_BG : C_GREEN_BG);
    theme.presentOpen = QLatin1String(highContrast ? C_BLUE_BG : C_YELLOW_BG);
    theme.exactClose = QLatin1String(C_RESET);
    theme.presentClose = QLatin1String(C_RESET);
    return theme;
}

// [x] exact, (x) present
Theme Theme::plain()
{
    Theme theme;
    theme.exactOpen = QStringLiteral("[");
    theme.exactClose = QStringLiteral("]");
    theme.presentOpen = QStringLiteral("(");
    theme.presentClose = QStringLiteral(")");
    theme.padded = false;
    return theme;
}

void printBoard(QTextStream& out, const BoardSnapshot& board, const Theme& theme)
{
    out << ROW_TOP << "\n";
    for (const auto& row : board) {
        for (const auto& cell : row)
            out << '|' << theme.cell(cell) << '|';
        out << "\n" << ROW_RULE << "\n";
    }
    out << "\n";
    out.flush();
}

void printStatistics(QTextStream& out, const Player& player)
{
    out << "---     STATISTICS     ---\n";
    out << "Played: " << player.gamesPlayed
        << " | Win%: " << QString::number(player.winPercentage(), 'f', 0) << '%'
        << " | Current streak: " << player.currentStreak
        << " | Longest streak: " << player.longestStreak << "\n";
    out << "\n";
    out << "--- GUESS DISTRIBUTION ---\n";
    for (int i = 0; i < MAX_GUESSES; ++i)
        out << (i + 1) << "\t|\t" << player.guessDistribution[i] << "\n";
    out.flush();
}

void printSettings(QTextStream& out, const Player& player)
{
    auto onOff = [](bool value) { return value ? "true" : "false"; };
    out << "---   CURRENT SETTINGS   ---\n";
    out << "High-contrast\t|\t" << onOff(player.highContrast) << "\n";
    out << "Hard mode\t|\t" << onOff(player.hardMode) << "\n";
    out.flush();
}
