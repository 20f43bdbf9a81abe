#ifndef BOARDVIEW_H
#define BOARDVIEW_H

#include "player.h"
#include "wordlegame.h"

#include <QString>

class QTextStream;

// Maps a cell state to the text wrapped around its letter.
struct Theme {
    QString exactOpen;
    QString exactClose;
    QString presentOpen;
    QString presentClose;
    // colour highlights span the padding around the letter, brackets replace it
    bool padded = true;

    QString token(CellState state) const;
    QString cell(const BoardCell& cell) const;

    static Theme ansi(bool highContrast);
    static Theme plain();
};

void printBoard(QTextStream& out, const BoardSnapshot& board, const Theme& theme);
void printStatistics(QTextStream& out, const Player& player);
void printSettings(QTextStream& out, const Player& player);

#endif // BOARDVIEW_H
