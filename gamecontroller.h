#ifndef GAMECONTROLLER_H
#define GAMECONTROLLER_H

#include <QObject>
#include <QString>
#include "boardview.h"
#include "player.h"
#include "wordlegame.h"

class QTextStream;
class PlayerStore;
class WordSource;

class GameController : public QObject
{
    Q_OBJECT

    Q_PROPERTY(int attempt READ attempt NOTIFY attemptChanged)
    Q_PROPERTY(QString gameStatus READ gameStatus NOTIFY gameStatusChanged)

public:
    GameController(Player& player, PlayerStore& store, QTextStream& in, QTextStream& out,
                   QObject *parent = nullptr);
    ~GameController();

    // Property getters
    int attempt() const { return m_game ? m_game->currentAttempt() : 1; }
    QString gameStatus() const { return m_gameStatus; }

    void setDuplicateRule(DuplicateRule rule) { m_rule = rule; }
    // Replaces the player's colour theme, e.g. with Theme::plain() for dumb terminals
    void setTheme(const Theme& theme) { m_theme = theme; m_themeOverridden = true; }

    // Plays one interactive game, then records and saves the outcome.
    // Returns false on a word source or storage failure, or when input ends
    // before the game does; nothing is saved in that case.
    bool play(WordSource& words, QString *errorString = nullptr);

    bool applySettings(bool highContrast, bool hardMode, QString *errorString = nullptr);
    void showStats();

    const WordleGame *game() const { return m_game; }

signals:
    void attemptChanged();
    void gameStatusChanged();
    void guessRejected(const QString& guess, const QString& reason);
    void boardChanged();
    void gameOver(bool solved, int attempts);

private:
    bool readGuess(QString& line);
    bool handleResults(const GameOutcome& outcome);
    bool saveStats(QString *errorString);
    void setGameStatus(const QString& status);

    Player& m_player;
    PlayerStore& m_store;
    QTextStream& m_in;
    QTextStream& m_out;

    WordleGame *m_game;
    DuplicateRule m_rule;
    Theme m_theme;
    bool m_themeOverridden;
    QString m_gameStatus;
};

#endif // GAMECONTROLLER_H
