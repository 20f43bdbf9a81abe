#include <QtTest>

#include "player.h"

#include <algorithm>
#include <climits>

class tst_Player : public QObject
{
    Q_OBJECT

private slots:
    void defaultPlayer();
    void win_data();
    void win();
    void loss_data();
    void loss();
    void firstLossFromDefault();
    void lossKeepsLongestStreak();
    void refusesOutOfRangeAttempts_data();
    void refusesOutOfRangeAttempts();
    void refusesSaturatedCounters_data();
    void refusesSaturatedCounters();
    void winUpToLimit();
    void winPercentage();
    void consistency();
};

static Player seasonedPlayer()
{
    Player p;
    p.gamesPlayed = 12;
    p.gamesWon = 9;
    p.currentStreak = 2;
    p.longestStreak = 5;
    p.guessDistribution = {0, 1, 3, 4, 1, 0};
    return p;
}

static Player streakingPlayer()
{
    Player p;
    p.gamesPlayed = 4;
    p.gamesWon = 4;
    p.currentStreak = 4;
    p.longestStreak = 4;
    p.guessDistribution = {1, 1, 1, 1, 0, 0};
    return p;
}

void tst_Player::defaultPlayer()
{
    const Player p;
    QCOMPARE(p.gamesPlayed, 0);
    QCOMPARE(p.gamesWon, 0);
    QCOMPARE(p.currentStreak, 0);
    QCOMPARE(p.longestStreak, 0);
    for (int count : p.guessDistribution)
        QCOMPARE(count, 0);
    QVERIFY(!p.highContrast);
    QVERIFY(!p.hardMode);
    QVERIFY(p.isConsistent());
}

void tst_Player::win_data()
{
    QTest::addColumn<int>("which");
    QTest::addColumn<int>("attempts");

    const char *names[] = {"default", "seasoned", "streaking"};
    for (int which = 0; which < 3; ++which) {
        for (int attempts = 1; attempts <= MAX_GUESSES; ++attempts)
            QTest::addRow("%s in %d", names[which], attempts) << which << attempts;
    }
}

void tst_Player::win()
{
    QFETCH(int, which);
    QFETCH(int, attempts);

    const Player before = which == 0 ? Player() : which == 1 ? seasonedPlayer() : streakingPlayer();
    Player after = before;

    GameOutcome outcome;
    outcome.solved = true;
    outcome.attempts = attempts;
    outcome.answer = "crane";
    QVERIFY(after.applyOutcome(outcome));

    QCOMPARE(after.guessDistribution[attempts - 1], before.guessDistribution[attempts - 1] + 1);
    for (int i = 0; i < MAX_GUESSES; ++i) {
        if (i != attempts - 1)
            QCOMPARE(after.guessDistribution[i], before.guessDistribution[i]);
    }
    QCOMPARE(after.gamesWon, before.gamesWon + 1);
    QCOMPARE(after.gamesPlayed, before.gamesPlayed + 1);
    QCOMPARE(after.currentStreak, before.currentStreak + 1);
    QCOMPARE(after.longestStreak, std::max(before.longestStreak, before.currentStreak + 1));
    QVERIFY(after.isConsistent());
}

void tst_Player::loss_data()
{
    QTest::addColumn<int>("which");

    QTest::newRow("default") << 0;
    QTest::newRow("seasoned") << 1;
    QTest::newRow("streaking") << 2;
}

void tst_Player::loss()
{
    QFETCH(int, which);

    const Player before = which == 0 ? Player() : which == 1 ? seasonedPlayer() : streakingPlayer();
    Player after = before;

    GameOutcome outcome;
    outcome.solved = false;
    outcome.attempts = MAX_GUESSES;
    QVERIFY(after.applyOutcome(outcome));

    QCOMPARE(after.currentStreak, 0);
    QCOMPARE(after.gamesPlayed, before.gamesPlayed + 1);
    QCOMPARE(after.gamesWon, before.gamesWon);
    QCOMPARE(after.longestStreak, before.longestStreak);
    QVERIFY(after.guessDistribution == before.guessDistribution);
    QCOMPARE(after.gamesLost(), before.gamesLost() + 1);
}

void tst_Player::firstLossFromDefault()
{
    Player p;
    GameOutcome outcome;
    outcome.attempts = MAX_GUESSES;
    QVERIFY(p.applyOutcome(outcome));

    QCOMPARE(p.gamesPlayed, 1);
    QCOMPARE(p.gamesWon, 0);
    QCOMPARE(p.currentStreak, 0);
    QCOMPARE(p.longestStreak, 0);
}

void tst_Player::lossKeepsLongestStreak()
{
    Player p = streakingPlayer();
    GameOutcome loss;
    QVERIFY(p.applyOutcome(loss));
    QCOMPARE(p.longestStreak, 4);

    GameOutcome win;
    win.solved = true;
    win.attempts = 2;
    QVERIFY(p.applyOutcome(win));
    QCOMPARE(p.currentStreak, 1);
    QCOMPARE(p.longestStreak, 4);
}

void tst_Player::refusesOutOfRangeAttempts_data()
{
    QTest::addColumn<int>("attempts");

    QTest::newRow("zero") << 0;
    QTest::newRow("negative") << -1;
    QTest::newRow("seven") << 7;
    QTest::newRow("huge") << 1000;
}

void tst_Player::refusesOutOfRangeAttempts()
{
    QFETCH(int, attempts);

    const Player before = seasonedPlayer();
    Player after = before;

    GameOutcome outcome;
    outcome.solved = true;
    outcome.attempts = attempts;

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Refusing solved outcome"));
    QVERIFY(!after.applyOutcome(outcome));
    QVERIFY(after == before);
}

void tst_Player::refusesSaturatedCounters_data()
{
    QTest::addColumn<int>("played");
    QTest::addColumn<int>("won");
    QTest::addColumn<int>("streak");
    QTest::addColumn<int>("firstSlot");
    QTest::addColumn<bool>("solved");

    QTest::newRow("win, everything saturated") << INT_MAX << INT_MAX << INT_MAX << INT_MAX << true;
    QTest::newRow("win, streak saturated") << 10 << 10 << INT_MAX << 0 << true;
    QTest::newRow("win, played saturated") << INT_MAX << 5 << 1 << 0 << true;
    QTest::newRow("loss, played saturated") << INT_MAX << 0 << 0 << 0 << false;
}

void tst_Player::refusesSaturatedCounters()
{
    QFETCH(int, played);
    QFETCH(int, won);
    QFETCH(int, streak);
    QFETCH(int, firstSlot);
    QFETCH(bool, solved);

    Player before;
    before.gamesPlayed = played;
    before.gamesWon = won;
    before.currentStreak = streak;
    before.longestStreak = streak;
    before.guessDistribution[0] = firstSlot;
    QVERIFY(before.isConsistent());

    Player after = before;
    GameOutcome outcome;
    outcome.solved = solved;
    outcome.attempts = solved ? 1 : MAX_GUESSES;

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("counters are saturated"));
    QVERIFY(!after.applyOutcome(outcome));
    QVERIFY(after == before);
    QVERIFY(after.isConsistent());
}

void tst_Player::winUpToLimit()
{
    Player p;
    p.gamesPlayed = INT_MAX - 1;
    p.gamesWon = INT_MAX - 1;
    p.currentStreak = INT_MAX - 1;
    p.longestStreak = INT_MAX - 1;
    p.guessDistribution[0] = INT_MAX - 1;

    GameOutcome outcome;
    outcome.solved = true;
    outcome.attempts = 1;
    QVERIFY(p.applyOutcome(outcome));

    QCOMPARE(p.gamesPlayed, INT_MAX);
    QCOMPARE(p.gamesWon, INT_MAX);
    QCOMPARE(p.currentStreak, INT_MAX);
    QCOMPARE(p.longestStreak, INT_MAX);
    QCOMPARE(p.guessDistribution[0], INT_MAX);
    QVERIFY(p.isConsistent());
}

void tst_Player::winPercentage()
{
    QCOMPARE(Player().winPercentage(), 0.0);
    QCOMPARE(seasonedPlayer().winPercentage(), 75.0);
    QCOMPARE(streakingPlayer().winPercentage(), 100.0);
    QCOMPARE(seasonedPlayer().gamesLost(), 3);
}

void tst_Player::consistency()
{
    Player p = seasonedPlayer();
    QVERIFY(p.isConsistent());

    p.gamesWon = p.gamesPlayed + 1;
    QVERIFY(!p.isConsistent());

    p = seasonedPlayer();
    p.currentStreak = p.longestStreak + 1;
    QVERIFY(!p.isConsistent());

    p = seasonedPlayer();
    p.guessDistribution[0] = 5;
    QVERIFY(!p.isConsistent());

    p = seasonedPlayer();
    p.guessDistribution[5] = -1;
    QVERIFY(!p.isConsistent());
}

QTEST_APPLESS_MAIN(tst_Player)

#include "tst_player.moc"
