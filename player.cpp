#include "player.h"
#include "logging.h"

#include <algorithm>
#include <climits>

double Player::winPercentage() const
{
    if (gamesPlayed == 0) return 0.0;
    return static_cast<double>(gamesWon) / gamesPlayed * 100.0;
}

bool Player::applyOutcome(const GameOutcome& outcome)
{
    if (outcome.solved) {
        if (outcome.attempts < 1 || outcome.attempts > MAX_GUESSES) {
            qCWarning(lcGame) << "Refusing solved outcome with" << outcome.attempts << "attempts";
            return false;
        }
        if (gamesPlayed == INT_MAX || gamesWon == INT_MAX || currentStreak == INT_MAX
            || guessDistribution[outcome.attempts - 1] == INT_MAX) {
            qCWarning(lcGame) << "Refusing outcome, counters are saturated";
            return false;
        }
        ++currentStreak;
        longestStreak = std::max(longestStreak, currentStreak);
        ++guessDistribution[outcome.attempts - 1];
        ++gamesWon;
        ++gamesPlayed;
        qCDebug(lcGame) << "Win recorded in" << outcome.attempts << "guesses, streak" << currentStreak;
    } else {
        if (gamesPlayed == INT_MAX) {
            qCWarning(lcGame) << "Refusing outcome, counters are saturated";
            return false;
        }
        currentStreak = 0;
        ++gamesPlayed;
        qCDebug(lcGame) << "Loss recorded, streak reset";
    }
    return true;
}

bool Player::isConsistent() const
{
    if (gamesPlayed < 0 || gamesWon < 0 || currentStreak < 0 || longestStreak < 0)
        return false;
    if (gamesWon > gamesPlayed)
        return false;
    if (longestStreak < currentStreak)
        return false;

    long long distributed = 0;
    for (int count : guessDistribution) {
        if (count < 0) return false;
        distributed += count;
    }
    return distributed <= gamesWon;
}

bool Player::operator==(const Player& other) const
{
    return gamesPlayed == other.gamesPlayed
        && gamesWon == other.gamesWon
        && currentStreak == other.currentStreak
        && longestStreak == other.longestStreak
        && guessDistribution == other.guessDistribution
        && highContrast == other.highContrast
        && hardMode == other.hardMode;
}
