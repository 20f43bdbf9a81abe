#ifndef PLAYER_H
#define PLAYER_H

#include <array>
#include <string>

// Constants
const int WORD_LENGTH = 5;
const int MAX_GUESSES = 6;

// Result of one finished game, handed from the session to the statistics model
struct GameOutcome {
    bool solved = false;
    int attempts = 0;
    std::string answer;
};

// Durable player profile. One per installation, persisted by PlayerStore.
struct Player {
    int gamesPlayed = 0;
    int gamesWon = 0;
    int currentStreak = 0;
    int longestStreak = 0;
    // index i counts games won in exactly i+1 guesses
    std::array<int, MAX_GUESSES> guessDistribution{};

    bool highContrast = false;
    bool hardMode = false;

    int gamesLost() const { return gamesPlayed - gamesWon; }
    double winPercentage() const;

    // Folds a finished game into the counters. A solved outcome whose attempt
    // count is outside 1..MAX_GUESSES is refused and leaves the player untouched,
    // as is any outcome that would push a counter past INT_MAX.
    bool applyOutcome(const GameOutcome& outcome);

    // Counter invariants that any stored profile has to satisfy
    bool isConsistent() const;

    bool operator==(const Player& other) const;
    bool operator!=(const Player& other) const { return !(*this == other); }
};

#endif // PLAYER_H
