#ifndef WORDLEGAME_H
#define WORDLEGAME_H

#include "player.h"

#include <optional>
#include <string>
#include <vector>

class WordSource;

enum class LetterState {
    Exact,    // right letter, right position
    Present,  // letter occurs elsewhere in the answer
    Absent
};

// How repeated letters in a guess are credited.
// Classic marks every occurrence of a letter found in the answer as Present;
// Standard caps Present marks at the count left over after exact matches.
enum class DuplicateRule {
    Classic,
    Standard
};

std::vector<LetterState> classify(const std::string& guess, const std::string& answer,
                                  DuplicateRule rule = DuplicateRule::Classic);

enum class SessionState {
    AwaitingGuess,
    Solved,
    Exhausted
};

enum class RejectReason {
    None,
    InvalidGuess,
    HardMode,
    SessionOver
};

struct GuessResult {
    bool accepted = false;
    RejectReason reason = RejectReason::None;
    std::string guess;   // normalized input
    std::string detail;  // hard mode explanation, empty otherwise
};

enum class CellState {
    Empty,
    Absent,
    Present,
    Exact
};

struct BoardCell {
    char letter = ' ';
    CellState state = CellState::Empty;
};

// Always MAX_GUESSES rows of WORD_LENGTH cells; rows past the last guess are Empty
using BoardSnapshot = std::vector<std::vector<BoardCell>>;

// One play session: up to six guesses against a fixed answer.
// The player is only read (hard mode); statistics are applied by the caller
// from the outcome returned by finish().
class WordleGame {
private:
    const Player& owner;
    WordSource& words;
    std::string answer;
    std::vector<std::string> guesses;
    bool solved;
    DuplicateRule rule;

    std::string check_hard_mode(const std::string& guess) const;

public:
    WordleGame(const Player& player, WordSource& source, const std::string& secret,
               DuplicateRule duplicateRule = DuplicateRule::Classic);

    GuessResult submitGuess(const std::string& raw);

    SessionState state() const;
    bool is_terminal() const { return state() != SessionState::AwaitingGuess; }
    // 1-based number of the attempt being waited for
    int currentAttempt() const { return static_cast<int>(guesses.size()) + 1; }

    BoardSnapshot renderBoard() const;

    // Only valid once the session is Solved or Exhausted. Calling it earlier is
    // the SessionNotTerminal contract violation: it logs a warning and returns
    // an empty optional.
    std::optional<GameOutcome> finish() const;

    const std::string& getAnswer() const { return answer; }
    const std::vector<std::string>& getGuesses() const { return guesses; }
    bool isSolved() const { return solved; }
    DuplicateRule duplicateRule() const { return rule; }
};

std::string normalize_guess(const std::string& raw);

#endif // WORDLEGAME_H
