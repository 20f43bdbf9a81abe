#include "wordlegame.h"
#include "logging.h"
#include "wordsource.h"

#include <algorithm>
#include <array>
#include <cctype>

// Helper functions
inline void to_lower_inplace(std::string& s) {
  for (char& c : s) c = std::tolower(static_cast<unsigned char>(c));
}

static std::string ordinal(int n) {
  switch (n) {
  case 1: return "1st";
  case 2: return "2nd";
  case 3: return "3rd";
  default: return std::to_string(n) + "th";
  }
}

static char upper(char c) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::string normalize_guess(const std::string& raw) {
  std::string guess = raw;
  if (!guess.empty() && guess.back() == '\n') guess.pop_back();
  if (!guess.empty() && guess.back() == '\r') guess.pop_back();
  to_lower_inplace(guess);
  return guess;
}

std::vector<LetterState> classify(const std::string& guess, const std::string& answer,
                                  DuplicateRule rule) {
  const size_t len = std::min(guess.size(), answer.size());
  std::vector<LetterState> result(len, LetterState::Absent);

  if (rule == DuplicateRule::Classic) {
    for (size_t i = 0; i < len; ++i) {
      if (guess[i] == answer[i]) {
        result[i] = LetterState::Exact;
      } else if (answer.find(guess[i]) != std::string::npos) {
        result[i] = LetterState::Present;
      }
    }
    return result;
  }

  // Standard: exact matches first, then hand out Present marks from the
  // letters of the answer that are still unmatched, left to right.
  std::array<int, 256> remaining{};
  for (size_t i = 0; i < len; ++i) {
    if (guess[i] == answer[i]) {
      result[i] = LetterState::Exact;
    } else {
      ++remaining[static_cast<unsigned char>(answer[i])];
    }
  }
  for (size_t i = 0; i < len; ++i) {
    if (result[i] == LetterState::Exact) continue;
    int& left = remaining[static_cast<unsigned char>(guess[i])];
    if (left > 0) {
      result[i] = LetterState::Present;
      --left;
    }
  }
  return result;
}

// Constructor
WordleGame::WordleGame(const Player& player, WordSource& source, const std::string& secret,
                       DuplicateRule duplicateRule)
  : owner(player)
  , words(source)
  , answer(normalize_guess(secret))
  , solved(false)
  , rule(duplicateRule)
{
  guesses.reserve(MAX_GUESSES);
}

SessionState WordleGame::state() const {
  if (solved) return SessionState::Solved;
  if (guesses.size() >= static_cast<size_t>(MAX_GUESSES)) return SessionState::Exhausted;
  return SessionState::AwaitingGuess;
}

// Revealed exact letters have to stay put and revealed present letters have
// to be reused. Returns the first violation, or an empty string.
std::string WordleGame::check_hard_mode(const std::string& guess) const {
  for (const auto& previous : guesses) {
    const auto feedback = classify(previous, answer, rule);
    for (size_t i = 0; i < feedback.size(); ++i) {
      if (feedback[i] == LetterState::Exact && guess[i] != previous[i]) {
        return ordinal(static_cast<int>(i) + 1) + " letter must be " + upper(previous[i]);
      }
    }
  }
  for (const auto& previous : guesses) {
    const auto feedback = classify(previous, answer, rule);
    for (size_t i = 0; i < feedback.size(); ++i) {
      if (feedback[i] == LetterState::Present && guess.find(previous[i]) == std::string::npos) {
        return std::string("guess must contain ") + upper(previous[i]);
      }
    }
  }
  return "";
}

GuessResult WordleGame::submitGuess(const std::string& raw) {
  GuessResult result;
  result.guess = normalize_guess(raw);

  if (is_terminal()) {
    qCWarning(lcGame) << "Guess submitted after the session ended:" << result.guess.c_str();
    result.reason = RejectReason::SessionOver;
    return result;
  }

  if (!words.is_valid_guess(result.guess)) {
    qCDebug(lcGame) << "Rejected invalid guess" << result.guess.c_str();
    result.reason = RejectReason::InvalidGuess;
    return result;
  }

  if (owner.hardMode) {
    result.detail = check_hard_mode(result.guess);
    if (!result.detail.empty()) {
      qCDebug(lcGame) << "Rejected hard mode guess" << result.guess.c_str() << "-" << result.detail.c_str();
      result.reason = RejectReason::HardMode;
      return result;
    }
  }

  guesses.push_back(result.guess);
  if (result.guess == answer) solved = true;
  result.accepted = true;

  qCDebug(lcGame) << "Accepted guess" << guesses.size() << "of" << MAX_GUESSES << result.guess.c_str()
                  << (solved ? "(solved)" : "");
  return result;
}

BoardSnapshot WordleGame::renderBoard() const {
  BoardSnapshot board(MAX_GUESSES, std::vector<BoardCell>(WORD_LENGTH));

  for (size_t row = 0; row < guesses.size(); ++row) {
    const std::string& guess = guesses[row];
    const auto feedback = classify(guess, answer, rule);
    for (size_t col = 0; col < feedback.size() && col < static_cast<size_t>(WORD_LENGTH); ++col) {
      BoardCell& cell = board[row][col];
      cell.letter = guess[col];
      switch (feedback[col]) {
      case LetterState::Exact: cell.state = CellState::Exact; break;
      case LetterState::Present: cell.state = CellState::Present; break;
      case LetterState::Absent: cell.state = CellState::Absent; break;
      }
    }
  }
  return board;
}

std::optional<GameOutcome> WordleGame::finish() const {
  if (!is_terminal()) {
    qCWarning(lcGame) << "finish() called with the session still awaiting guess" << currentAttempt();
    return std::nullopt;
  }

  GameOutcome outcome;
  outcome.solved = solved;
  outcome.attempts = static_cast<int>(guesses.size());
  outcome.answer = answer;
  return outcome;
}
