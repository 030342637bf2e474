#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace quintet {

constexpr size_t kWordLength = 5;
constexpr size_t kDefaultAttempts = 6;
constexpr size_t kMaxAttempts = 100;

enum class Feedback : uint8_t {
  kAbsent = 0,
  kPresent = 1,
  kMatched = 2,
};

enum class ScoringMode {
  // Any letter found elsewhere in the secret is Present, however many times
  // the guess repeats it.
  kLetterPresence,
  // Present marks are capped by the number of unmatched occurrences.
  kOccurrenceCounted,
};

struct InvalidWordLength {
  size_t actual = 0;

  std::string Message() const;
};

class FeedbackSequence {
 public:
  using Slots = std::array<Feedback, kWordLength>;

  explicit FeedbackSequence(const Slots& slots) : slots_(slots) {}

  static FeedbackSequence AllMatched();

  bool FullMatch() const;
  Feedback at(size_t index) const { return slots_[index]; }
  const Slots& slots() const { return slots_; }
  size_t size() const { return slots_.size(); }

  // "0" absent, "1" present, "2" matched, in guess order.
  std::string PatternString() const;

  bool operator==(const FeedbackSequence& other) const {
    return slots_ == other.slots_;
  }
  bool operator!=(const FeedbackSequence& other) const {
    return !(*this == other);
  }

 private:
  Slots slots_;
};

class SecretWord {
 public:
  static std::optional<SecretWord> Construct(std::string_view raw,
                                             InvalidWordLength* error);

  bool IsAtPosition(char c, size_t position) const;
  bool Contains(char c) const;
  size_t Occurrences(char c) const;
  size_t DistinctLetters() const { return position_index_.size(); }
  const std::unordered_set<size_t>* Positions(char c) const;

  const std::string& Reveal() const { return text_; }

 private:
  explicit SecretWord(std::string text);

  std::string text_;
  std::unordered_map<char, std::unordered_set<size_t>> position_index_;
};

class GuessEvaluator {
 public:
  explicit GuessEvaluator(ScoringMode mode = ScoringMode::kLetterPresence)
      : mode_(mode) {}

  // Returns std::nullopt and fills |error| when the guess is not
  // kWordLength characters long.
  std::optional<FeedbackSequence> Evaluate(const SecretWord& secret,
                                           std::string_view guess,
                                           InvalidWordLength* error) const;

  // Position-by-position scoring without the exact-match shortcut.
  std::optional<FeedbackSequence> Scan(const SecretWord& secret,
                                       std::string_view guess,
                                       InvalidWordLength* error) const;

  static bool ValidateGuess(std::string_view guess, InvalidWordLength* error);

  ScoringMode mode() const { return mode_; }

 private:
  FeedbackSequence EvaluatePresence(const SecretWord& secret,
                                    std::string_view guess) const;
  FeedbackSequence EvaluateCounted(const SecretWord& secret,
                                   std::string_view guess) const;

  ScoringMode mode_;
};

class WordSource {
 public:
  virtual ~WordSource() = default;

  // Returns a word that is expected to be kWordLength characters long.
  virtual std::string Generate() = 0;
};

class FixedWordSource : public WordSource {
 public:
  explicit FixedWordSource(std::string word) : word_(std::move(word)) {}

  std::string Generate() override { return word_; }

 private:
  std::string word_;
};

class WordBank : public WordSource {
 public:
  explicit WordBank(uint32_t seed) : rng_(seed) {}

  bool LoadFile(const std::string& path);
  void SetWordList(const std::vector<std::string>& words);

  const std::vector<std::string>& words() const { return words_; }
  size_t skipped() const { return skipped_; }

  std::string Generate() override;

  static std::vector<std::string> BuiltinWords();
  static bool IsValidWord(std::string_view word);
  static std::string NormalizeWord(std::string_view word);

 private:
  std::vector<std::string> words_;
  size_t skipped_ = 0;
  std::mt19937 rng_;
};

enum class GameState {
  kPlaying,
  kWon,
  kLost,
};

enum class GuessOutcome {
  kRejected,
  kContinue,
  kWon,
  kLost,
  kFinished,
};

class GameSession {
 public:
  struct Turn {
    std::string guess;
    FeedbackSequence feedback;
  };

  GameSession(SecretWord secret,
              size_t max_attempts,
              GuessEvaluator evaluator = GuessEvaluator());

  GuessOutcome Submit(std::string_view guess,
                      FeedbackSequence* feedback_out,
                      InvalidWordLength* error_out);

  GameState state() const { return state_; }
  size_t attempts_used() const { return attempts_used_; }
  size_t attempts_left() const { return max_attempts_ - attempts_used_; }
  size_t max_attempts() const { return max_attempts_; }
  const SecretWord& secret() const { return secret_; }
  const std::vector<Turn>& history() const { return history_; }

 private:
  SecretWord secret_;
  GuessEvaluator evaluator_;
  size_t max_attempts_;
  size_t attempts_used_ = 0;
  GameState state_ = GameState::kPlaying;
  std::vector<Turn> history_;
};

std::string ToLowerAscii(std::string_view input);
std::string ToUpperAscii(std::string_view input);
std::string TrimWhitespace(std::string_view input);

// Parses an unsigned decimal no greater than |max_value|. Signs, blanks,
// trailing characters and overflow are all rejected.
bool ParseCount(std::string_view text, uint64_t max_value, uint64_t* out);

}  // namespace quintet
