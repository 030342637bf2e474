#include "Game.hpp"

#include <algorithm>
#include <sstream>

namespace quintet {

std::string InvalidWordLength::Message() const {
  std::ostringstream oss;
  oss << "expected " << kWordLength << " characters, got " << actual;
  return oss.str();
}

FeedbackSequence FeedbackSequence::AllMatched() {
  Slots slots;
  slots.fill(Feedback::kMatched);
  return FeedbackSequence(slots);
}

bool FeedbackSequence::FullMatch() const {
  return std::all_of(slots_.begin(), slots_.end(), [](Feedback f) {
    return f == Feedback::kMatched;
  });
}

std::string FeedbackSequence::PatternString() const {
  std::string out(kWordLength, '0');
  for (size_t i = 0; i < kWordLength; ++i) {
    out[i] = static_cast<char>('0' + static_cast<int>(slots_[i]));
  }
  return out;
}

SecretWord::SecretWord(std::string text) : text_(std::move(text)) {
  for (size_t i = 0; i < text_.size(); ++i) {
    position_index_[text_[i]].insert(i);
  }
}

std::optional<SecretWord> SecretWord::Construct(std::string_view raw,
                                                InvalidWordLength* error) {
  if (raw.size() != kWordLength) {
    if (error) {
      error->actual = raw.size();
    }
    return std::nullopt;
  }
  return SecretWord(std::string(raw));
}

bool SecretWord::IsAtPosition(char c, size_t position) const {
  const std::unordered_set<size_t>* positions = Positions(c);
  return positions && positions->count(position) > 0;
}

bool SecretWord::Contains(char c) const {
  return position_index_.find(c) != position_index_.end();
}

size_t SecretWord::Occurrences(char c) const {
  const std::unordered_set<size_t>* positions = Positions(c);
  return positions ? positions->size() : 0;
}

const std::unordered_set<size_t>* SecretWord::Positions(char c) const {
  auto it = position_index_.find(c);
  if (it == position_index_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool GuessEvaluator::ValidateGuess(std::string_view guess,
                                   InvalidWordLength* error) {
  if (guess.size() == kWordLength) {
    return true;
  }
  if (error) {
    error->actual = guess.size();
  }
  return false;
}

std::optional<FeedbackSequence> GuessEvaluator::Evaluate(
    const SecretWord& secret,
    std::string_view guess,
    InvalidWordLength* error) const {
  if (!ValidateGuess(guess, error)) {
    return std::nullopt;
  }
  if (guess == secret.Reveal()) {
    return FeedbackSequence::AllMatched();
  }
  return Scan(secret, guess, error);
}

std::optional<FeedbackSequence> GuessEvaluator::Scan(
    const SecretWord& secret,
    std::string_view guess,
    InvalidWordLength* error) const {
  if (!ValidateGuess(guess, error)) {
    return std::nullopt;
  }
  if (mode_ == ScoringMode::kOccurrenceCounted) {
    return EvaluateCounted(secret, guess);
  }
  return EvaluatePresence(secret, guess);
}

FeedbackSequence GuessEvaluator::EvaluatePresence(
    const SecretWord& secret,
    std::string_view guess) const {
  FeedbackSequence::Slots slots;
  slots.fill(Feedback::kAbsent);
  for (size_t i = 0; i < kWordLength; ++i) {
    char c = guess[i];
    if (secret.IsAtPosition(c, i)) {
      slots[i] = Feedback::kMatched;
    } else if (secret.Contains(c)) {
      slots[i] = Feedback::kPresent;
    }
  }
  return FeedbackSequence(slots);
}

FeedbackSequence GuessEvaluator::EvaluateCounted(
    const SecretWord& secret,
    std::string_view guess) const {
  // Unclaimed occurrences per letter, filled in on first sight.
  std::unordered_map<char, size_t> unclaimed;
  unclaimed.reserve(secret.DistinctLetters());
  auto remaining = [&](char c) -> size_t& {
    auto it = unclaimed.find(c);
    if (it == unclaimed.end()) {
      it = unclaimed.emplace(c, secret.Occurrences(c)).first;
    }
    return it->second;
  };

  FeedbackSequence::Slots slots;
  slots.fill(Feedback::kAbsent);

  // Exact hits claim their occurrence before any Present mark is handed out.
  for (size_t i = 0; i < kWordLength; ++i) {
    if (secret.IsAtPosition(guess[i], i)) {
      slots[i] = Feedback::kMatched;
      --remaining(guess[i]);
    }
  }

  for (size_t i = 0; i < kWordLength; ++i) {
    if (slots[i] == Feedback::kMatched) {
      continue;
    }
    size_t& left = remaining(guess[i]);
    if (left > 0) {
      slots[i] = Feedback::kPresent;
      --left;
    }
  }
  return FeedbackSequence(slots);
}

}  // namespace quintet
