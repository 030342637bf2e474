#include "Game.hpp"

#include <algorithm>

namespace quintet {

GameSession::GameSession(SecretWord secret,
                         size_t max_attempts,
                         GuessEvaluator evaluator)
    : secret_(std::move(secret)),
      evaluator_(evaluator),
      max_attempts_(max_attempts) {
  if (max_attempts_ == 0) {
    state_ = GameState::kLost;
  }
  history_.reserve(std::min(max_attempts_, kDefaultAttempts));
}

GuessOutcome GameSession::Submit(std::string_view guess,
                                 FeedbackSequence* feedback_out,
                                 InvalidWordLength* error_out) {
  if (state_ != GameState::kPlaying) {
    return GuessOutcome::kFinished;
  }
  std::optional<FeedbackSequence> scored =
      evaluator_.Evaluate(secret_, guess, error_out);
  if (!scored) {
    return GuessOutcome::kRejected;
  }
  const FeedbackSequence& feedback = *scored;
  ++attempts_used_;
  history_.push_back(Turn{std::string(guess), feedback});
  if (feedback_out) {
    *feedback_out = feedback;
  }

  if (feedback.FullMatch()) {
    state_ = GameState::kWon;
    return GuessOutcome::kWon;
  }
  if (attempts_used_ >= max_attempts_) {
    state_ = GameState::kLost;
    return GuessOutcome::kLost;
  }
  return GuessOutcome::kContinue;
}

}  // namespace quintet
