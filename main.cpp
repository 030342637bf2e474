#include "Game.hpp"

#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <utility>

namespace {
struct Config {
  std::string words_path;
  std::string secret;
  size_t max_attempts = quintet::kDefaultAttempts;
  bool has_seed = false;
  uint32_t seed = 0;
  bool strict_duplicates = false;
  bool color = true;
  bool verbose = false;
};

void PrintUsage(const char* argv0) {
  std::cout
      << "Quintet: guess the five-letter word\n"
      << "Usage:\n"
      << "  " << argv0 << " [--words WORDS.txt] [--max-attempts 6]\n"
      << "  " << argv0 << " --secret CRANE\n"
      << "Options:\n"
      << "  --words PATH           Word list (one word per line)\n"
      << "  --secret WORD          Play against a fixed secret word\n"
      << "  --max-attempts N       Guesses allowed (default 6)\n"
      << "  --seed N               Seed for secret word selection\n"
      << "  --strict-duplicates    Cap yellow letters by occurrence count\n"
      << "  --no-color             Print 0/1/2 patterns instead of colors\n"
      << "  --verbose              Print diagnostics to stderr\n"
      << "  --help                 Show this help\n";
}

void PrintInteractiveHelp() {
  std::cout
      << "Commands:\n"
      << "  WORD         Guess a five-letter word\n"
      << "  help or ?    Show this help\n"
      << "  quit or exit Give up and reveal the word\n"
      << "Green: right letter, right spot. Yellow: letter is elsewhere.\n";
}

void PrintFeedback(const std::string& guess,
                   const quintet::FeedbackSequence& feedback,
                   bool color) {
  std::string display = quintet::ToUpperAscii(guess);
  if (!color) {
    std::cout << display << " " << feedback.PatternString() << "\n";
    return;
  }
  const char* reset = "\x1b[0m";
  for (size_t i = 0; i < feedback.size() && i < display.size(); ++i) {
    switch (feedback.at(i)) {
      case quintet::Feedback::kMatched:
        std::cout << "\x1b[1;32m" << display[i] << reset;
        break;
      case quintet::Feedback::kPresent:
        std::cout << "\x1b[1;33m" << display[i] << reset;
        break;
      case quintet::Feedback::kAbsent:
        std::cout << display[i];
        break;
    }
    std::cout << (i + 1 < feedback.size() ? " " : "\n");
  }
}

void PrintLost(const quintet::SecretWord& secret, bool color) {
  if (color) {
    std::cout << "\x1b[31mYou lost :(\x1b[0m";
  } else {
    std::cout << "You lost :(";
  }
  std::cout << " The word was '" << secret.Reveal() << "'\n";
}

void PrintWon(size_t attempts, bool color) {
  if (color) {
    std::cout << "\x1b[32mYou won!\x1b[0m";
  } else {
    std::cout << "You won!";
  }
  std::cout << " You needed " << attempts
            << (attempts == 1 ? " attempt" : " attempts") << "\n";
}

int RunGame(quintet::GameSession* session, bool color) {
  std::cout << "Type '?' for help.\n";
  std::cout << "_ _ _ _ _\n";
  std::string line;
  while (session->state() == quintet::GameState::kPlaying) {
    if (!std::getline(std::cin, line)) {
      std::cout << "Game abandoned. The word was '"
                << session->secret().Reveal() << "'\n";
      return 0;
    }
    std::string guess = quintet::ToLowerAscii(quintet::TrimWhitespace(line));
    if (guess == "?" || guess == "help") {
      PrintInteractiveHelp();
      continue;
    }
    if (guess == "quit" || guess == "exit") {
      std::cout << "Giving up. The word was '" << session->secret().Reveal()
                << "'\n";
      return 0;
    }

    quintet::FeedbackSequence feedback =
        quintet::FeedbackSequence(quintet::FeedbackSequence::Slots{});
    quintet::InvalidWordLength error;
    switch (session->Submit(guess, &feedback, &error)) {
      case quintet::GuessOutcome::kRejected:
        std::cout << "You'll need " << quintet::kWordLength
                  << " characters to make it work! (" << error.Message()
                  << ")\n";
        break;
      case quintet::GuessOutcome::kContinue:
        PrintFeedback(guess, feedback, color);
        std::cout << "Attempts left: " << session->attempts_left() << "\n";
        break;
      case quintet::GuessOutcome::kWon:
        PrintFeedback(guess, feedback, color);
        PrintWon(session->attempts_used(), color);
        break;
      case quintet::GuessOutcome::kLost:
        PrintFeedback(guess, feedback, color);
        PrintLost(session->secret(), color);
        break;
      case quintet::GuessOutcome::kFinished:
        break;
    }
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--words" && i + 1 < argc) {
      config.words_path = argv[++i];
    } else if (arg == "--secret" && i + 1 < argc) {
      config.secret = quintet::ToLowerAscii(argv[++i]);
    } else if (arg == "--max-attempts" && i + 1 < argc) {
      uint64_t value = 0;
      if (!quintet::ParseCount(argv[++i], quintet::kMaxAttempts, &value) ||
          value == 0) {
        std::cerr << "--max-attempts expects a number from 1 to "
                  << quintet::kMaxAttempts << ", got " << argv[i] << "\n";
        return 1;
      }
      config.max_attempts = static_cast<size_t>(value);
    } else if (arg == "--seed" && i + 1 < argc) {
      uint64_t value = 0;
      if (!quintet::ParseCount(argv[++i],
                               std::numeric_limits<uint32_t>::max(), &value)) {
        std::cerr << "--seed expects a number from 0 to "
                  << std::numeric_limits<uint32_t>::max() << ", got "
                  << argv[i] << "\n";
        return 1;
      }
      config.seed = static_cast<uint32_t>(value);
      config.has_seed = true;
    } else if (arg == "--strict-duplicates") {
      config.strict_duplicates = true;
    } else if (arg == "--no-color") {
      config.color = false;
    } else if (arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }

  if (!config.secret.empty() && !config.words_path.empty()) {
    std::cerr << "Choose either --secret or --words.\n";
    return 1;
  }

  if (!config.has_seed) {
    std::random_device device;
    config.seed = device();
  }

  std::unique_ptr<quintet::WordSource> source;
  if (!config.secret.empty()) {
    source = std::make_unique<quintet::FixedWordSource>(config.secret);
  } else {
    auto bank = std::make_unique<quintet::WordBank>(config.seed);
    if (config.words_path.empty()) {
      bank->SetWordList(quintet::WordBank::BuiltinWords());
    } else if (!bank->LoadFile(config.words_path)) {
      std::cerr << "Failed to load word list: " << config.words_path << "\n";
      return 1;
    }
    if (config.verbose) {
      std::cerr << "[quintet] word list: " << bank->words().size()
                << " words, " << bank->skipped() << " skipped, seed "
                << config.seed << "\n";
    }
    source = std::move(bank);
  }

  quintet::InvalidWordLength error;
  std::optional<quintet::SecretWord> secret =
      quintet::SecretWord::Construct(source->Generate(), &error);
  if (!secret) {
    std::cerr << "Invalid secret word: " << error.Message() << "\n";
    return 1;
  }

  const quintet::ScoringMode mode =
      config.strict_duplicates ? quintet::ScoringMode::kOccurrenceCounted
                               : quintet::ScoringMode::kLetterPresence;
  if (config.verbose) {
    std::cerr << "[quintet] scoring: "
              << (config.strict_duplicates ? "occurrence-counted"
                                           : "letter-presence")
              << ", attempts: " << config.max_attempts << "\n";
  }

  std::cout << "Welcome to Quintet!\n";
  quintet::GameSession session(std::move(*secret), config.max_attempts,
                               quintet::GuessEvaluator(mode));
  return RunGame(&session, config.color);
}
