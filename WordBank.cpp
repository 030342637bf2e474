#include "Game.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <unordered_set>

namespace quintet {

bool WordBank::LoadFile(const std::string& path) {
  std::ifstream infile(path);
  if (!infile) {
    return false;
  }
  std::vector<std::string> words;
  std::string line;
  while (std::getline(infile, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    words.push_back(line);
  }
  SetWordList(words);
  return !words_.empty();
}

void WordBank::SetWordList(const std::vector<std::string>& words) {
  words_.clear();
  skipped_ = 0;
  words_.reserve(words.size());

  std::unordered_set<std::string> seen;
  for (const auto& word : words) {
    std::string normalized = NormalizeWord(word);
    if (!IsValidWord(normalized)) {
      ++skipped_;
      continue;
    }
    if (!seen.insert(normalized).second) {
      continue;
    }
    words_.push_back(std::move(normalized));
  }
}

std::string WordBank::Generate() {
  if (words_.empty()) {
    return {};
  }
  std::uniform_int_distribution<size_t> pick(0, words_.size() - 1);
  return words_[pick(rng_)];
}

bool WordBank::IsValidWord(std::string_view word) {
  return word.size() == kWordLength &&
         std::all_of(word.begin(), word.end(),
                     [](char c) { return c >= 'a' && c <= 'z'; });
}

std::string WordBank::NormalizeWord(std::string_view word) {
  std::string letters;
  letters.reserve(word.size());
  std::copy_if(word.begin(), word.end(), std::back_inserter(letters),
               [](char c) {
                 return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
               });
  return ToLowerAscii(letters);
}

std::vector<std::string> WordBank::BuiltinWords() {
  return {
      "about", "actor", "adore", "alarm", "alien", "angle", "apple", "arena",
      "badge", "bathe", "beach", "berry", "blaze", "bloom", "brave", "brick",
      "cabin", "candy", "chalk", "charm", "chess", "cider", "cloud", "crane",
      "dance", "delta", "diner", "dough", "dream", "eagle", "earth", "ember",
      "fable", "feast", "field", "flame", "frost", "giant", "glove", "grape",
      "haven", "honey", "house", "ivory", "jelly", "jolly", "knife", "lemon",
      "light", "maple", "medal", "mango", "night", "ocean", "olive", "opera",
      "pearl", "piano", "plant", "quilt", "raven", "river", "robin", "salad",
      "shore", "smile", "spice", "storm", "sugar", "table", "tiger", "toast",
      "umbra", "vapor", "whale", "wheat", "yacht", "youth", "zebra",
  };
}

}  // namespace quintet
