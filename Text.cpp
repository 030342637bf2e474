#include "Game.hpp"

#include <cctype>
#include <limits>

namespace quintet {
namespace {

char MapAscii(char c, char from_first, char from_last, char to_first) {
  if (c >= from_first && c <= from_last) {
    return static_cast<char>(c - from_first + to_first);
  }
  return c;
}

}  // namespace

std::string ToLowerAscii(std::string_view input) {
  std::string out(input);
  for (char& c : out) {
    c = MapAscii(c, 'A', 'Z', 'a');
  }
  return out;
}

std::string ToUpperAscii(std::string_view input) {
  std::string out(input);
  for (char& c : out) {
    c = MapAscii(c, 'a', 'z', 'A');
  }
  return out;
}

std::string TrimWhitespace(std::string_view input) {
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!input.empty() && is_space(input.front())) {
    input.remove_prefix(1);
  }
  while (!input.empty() && is_space(input.back())) {
    input.remove_suffix(1);
  }
  return std::string(input);
}

bool ParseCount(std::string_view text, uint64_t max_value, uint64_t* out) {
  if (text.empty()) {
    return false;
  }
  uint64_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    const uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  if (value > max_value) {
    return false;
  }
  if (out) {
    *out = value;
  }
  return true;
}

}  // namespace quintet
