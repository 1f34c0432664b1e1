#include "sweeper/game/difficulty.h"

#include <cctype>

namespace sweeper {

const Difficulty kBeginnerDifficulty = {9, 9, 10};
const Difficulty kIntermediateDifficulty = {16, 16, 40};
const Difficulty kExpertDifficulty = {16, 30, 99};
const Difficulty kDefaultDifficulty = {8, 8, 8};

namespace {

// The largest board dimension accepted for a custom difficulty.
constexpr std::size_t kMaxDimension = 1000;

// Parses an unsigned decimal number from the front of str, starting at pos.
//
// Returns false if there are no digits at pos or the value is too large.
bool ParseNumber(const std::string& str, std::size_t& pos,
                 std::size_t* value) {
  const std::size_t start = pos;
  std::size_t v = 0;
  while (pos < str.size() &&
         std::isdigit(static_cast<unsigned char>(str[pos]))) {
    v = v * 10 + static_cast<std::size_t>(str[pos] - '0');
    if (v > kMaxDimension * kMaxDimension) {
      return false;
    }
    ++pos;
  }
  *value = v;
  return pos != start;
}

// Parses ROWSxCOLSxMINES.
bool ParseCustom(const std::string& name, Difficulty* difficulty) {
  Difficulty d;
  std::size_t pos = 0;
  if (!ParseNumber(name, pos, &d.rows) || pos >= name.size() ||
      name[pos++] != 'x') {
    return false;
  }
  if (!ParseNumber(name, pos, &d.cols) || pos >= name.size() ||
      name[pos++] != 'x') {
    return false;
  }
  if (!ParseNumber(name, pos, &d.mines) || pos != name.size()) {
    return false;
  }

  // There must be at least one cell that is not a mine.
  if (d.rows == 0 || d.cols == 0 || d.rows > kMaxDimension ||
      d.cols > kMaxDimension || d.mines >= d.rows * d.cols) {
    return false;
  }
  *difficulty = d;
  return true;
}

}  // namespace

bool ParseDifficulty(const std::string& name, Difficulty* difficulty) {
  if (name == "beginner") {
    *difficulty = kBeginnerDifficulty;
  } else if (name == "intermediate") {
    *difficulty = kIntermediateDifficulty;
  } else if (name == "expert") {
    *difficulty = kExpertDifficulty;
  } else if (name == "default") {
    *difficulty = kDefaultDifficulty;
  } else {
    return ParseCustom(name, difficulty);
  }
  return true;
}

}  // namespace sweeper
