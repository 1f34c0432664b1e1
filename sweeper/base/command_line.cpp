#include "sweeper/base/command_line.h"

#include <cctype>
#include <limits>
#include <ostream>
#include <string>

namespace sweeper {
namespace base {

namespace {

// Parses a non-negative decimal seed that fits in an unsigned int.
bool ParseSeed(const std::string& str, unsigned* seed) {
  if (str.empty()) {
    return false;
  }
  unsigned long long value = 0;
  for (char c : str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
    if (value > std::numeric_limits<unsigned>::max()) {
      return false;
    }
  }
  *seed = static_cast<unsigned>(value);
  return true;
}

}  // namespace

bool ParseCommandLine(int argc, const char* const argv[],
                      CommandLine* command_line) {
  if (argc > 3) {
    return false;
  }
  CommandLine result = *command_line;
  if (argc > 1 && !ParseDifficulty(argv[1], &result.difficulty)) {
    return false;
  }
  if (argc > 2 && !ParseSeed(argv[2], &result.seed)) {
    return false;
  }
  *command_line = result;
  return true;
}

void PrintUsage(std::ostream& out, const char* program) {
  out << "Usage: " << program
      << " [beginner|intermediate|expert|default|ROWSxCOLSxMINES] [seed]\n";
}

}  // namespace base
}  // namespace sweeper
