#ifndef SWEEPER_BASE_COMMAND_LINE_H_
#define SWEEPER_BASE_COMMAND_LINE_H_

#include <iosfwd>

#include "sweeper/game/difficulty.h"

namespace sweeper {
namespace base {

// The settings shared by every executable.
struct CommandLine {
  // The board to play.
  Difficulty difficulty;

  // Seed for mine placement and for the solver's guesses.
  unsigned seed;
};

// Parses the optional positional arguments [difficulty] [seed].
//
// Missing arguments keep the values already in command_line. Returns false if
// an argument is not recognized or there are too many arguments.
bool ParseCommandLine(int argc, const char* const argv[],
                      CommandLine* command_line);

// Writes a one line usage message for the program.
void PrintUsage(std::ostream& out, const char* program);

}  // namespace base
}  // namespace sweeper

#endif  // SWEEPER_BASE_COMMAND_LINE_H_
