// Main program to play in a window, with an "AI Move" button that lets the
// knowledge-based agent make the next move.

#include <ctime>
#include <iostream>

#include "sweeper/base/command_line.h"
#include "sweeper/base/logging.h"
#include "sweeper/game/difficulty.h"
#include "sweeper/ui/gtk_ui.h"

int main(int argc, char* argv[]) {
  sweeper::base::InitLogging("sweeper_gui");

  sweeper::base::CommandLine command_line{
      sweeper::kDefaultDifficulty, static_cast<unsigned>(std::time(nullptr))};
  if (!sweeper::base::ParseCommandLine(argc, argv, &command_line)) {
    sweeper::base::PrintUsage(std::cerr, argv[0]);
    return 1;
  }

  // The arguments were consumed above; GTK gets none of them.
  return sweeper::ui::NewGtkUi(command_line.difficulty, command_line.seed)
      ->run();
}
