// Main program to play with a text user interface.
//
// Uses a solver that makes every move it can prove, and leaves the guesses to
// the player.

#include <ctime>
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "sweeper/base/command_line.h"
#include "sweeper/base/logging.h"
#include "sweeper/game/difficulty.h"
#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"
#include "sweeper/ui/text_ui.h"

int main(int argc, char* argv[]) {
  sweeper::base::InitLogging("sweeper_assisted_tui");

  sweeper::base::CommandLine command_line{
      sweeper::kBeginnerDifficulty, static_cast<unsigned>(std::time(nullptr))};
  if (!sweeper::base::ParseCommandLine(argc, argv, &command_line)) {
    sweeper::base::PrintUsage(std::cerr, argv[0]);
    return 1;
  }

  const sweeper::Difficulty& d = command_line.difficulty;
  spdlog::info("New assisted {}x{} game with {} mines, seed {}", d.rows,
               d.cols, d.mines, command_line.seed);

  auto game = sweeper::NewGame(d, command_line.seed);
  if (!game) {
    spdlog::error("Cannot create a {}x{} game with {} mines", d.rows, d.cols,
                  d.mines);
    return 1;
  }
  auto solver = sweeper::solver::New(sweeper::solver::Algorithm::ASSISTED,
                                     *game, command_line.seed);
  auto ui = sweeper::ui::NewTextUi(std::cin, std::cout);

  ui->Play(*game, *solver);

  return 0;
}
