#include "sweeper/ui/text_ui.h"

#include <memory>
#include <sstream>
#include <string>

#include <catch2/catch.hpp>

using sweeper::Cell;
using sweeper::Dimensions;
using sweeper::Game;
using sweeper::solver::Algorithm;
using sweeper::solver::Solver;

namespace {

bool Contains(const std::string& str, const std::string& part) {
  return str.find(part) != std::string::npos;
}

}  // namespace

TEST_CASE("text ui", "[text_ui]") {
  // * . *
  // . . .
  // . . .
  std::unique_ptr<Game> game =
      sweeper::NewGameWithMines(Dimensions{3, 3}, {Cell{0, 0}, Cell{0, 2}});
  REQUIRE(game != nullptr);
  std::unique_ptr<Solver> solver =
      sweeper::solver::New(Algorithm::ASSISTED, *game, 1);

  std::istringstream in;
  std::ostringstream out;

  SECTION("the solver finishes what the player starts") {
    in.str("x\nu 2 0\n");
    REQUIRE(sweeper::ui::NewTextUi(in, out)->Play(*game, *solver));

    const std::string output = out.str();
    CAPTURE(output);
    REQUIRE(Contains(output,
                     "- - - \n- - - \n- - - \n\n"
                     "Known mines: 0  Known safe: 0  Sentences: 0\n"
                     "Command: Invalid command.\nCommand: "));
    REQUIRE(Contains(output, "- - - \n1 2 1 \n0 0 0 \n\n"
                             "Known mines: 2  Known safe: 7  Sentences: 0\n"
                             "Solver: flag 0 0\n"
                             "Solver: flag 0 2\n"
                             "Solver: uncover 0 1\n"));
    REQUIRE(Contains(output, "F 2 F \n1 2 1 \n0 0 0 \n\nYou win!\n\n"));
    REQUIRE(game->GetState() == Game::State::WIN);
  }

  SECTION("the player quits") {
    in.str("q\n");
    REQUIRE_FALSE(sweeper::ui::NewTextUi(in, out)->Play(*game, *solver));
    REQUIRE(Contains(out.str(), "Quit.\n"));
    REQUIRE(game->GetState() == Game::State::NEW);
  }

  SECTION("the input ends") {
    REQUIRE_FALSE(sweeper::ui::NewTextUi(in, out)->Play(*game, *solver));
    REQUIRE(Contains(out.str(), "Quit.\n"));
  }

  SECTION("the player uncovers a mine") {
    in.str("f 1 1\nu 0 2\n");
    REQUIRE_FALSE(sweeper::ui::NewTextUi(in, out)->Play(*game, *solver));

    const std::string output = out.str();
    CAPTURE(output);
    REQUIRE(Contains(output, "* - X \n- ! - \n- - - \n\nYou lose.\n\n"));
    REQUIRE(game->GetState() == Game::State::LOSS);
  }
}
