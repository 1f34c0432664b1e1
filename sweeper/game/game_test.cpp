#include "sweeper/game/game.h"

#include <cstddef>
#include <memory>
#include <vector>

#include <catch2/catch.hpp>

using sweeper::Action;
using sweeper::Cell;
using sweeper::CellState;
using sweeper::Difficulty;
using sweeper::Dimensions;
using sweeper::Event;
using sweeper::EventSubscriber;
using sweeper::Game;

namespace {

// Records every event it is notified of.
class EventRecorder : public EventSubscriber {
 public:
  void NotifyEvent(const Event& event) final { events.push_back(event); }

  std::size_t Count(Event::Type type) const {
    std::size_t count = 0;
    for (const Event& event : events) {
      if (event.type == type) {
        ++count;
      }
    }
    return count;
  }

  std::size_t CountRevealed(CellState revealed) const {
    std::size_t count = 0;
    for (const Event& event : events) {
      if (event.type == Event::Type::REVEAL && event.revealed == revealed) {
        ++count;
      }
    }
    return count;
  }

  std::vector<Event> events;
};

Action Uncover(std::size_t row, std::size_t col) {
  return Action{Action::Type::UNCOVER, Cell{row, col}};
}

Action Flag(std::size_t row, std::size_t col) {
  return Action{Action::Type::FLAG, Cell{row, col}};
}

}  // namespace

TEST_CASE("game creation", "[game]") {
  SECTION("random boards need a safe cell") {
    REQUIRE(sweeper::NewGame(Difficulty{0, 5, 0}, 1) == nullptr);
    REQUIRE(sweeper::NewGame(Difficulty{5, 0, 0}, 1) == nullptr);
    REQUIRE(sweeper::NewGame(Difficulty{2, 2, 4}, 1) == nullptr);

    std::unique_ptr<Game> game = sweeper::NewGame(Difficulty{9, 9, 10}, 1);
    REQUIRE(game != nullptr);
    REQUIRE(game->GetDimensions().rows == 9);
    REQUIRE(game->GetDimensions().cols == 9);
    REQUIRE(game->GetMineCount() == 10);
    REQUIRE(game->GetState() == Game::State::NEW);
  }

  SECTION("fixed boards") {
    REQUIRE(sweeper::NewGameWithMines(Dimensions{0, 2}, {}) == nullptr);
    REQUIRE(sweeper::NewGameWithMines(Dimensions{2, 2}, {Cell{2, 0}}) ==
            nullptr);
    REQUIRE(sweeper::NewGameWithMines(Dimensions{1, 2},
                                      {Cell{0, 0}, Cell{0, 1}}) == nullptr);

    std::unique_ptr<Game> game =
        sweeper::NewGameWithMines(Dimensions{2, 2}, {Cell{0, 0}, Cell{0, 0}});
    REQUIRE(game != nullptr);
    REQUIRE(game->GetMineCount() == 1);
  }
}

TEST_CASE("game uncovering", "[game]") {
  // . . . .
  // . . . .
  // . . . *
  std::unique_ptr<Game> game =
      sweeper::NewGameWithMines(Dimensions{3, 4}, {Cell{2, 3}});
  REQUIRE(game != nullptr);
  EventRecorder recorder;
  game->Subscribe(&recorder);

  SECTION("a numbered cell uncovers only itself") {
    game->Execute(Uncover(1, 2));
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].type == Event::Type::UNCOVER);
    REQUIRE(recorder.events[0].cell == Cell{1, 2});
    REQUIRE(recorder.events[0].adjacent_mines == 1);
    REQUIRE(game->GetState() == Game::State::PLAYING);

    // Uncovering it again does nothing.
    game->Execute(Uncover(1, 2));
    REQUIRE(recorder.events.size() == 1);
  }

  SECTION("an empty cell opens its neighborhood and can win") {
    game->Execute(Uncover(0, 0));
    REQUIRE(recorder.Count(Event::Type::UNCOVER) == 11);
    REQUIRE(recorder.events.back().type == Event::Type::WIN);
    REQUIRE(game->GetState() == Game::State::WIN);
    REQUIRE(game->IsGameOver());

    // Actions after the game is over are ignored.
    const std::size_t count = recorder.events.size();
    game->Execute(Flag(2, 3));
    REQUIRE(recorder.events.size() == count);
  }

  SECTION("uncovering a mine loses") {
    game->Execute(Flag(0, 0));
    game->Execute(Uncover(2, 3));

    REQUIRE(game->GetState() == Game::State::LOSS);
    REQUIRE(recorder.Count(Event::Type::REVEAL) == 1);
    REQUIRE(recorder.CountRevealed(CellState::BAD_FLAG) == 1);
    REQUIRE(recorder.events[1].cell == Cell{0, 0});
    REQUIRE(recorder.events.back().type == Event::Type::LOSS);
    REQUIRE(recorder.events.back().cell == Cell{2, 3});
  }

  SECTION("cells off the board are ignored") {
    game->Execute(Uncover(3, 0));
    game->Execute(Flag(0, 4));
    REQUIRE(recorder.events.empty());
    REQUIRE(game->GetState() == Game::State::NEW);
  }
}

TEST_CASE("game flagging", "[game]") {
  std::unique_ptr<Game> game =
      sweeper::NewGameWithMines(Dimensions{2, 2}, {Cell{0, 0}});
  REQUIRE(game != nullptr);
  EventRecorder recorder;
  game->Subscribe(&recorder);

  game->Execute(Flag(1, 1));
  REQUIRE(recorder.events.back().type == Event::Type::FLAG);

  // Flagged cells cannot be uncovered.
  game->Execute(Uncover(1, 1));
  REQUIRE(recorder.events.size() == 1);

  game->Execute(Flag(1, 1));
  REQUIRE(recorder.events.back().type == Event::Type::UNFLAG);

  game->Execute(Uncover(1, 1));
  REQUIRE(recorder.events.back().type == Event::Type::UNCOVER);

  // Uncovered cells cannot be flagged.
  game->Execute(Flag(1, 1));
  REQUIRE(recorder.events.size() == 3);
}

TEST_CASE("game loss reveals unflagged mines", "[game]") {
  std::unique_ptr<Game> game =
      sweeper::NewGameWithMines(Dimensions{1, 4},
                                {Cell{0, 0}, Cell{0, 1}, Cell{0, 3}});
  REQUIRE(game != nullptr);
  EventRecorder recorder;
  game->Subscribe(&recorder);

  game->Execute(Flag(0, 1));
  game->Execute(Uncover(0, 3));

  // Only (0, 0) is news: (0, 1) was flagged and (0, 3) is the losing mine.
  REQUIRE(recorder.Count(Event::Type::REVEAL) == 1);
  REQUIRE(recorder.CountRevealed(CellState::MINE) == 1);
  REQUIRE(recorder.events[1].cell == Cell{0, 0});
  REQUIRE(recorder.events.back().type == Event::Type::LOSS);
  REQUIRE(recorder.events.back().revealed == CellState::COVERED);
}

TEST_CASE("uncover reports mines among in-bounds neighbors", "[game]") {
  // * * *
  // * . *
  // * * .
  std::unique_ptr<Game> game = sweeper::NewGameWithMines(
      Dimensions{3, 3}, {Cell{0, 0}, Cell{0, 1}, Cell{0, 2}, Cell{1, 0},
                         Cell{1, 2}, Cell{2, 0}, Cell{2, 1}});
  REQUIRE(game != nullptr);
  REQUIRE(game->GetMineCount() == 7);
  EventRecorder recorder;
  game->Subscribe(&recorder);

  // The corner has three neighbors on the board, two of them mines.
  game->Execute(Uncover(2, 2));
  REQUIRE(recorder.events.size() == 1);
  REQUIRE(recorder.events[0].adjacent_mines == 2);

  // Seven of the center's eight neighbors are mines.
  game->Execute(Uncover(1, 1));
  REQUIRE(recorder.events[1].type == Event::Type::UNCOVER);
  REQUIRE(recorder.events[1].adjacent_mines == 7);
  REQUIRE(recorder.events.back().type == Event::Type::WIN);
}

TEST_CASE("first move is never a mine", "[game]") {
  // Every cell but one is a mine, so the first move always wins.
  for (unsigned seed = 0; seed < 20; ++seed) {
    for (std::size_t row = 0; row < 3; ++row) {
      for (std::size_t col = 0; col < 3; ++col) {
        CAPTURE(seed, row, col);
        std::unique_ptr<Game> game =
            sweeper::NewGame(Difficulty{3, 3, 8}, seed);
        REQUIRE(game != nullptr);
        game->Execute(Uncover(row, col));
        REQUIRE(game->GetState() == Game::State::WIN);
        REQUIRE(game->GetMineCount() == 8);
      }
    }
  }
}
