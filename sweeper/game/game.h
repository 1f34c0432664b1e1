#ifndef SWEEPER_GAME_GAME_H_
#define SWEEPER_GAME_GAME_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "sweeper/game/cell.h"
#include "sweeper/game/difficulty.h"
#include "sweeper/game/dimensions.h"
#include "sweeper/game/event.h"

namespace sweeper {

// The board an agent plays against.
//
// The board keeps the mine layout to itself. All a player learns comes
// through events: uncovering a safe cell answers with the number of mines
// around it, and the game ends on the first mine uncovered or once every safe
// cell is open. Flags are for the player's benefit only; they keep a cell from
// being uncovered and play no part in winning.
class Game {
 public:
  enum class State {
    // Nothing has happened yet.
    NEW,
    PLAYING,
    WIN,
    LOSS,
  };

  virtual ~Game() = default;

  // Carries out the action and passes every resulting event to every
  // subscriber.
  //
  // Nothing happens for a cell off the board, once the game is over,
  // when uncovering a flagged or open cell, or when flagging an open cell.
  virtual void Execute(const Action& action) = 0;

  // Carries out the actions in order.
  void Execute(const std::vector<Action>& actions) {
    for (const Action& action : actions) {
      Execute(action);
    }
  }

  // The subscriber must outlive every later call to Execute.
  virtual void Subscribe(EventSubscriber* subscriber) = 0;

  virtual const Dimensions& GetDimensions() const = 0;

  virtual std::size_t GetMineCount() const = 0;

  virtual State GetState() const = 0;

  bool IsGameOver() const {
    return GetState() == State::WIN || GetState() == State::LOSS;
  }
};

// Lays out difficulty.mines mines at random, seeded by seed.
//
// If the first cell uncovered would be a mine, that mine is moved elsewhere
// first, so a game never ends on its first move.
//
// Returns nullptr if the board has no cells or no room for a safe cell.
std::unique_ptr<Game> NewGame(const Difficulty& difficulty, unsigned seed);

// Lays out mines at exactly the given cells, listed cells counting once.
// There is no first move protection.
//
// Returns nullptr if the board has no cells, a listed cell is off the board,
// or no cell is left safe.
std::unique_ptr<Game> NewGameWithMines(const Dimensions& dim,
                                       const std::vector<Cell>& mines);

}  // namespace sweeper

#endif  // SWEEPER_GAME_GAME_H_
