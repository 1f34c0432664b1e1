#ifndef SWEEPER_UI_TEXT_UI_H_
#define SWEEPER_UI_TEXT_UI_H_

#include <iosfwd>
#include <memory>

#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace ui {

// A text user interface based on iostreams.
class TextUi {
 public:
  virtual ~TextUi() = default;

  // Plays the game until it is over or the player quits.
  //
  // Before each turn the solver is queried, and any actions it recommends are
  // executed. If the solver does not recommend any actions, the player is
  // prompted for an action.
  //
  // The UI subscribes to the game for the duration of the call; the game must
  // not execute actions after Play returns.
  //
  // Returns true if the game was won.
  virtual bool Play(Game& game, solver::Solver& solver) = 0;
};

// Returns a new text user interface for the given iostreams.
std::unique_ptr<TextUi> NewTextUi(std::istream& in, std::ostream& out);

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_TEXT_UI_H_
