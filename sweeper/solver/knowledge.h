#ifndef SWEEPER_SOLVER_KNOWLEDGE_H_
#define SWEEPER_SOLVER_KNOWLEDGE_H_

#include <memory>

#include "sweeper/game/game.h"
#include "sweeper/solver/random_source.h"
#include "sweeper/solver/solver.h"

namespace sweeper {
namespace solver {
namespace knowledge {

struct Options {
  // Guess a random cell when no cell is known to be safe.
  bool guess = true;
};

// Provides a solver that plays from a KnowledgeBase fed by the game's UNCOVER
// events.
//
// Each round of analysis produces:
//  - A FLAG action for every cell known to be a mine that is not flagged.
//  - An UNCOVER action for one cell known to be safe, if there is one.
//  - Otherwise, if guessing is enabled, an UNCOVER action for a random cell
//    that is neither uncovered nor known to be a mine.
//
// This solver will be automatically subscribed to the provided game.
std::unique_ptr<Solver> New(Game& game, const Options& options,
                            std::unique_ptr<RandomSource> random);

}  // namespace knowledge
}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_KNOWLEDGE_H_
