#ifndef SWEEPER_SOLVER_SOLVER_H_
#define SWEEPER_SOLVER_SOLVER_H_

#include <memory>
#include <vector>

#include "sweeper/game/game.h"

namespace sweeper {
namespace solver {

class KnowledgeBase;

// Solving algorithms.
enum class Algorithm {
  // Deduce safe cells and mines from the knowledge base, and guess a random
  // cell when nothing can be deduced.
  KNOWLEDGE,

  // Deduce like KNOWLEDGE, but never guess. The player makes every guess.
  ASSISTED,
};

class Solver : public EventSubscriber {
 public:
  virtual ~Solver() = default;

  // Recommends actions based on the Solver's current knowledge of the game.
  //
  // The Solver is NOT required to produce a complete set of actions, nor is it
  // required to be idempotent.
  //
  // The Solver must return an empty vector to indicate that no progress can be
  // made.
  virtual std::vector<Action> Analyze() = 0;

  // Returns what the Solver has learned about the game so far.
  virtual const KnowledgeBase& GetKnowledgeBase() const = 0;
};

// Creates a new solver for the specified algorithm.
//
// This solver will be automatically subscribed to the provided game. The seed
// drives any random guesses the solver makes.
std::unique_ptr<Solver> New(Algorithm alg, Game& game, unsigned seed);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_SOLVER_H_
