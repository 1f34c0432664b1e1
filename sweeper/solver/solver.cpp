#include "sweeper/solver/solver.h"

#include "sweeper/solver/knowledge.h"
#include "sweeper/solver/random_source.h"

namespace sweeper {
namespace solver {

std::unique_ptr<Solver> New(Algorithm alg, Game& game, unsigned seed) {
  knowledge::Options options;
  switch (alg) {
    case Algorithm::KNOWLEDGE:
      options.guess = true;
      break;
    case Algorithm::ASSISTED:
      options.guess = false;
      break;
    default:
      return nullptr;
  }
  return knowledge::New(game, options, NewRandomSource(seed));
}

}  // namespace solver
}  // namespace sweeper
