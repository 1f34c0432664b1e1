#ifndef SWEEPER_SOLVER_RANDOM_SOURCE_H_
#define SWEEPER_SOLVER_RANDOM_SOURCE_H_

#include <cstddef>
#include <memory>

namespace sweeper {
namespace solver {

// A source of random numbers for guessing.
//
// Solvers draw through this interface rather than from a global generator so
// that a recorded sequence of draws reproduces a game exactly.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Returns a uniformly distributed integer in [0, bound).
  //
  // The bound must be greater than zero.
  virtual std::size_t Uniform(std::size_t bound) = 0;
};

// Returns a new RandomSource backed by a PRNG with the given seed.
std::unique_ptr<RandomSource> NewRandomSource(unsigned seed);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_RANDOM_SOURCE_H_
