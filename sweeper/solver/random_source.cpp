#include "sweeper/solver/random_source.h"

#include <cassert>
#include <random>

namespace sweeper {
namespace solver {

namespace {

class EngineRandomSource : public RandomSource {
 public:
  explicit EngineRandomSource(unsigned seed) { engine_.seed(seed); }

  ~EngineRandomSource() final = default;

  std::size_t Uniform(std::size_t bound) final {
    assert(bound > 0);
    std::uniform_int_distribution<std::size_t> d(0, bound - 1);
    return d(engine_);
  }

 private:
  std::default_random_engine engine_;
};

}  // namespace

std::unique_ptr<RandomSource> NewRandomSource(unsigned seed) {
  return std::make_unique<EngineRandomSource>(seed);
}

}  // namespace solver
}  // namespace sweeper
