#ifndef SWEEPER_GAME_DIFFICULTY_H_
#define SWEEPER_GAME_DIFFICULTY_H_

#include <cstddef>
#include <string>

namespace sweeper {

// The parameters for creating a new game.
struct Difficulty {
  std::size_t rows;
  std::size_t cols;
  std::size_t mines;
};

// Premade common difficulties.
extern const Difficulty kBeginnerDifficulty;
extern const Difficulty kIntermediateDifficulty;
extern const Difficulty kExpertDifficulty;

// The small board the agent plays when nothing else is requested.
extern const Difficulty kDefaultDifficulty;

// Parses a difficulty name: "beginner", "intermediate", "expert", "default",
// or a custom board written as ROWSxCOLSxMINES (e.g. "8x8x8").
//
// Returns false if the name is not recognized or describes a board that
// cannot be played.
bool ParseDifficulty(const std::string& name, Difficulty* difficulty);

}  // namespace sweeper

#endif  // SWEEPER_GAME_DIFFICULTY_H_
