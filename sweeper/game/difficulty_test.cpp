#include "sweeper/game/difficulty.h"

#include <catch2/catch.hpp>

using sweeper::Difficulty;
using sweeper::ParseDifficulty;

namespace {

bool Same(const Difficulty& a, const Difficulty& b) {
  return a.rows == b.rows && a.cols == b.cols && a.mines == b.mines;
}

}  // namespace

TEST_CASE("difficulty names", "[difficulty]") {
  Difficulty d{0, 0, 0};

  REQUIRE(ParseDifficulty("beginner", &d));
  REQUIRE(Same(d, Difficulty{9, 9, 10}));
  REQUIRE(ParseDifficulty("intermediate", &d));
  REQUIRE(Same(d, Difficulty{16, 16, 40}));
  REQUIRE(ParseDifficulty("expert", &d));
  REQUIRE(Same(d, Difficulty{16, 30, 99}));
  REQUIRE(ParseDifficulty("default", &d));
  REQUIRE(Same(d, Difficulty{8, 8, 8}));
}

TEST_CASE("custom difficulty", "[difficulty]") {
  Difficulty d{0, 0, 0};

  SECTION("accepted") {
    REQUIRE(ParseDifficulty("8x8x8", &d));
    REQUIRE(Same(d, Difficulty{8, 8, 8}));
    REQUIRE(ParseDifficulty("1x2x1", &d));
    REQUIRE(Same(d, Difficulty{1, 2, 1}));
  }

  SECTION("rejected") {
    for (const char* name :
         {"", "hard", "8x8", "8x8x", "8x8x8x", "axbxc", "0x5x1", "5x0x1",
          "3x3x9", "1001x1x0", "-1x5x1"}) {
      CAPTURE(name);
      REQUIRE_FALSE(ParseDifficulty(name, &d));
    }
    REQUIRE(Same(d, Difficulty{0, 0, 0}));
  }
}
