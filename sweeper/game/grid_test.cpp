#include "sweeper/game/grid.h"

#include <cstddef>
#include <vector>

#include <catch2/catch.hpp>

#include "sweeper/game/dimensions.h"

using sweeper::Cell;
using sweeper::Dimensions;
using sweeper::Grid;

namespace {

std::size_t CountNeighbors(const Dimensions& dim, const Cell& cell) {
  return dim.ForEachAdjacent(cell, [](const Cell&) { return true; });
}

}  // namespace

TEST_CASE("adjacent cells", "[grid]") {
  const Dimensions dim{3, 4};

  SECTION("are clipped to the board") {
    REQUIRE(CountNeighbors(dim, Cell{0, 0}) == 3);
    REQUIRE(CountNeighbors(dim, Cell{0, 1}) == 5);
    REQUIRE(CountNeighbors(dim, Cell{1, 1}) == 8);
    REQUIRE(CountNeighbors(dim, Cell{2, 3}) == 3);
    REQUIRE(CountNeighbors(Dimensions{1, 1}, Cell{0, 0}) == 0);
  }

  SECTION("exclude the cell itself") {
    std::vector<Cell> visited;
    dim.ForEachAdjacent(Cell{0, 0}, [&visited](const Cell& cell) {
      visited.push_back(cell);
      return false;
    });
    REQUIRE(visited == std::vector<Cell>{{0, 1}, {1, 0}, {1, 1}});
  }

  SECTION("count the calls that return true") {
    const std::size_t count =
        dim.ForEachAdjacent(Cell{1, 1}, [](const Cell& cell) {
          return cell.row == 0;
        });
    REQUIRE(count == 3);
  }
}

TEST_CASE("grid values", "[grid]") {
  Grid<int> grid(2, 3);
  REQUIRE(grid.GetRows() == 2);
  REQUIRE(grid.GetCols() == 3);
  REQUIRE(grid.IsValid(Cell{1, 2}));
  REQUIRE_FALSE(grid.IsValid(Cell{2, 0}));
  REQUIRE_FALSE(grid.IsValid(Cell{0, 3}));

  grid[Cell{1, 2}] = 7;
  REQUIRE(grid[Cell{1, 2}] == 7);
  REQUIRE(grid[Cell{0, 0}] == 0);

  SECTION("visited in row-major order") {
    std::vector<Cell> cells;
    grid.ForEach([&cells](const Cell& cell, int& value) {
      cells.push_back(cell);
      value = 1;
    });
    REQUIRE(cells ==
            std::vector<Cell>{{0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 1}, {1, 2}});
    REQUIRE(grid[Cell{1, 2}] == 1);
  }

  SECTION("reset clears values") {
    grid.Reset(1, 1);
    REQUIRE(grid.GetDimensions().GetCellCount() == 1);
    REQUIRE(grid[Cell{0, 0}] == 0);
  }
}
