#ifndef SWEEPER_GAME_DIMENSIONS_H_
#define SWEEPER_GAME_DIMENSIONS_H_

#include <cstddef>

#include "sweeper/game/cell.h"

namespace sweeper {

// The size of a board, and the adjacency rules that follow from it.
struct Dimensions {
  std::size_t rows;
  std::size_t cols;

  // Returns the total number of cells.
  std::size_t GetCellCount() const { return rows * cols; }

  // Returns true if the cell lies on the board.
  bool IsValid(const Cell& cell) const {
    return cell.row < rows && cell.col < cols;
  }

  // Calls the provided function object for each cell in row-major order.
  //
  // The function should be callable as:
  //   fn(cell);
  template <class Fn>
  void ForEach(Fn fn) const {
    for (std::size_t row = 0; row < rows; ++row) {
      for (std::size_t col = 0; col < cols; ++col) {
        fn(Cell{row, col});
      }
    }
  }

  // Calls the provided function object for each of the valid adjacent cells.
  // The cell itself is never visited.
  //
  // The function should be callable as:
  //   bool v = fn(adjacent_cell);
  //
  // Returns the number of function calls that returned true.
  template <class Fn>
  std::size_t ForEachAdjacent(const Cell& cell, Fn fn) const {
    // Note: This relies on the fact that unsigned underflow is well defined.
    const std::size_t row = cell.row;
    const std::size_t col = cell.col;
    std::size_t count = 0;
    count += Visit(Cell{row - 1, col - 1}, fn);
    count += Visit(Cell{row - 1, col - 0}, fn);
    count += Visit(Cell{row - 1, col + 1}, fn);
    count += Visit(Cell{row - 0, col - 1}, fn);
    count += Visit(Cell{row - 0, col + 1}, fn);
    count += Visit(Cell{row + 1, col - 1}, fn);
    count += Visit(Cell{row + 1, col - 0}, fn);
    count += Visit(Cell{row + 1, col + 1}, fn);
    return count;
  }

 private:
  template <class Fn>
  std::size_t Visit(const Cell& cell, Fn& fn) const {
    return IsValid(cell) && fn(cell) ? 1 : 0;
  }
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_DIMENSIONS_H_
