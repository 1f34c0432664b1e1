#ifndef SWEEPER_GAME_GRID_H_
#define SWEEPER_GAME_GRID_H_

#include <cstddef>
#include <vector>

#include "sweeper/game/cell.h"
#include "sweeper/game/dimensions.h"

namespace sweeper {

// Represents a two dimensional grid of T, indexed by Cell.
template <typename T>
class Grid {
 public:
  Grid() : Grid(0, 0) {}

  Grid(std::size_t rows, std::size_t cols) { Reset(rows, cols); }

  ~Grid() = default;

  // Copyable.
  Grid(const Grid&) = default;
  Grid& operator=(const Grid&) = default;

  // Movable.
  Grid(Grid&&) = default;
  Grid& operator=(Grid&&) = default;

  // Resets the grid to default constructed values at the specified
  // dimensions.
  void Reset(std::size_t rows, std::size_t cols) {
    dim_ = Dimensions{rows, cols};
    values_.assign(rows * cols, T());
  }

  // Returns the dimensions of the grid.
  const Dimensions& GetDimensions() const { return dim_; }

  // Returns the number of rows.
  std::size_t GetRows() const { return dim_.rows; }

  // Returns the number of columns.
  std::size_t GetCols() const { return dim_.cols; }

  // Returns true if the given cell is valid.
  bool IsValid(const Cell& cell) const { return dim_.IsValid(cell); }

  const T& operator[](const Cell& cell) const {
    return values_[cell.row * dim_.cols + cell.col];
  }

  T& operator[](const Cell& cell) {
    return values_[cell.row * dim_.cols + cell.col];
  }

  // Calls the provided function object for each value in the grid.
  //
  // The function should be callable as:
  //   fn(cell, value);
  template <class Fn>
  void ForEach(Fn fn) {
    dim_.ForEach([this, &fn](const Cell& cell) { fn(cell, (*this)[cell]); });
  }

  template <class Fn>
  void ForEach(Fn fn) const {
    dim_.ForEach([this, &fn](const Cell& cell) { fn(cell, (*this)[cell]); });
  }

  // Calls the provided function object for each of the valid adjacent cells.
  //
  // See Dimensions::ForEachAdjacent.
  template <class Fn>
  std::size_t ForEachAdjacent(const Cell& cell, Fn fn) const {
    return dim_.ForEachAdjacent(cell, fn);
  }

 private:
  Dimensions dim_;
  std::vector<T> values_;
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_GRID_H_
