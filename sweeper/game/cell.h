#ifndef SWEEPER_GAME_CELL_H_
#define SWEEPER_GAME_CELL_H_

#include <cstddef>
#include <ostream>

namespace sweeper {

// The row/col location of a cell on the board.
struct Cell {
  std::size_t row;
  std::size_t col;
};

inline bool operator==(const Cell& a, const Cell& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Cell& a, const Cell& b) {
  return a.row != b.row || a.col != b.col;
}

// Row-major ordering.
inline bool operator<(const Cell& a, const Cell& b) {
  return a.row < b.row || (a.row == b.row && a.col < b.col);
}

inline std::ostream& operator<<(std::ostream& out, const Cell& cell) {
  return out << '(' << cell.row << ", " << cell.col << ')';
}

}  // namespace sweeper

#endif  // SWEEPER_GAME_CELL_H_
