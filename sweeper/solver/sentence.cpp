#include "sweeper/solver/sentence.h"

#include <algorithm>
#include <cassert>
#include <utility>

namespace sweeper {
namespace solver {

Sentence::Sentence(std::set<Cell> cells, std::size_t count)
    : cells_(std::move(cells)), count_(count) {
  assert(count_ <= cells_.size());
}

std::set<Cell> Sentence::KnownMines() const {
  if (count_ == cells_.size()) {
    return cells_;
  }
  return std::set<Cell>();
}

std::set<Cell> Sentence::KnownSafes() const {
  if (count_ == 0) {
    return cells_;
  }
  return std::set<Cell>();
}

bool Sentence::MarkMine(const Cell& cell) {
  if (cells_.erase(cell) == 0) {
    return false;
  }
  // A mine in a sentence that needs no more mines is a contradiction.
  assert(count_ > 0);
  --count_;
  return true;
}

bool Sentence::MarkSafe(const Cell& cell) {
  if (cells_.erase(cell) == 0) {
    return false;
  }
  // A safe cell in a sentence where every cell is a mine is a contradiction.
  assert(count_ <= cells_.size());
  return true;
}

bool Sentence::IsStrictSubsetOf(const Sentence& other) const {
  return cells_.size() < other.cells_.size() &&
         std::includes(other.cells_.begin(), other.cells_.end(),
                       cells_.begin(), cells_.end());
}

bool operator==(const Sentence& a, const Sentence& b) {
  return a.GetCount() == b.GetCount() && a.GetCells() == b.GetCells();
}

bool operator!=(const Sentence& a, const Sentence& b) { return !(a == b); }

bool operator<(const Sentence& a, const Sentence& b) {
  if (a.GetCells() != b.GetCells()) {
    return a.GetCells() < b.GetCells();
  }
  return a.GetCount() < b.GetCount();
}

std::ostream& operator<<(std::ostream& out, const Sentence& sentence) {
  out << '{';
  const char* separator = "";
  for (const Cell& cell : sentence.GetCells()) {
    out << separator << cell;
    separator = ", ";
  }
  return out << "} = " << sentence.GetCount();
}

}  // namespace solver
}  // namespace sweeper
