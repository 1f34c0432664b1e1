#ifndef SWEEPER_SOLVER_SENTENCE_H_
#define SWEEPER_SOLVER_SENTENCE_H_

#include <cstddef>
#include <ostream>
#include <set>

#include "sweeper/game/cell.h"

namespace sweeper {
namespace solver {

// A logical statement about a game: exactly GetCount() of GetCells() are
// mines.
//
// A sentence shrinks as facts become known. Marking a cell as a mine removes
// it and accounts for one of the mines; marking a cell as safe only removes
// it. A sentence with no cells carries no information.
class Sentence {
 public:
  // Constructs a sentence. The count must not exceed the number of cells.
  Sentence(std::set<Cell> cells, std::size_t count);

  ~Sentence() = default;

  // Copyable.
  Sentence(const Sentence&) = default;
  Sentence& operator=(const Sentence&) = default;

  // Movable.
  Sentence(Sentence&&) = default;
  Sentence& operator=(Sentence&&) = default;

  // Returns the cells the sentence is about.
  const std::set<Cell>& GetCells() const { return cells_; }

  // Returns the number of mines among the cells.
  std::size_t GetCount() const { return count_; }

  // Returns every cell if all of them must be mines, otherwise nothing.
  std::set<Cell> KnownMines() const;

  // Returns every cell if none of them can be a mine, otherwise nothing.
  std::set<Cell> KnownSafes() const;

  // Accounts for the cell being a mine. Does nothing if the cell is not part
  // of the sentence. A sentence with a count of zero cannot hold the mine.
  //
  // Returns true if the sentence changed.
  bool MarkMine(const Cell& cell);

  // Accounts for the cell being safe. Does nothing if the cell is not part of
  // the sentence. A sentence whose cells must all be mines cannot hold it.
  //
  // Returns true if the sentence changed.
  bool MarkSafe(const Cell& cell);

  // Returns true once every cell has been resolved. An empty sentence may be
  // discarded.
  bool IsEmpty() const { return cells_.empty(); }

  // Returns true if the sentence is about exactly n cells.
  bool HasSize(std::size_t n) const { return cells_.size() == n; }

  // Returns true if the cells of this sentence are a strict subset of the
  // cells of the other.
  bool IsStrictSubsetOf(const Sentence& other) const;

 private:
  std::set<Cell> cells_;
  std::size_t count_;
};

// Sentences are equal when they are about the same cells with the same count.
bool operator==(const Sentence& a, const Sentence& b);
bool operator!=(const Sentence& a, const Sentence& b);

// Orders sentences by cells, then by count.
bool operator<(const Sentence& a, const Sentence& b);

// Prints the sentence as "{(r, c), ...} = count".
std::ostream& operator<<(std::ostream& out, const Sentence& sentence);

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_SENTENCE_H_
