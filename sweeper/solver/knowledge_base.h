#ifndef SWEEPER_SOLVER_KNOWLEDGE_BASE_H_
#define SWEEPER_SOLVER_KNOWLEDGE_BASE_H_

#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "sweeper/game/cell.h"
#include "sweeper/game/dimensions.h"
#include "sweeper/solver/random_source.h"
#include "sweeper/solver/sentence.h"

namespace sweeper {
namespace solver {

// The accumulated knowledge of an agent playing a single game.
//
// The knowledge base records every observed cell along with the number of
// adjacent mines, and derives from those observations which cells are
// provably mines and which are provably safe. Only facts that follow with
// certainty are recorded; the sets of mines, safes and observed cells only
// ever grow.
//
// Deduction works on sentences ("exactly n of these cells are mines"). After
// each observation the knowledge base propagates to a fixpoint:
//  - Sentences whose cells must all be mines, or must all be safe, disclose
//    those cells. Every sentence mentioning them is updated.
//  - Sentences with no cells left are discarded, as are duplicates.
//  - When the cells of sentence A are a strict subset of the cells of
//    sentence B, the cells only in B hold B.count - A.count mines, which is
//    recorded as a new sentence.
// Propagation ends after a pass that discloses nothing, discards nothing and
// derives nothing new. Every pass either grows the set of known cells or adds
// a sentence not seen before, and both are bounded, so it always ends.
class KnowledgeBase {
 public:
  KnowledgeBase(std::size_t rows, std::size_t cols);

  // Records that the cell was uncovered and has count adjacent mines, then
  // propagates to a fixpoint.
  //
  // Observing a cell a second time with the same count changes nothing.
  //
  // Returns false, leaving the knowledge base unchanged, if the observation
  // cannot be true: the cell is off the board or known to be a mine, the
  // count conflicts with an earlier observation of the cell, the count is
  // impossible given the neighbors already known, or propagation shows it
  // contradicts the other observations.
  bool Observe(const Cell& cell, std::size_t count);

  // Records that exactly sentence.GetCount() of its cells are mines, then
  // propagates to a fixpoint. Cells already known are resolved first.
  //
  // Returns false, leaving the knowledge base unchanged, if a cell is off the
  // board, or the sentence contradicts the known mines and safes or the
  // other sentences.
  bool AddSentence(const Sentence& sentence);

  // Records that the cell is a mine and updates every sentence.
  //
  // Returns false, and does nothing, if the cell is known to be safe or a
  // sentence holding it already accounts for all of its mines.
  bool MarkMine(const Cell& cell);

  // Records that the cell is safe and updates every sentence.
  //
  // Returns false, and does nothing, if the cell is known to be a mine or a
  // sentence holding it needs every one of its cells to be a mine.
  bool MarkSafe(const Cell& cell);

  // Derives new facts and sentences until nothing changes.
  //
  // Returns true if anything changed. A contradiction leaves the knowledge
  // base unchanged and is logged.
  bool Propagate();

  // Picks a cell known to be safe that has not been observed yet.
  //
  // Returns false if there is no such cell.
  bool ChooseSafeMove(Cell* move) const;

  // Picks a uniformly random cell that has not been observed and is not known
  // to be a mine, using a single draw from random.
  //
  // Returns false if there is no such cell.
  bool ChooseRandomMove(RandomSource& random, Cell* move) const;

  const Dimensions& GetDimensions() const { return dim_; }

  // Cells known to be mines.
  const std::set<Cell>& GetMines() const { return mines_; }

  // Cells known to be safe, observed or not.
  const std::set<Cell>& GetSafes() const { return safes_; }

  // Cells that have been observed.
  const std::set<Cell>& GetMovesMade() const { return moves_made_; }

  // The sentences that still carry information.
  const std::vector<Sentence>& GetSentences() const { return sentences_; }

 private:
  // Runs the propagation passes in place, setting *changed if anything
  // changed.
  //
  // Returns false as soon as a contradiction is found. The knowledge base is
  // then only fit to be thrown away.
  bool Deduce(bool* changed);

  // Marks every cell disclosed by a sentence, setting *changed if any cell was
  // marked.
  //
  // Returns false if a cell is disclosed as both a mine and safe.
  bool MarkDisclosedCells(bool* changed);

  // Replaces the sentences with a copy that has no empty or duplicate
  // sentences. Returns true if any sentence was dropped.
  bool RetireSentences();

  // Adds the sentences derived from every strict subset pair, setting
  // *changed if any new sentence was added.
  //
  // Returns false if a pair cannot both be true.
  bool ResolveSubsets(bool* changed);

  // Checks the invariants that hold after every propagation pass.
  void CheckInvariants() const;

  Dimensions dim_;

  std::set<Cell> moves_made_;
  std::set<Cell> mines_;
  std::set<Cell> safes_;

  // The count reported for each observed cell.
  std::map<Cell, std::size_t> observations_;

  std::vector<Sentence> sentences_;
};

}  // namespace solver
}  // namespace sweeper

#endif  // SWEEPER_SOLVER_KNOWLEDGE_BASE_H_
