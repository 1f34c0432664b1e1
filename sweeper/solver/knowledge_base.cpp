#include "sweeper/solver/knowledge_base.h"

#include <algorithm>
#include <cassert>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace sweeper {
namespace solver {

namespace {

std::string ToString(const Sentence& sentence) {
  std::ostringstream out;
  out << sentence;
  return out.str();
}

bool Contains(const std::set<Cell>& cells, const Cell& cell) {
  return cells.find(cell) != cells.end();
}

}  // namespace

KnowledgeBase::KnowledgeBase(std::size_t rows, std::size_t cols)
    : dim_{rows, cols} {}

bool KnowledgeBase::Observe(const Cell& cell, std::size_t count) {
  if (!dim_.IsValid(cell)) {
    spdlog::error("Rejected observation of ({}, {}): outside the {}x{} board",
                  cell.row, cell.col, dim_.rows, dim_.cols);
    return false;
  }

  auto it = observations_.find(cell);
  if (it != observations_.end()) {
    if (it->second != count) {
      spdlog::error(
          "Rejected observation of ({}, {}) = {}: previously observed as {}",
          cell.row, cell.col, count, it->second);
      return false;
    }
    spdlog::debug("Ignoring repeated observation of ({}, {}) = {}", cell.row,
                  cell.col, count);
    return true;
  }

  if (Contains(mines_, cell)) {
    spdlog::error("Rejected observation of ({}, {}): known to be a mine",
                  cell.row, cell.col);
    return false;
  }

  // Build the sentence for the unresolved neighbors. Neighbors known to be
  // mines account for part of the count; other known neighbors add nothing.
  std::set<Cell> cells;
  const std::size_t adjacent_mines =
      dim_.ForEachAdjacent(cell, [this, &cells](const Cell& adjacent) {
        if (Contains(mines_, adjacent)) {
          return true;
        }
        if (!Contains(safes_, adjacent) && !Contains(moves_made_, adjacent)) {
          cells.insert(adjacent);
        }
        return false;
      });

  if (count < adjacent_mines || count - adjacent_mines > cells.size()) {
    spdlog::error(
        "Rejected observation of ({}, {}) = {}: {} adjacent mines known, {} "
        "adjacent cells unresolved",
        cell.row, cell.col, count, adjacent_mines, cells.size());
    return false;
  }

  KnowledgeBase next(*this);
  next.moves_made_.insert(cell);
  next.observations_[cell] = count;
  if (!next.MarkSafe(cell)) {
    spdlog::error("Rejected observation of ({}, {}): a sentence needs it to "
                  "be a mine",
                  cell.row, cell.col);
    return false;
  }

  // Even an empty sentence is added; propagation retires it.
  next.sentences_.emplace_back(std::move(cells), count - adjacent_mines);

  bool changed = false;
  if (!next.Deduce(&changed)) {
    spdlog::error(
        "Rejected observation of ({}, {}) = {}: contradicts earlier "
        "observations",
        cell.row, cell.col, count);
    return false;
  }

  spdlog::debug("Observed ({}, {}) = {}", cell.row, cell.col, count);
  *this = std::move(next);
  return true;
}

bool KnowledgeBase::AddSentence(const Sentence& sentence) {
  std::set<Cell> cells;
  std::size_t count = sentence.GetCount();
  for (const Cell& cell : sentence.GetCells()) {
    if (!dim_.IsValid(cell)) {
      spdlog::error("Rejected sentence: ({}, {}) is outside the {}x{} board",
                    cell.row, cell.col, dim_.rows, dim_.cols);
      return false;
    }
    if (Contains(mines_, cell)) {
      if (count == 0) {
        spdlog::error("Rejected sentence: ({}, {}) is a known mine", cell.row,
                      cell.col);
        return false;
      }
      --count;
    } else if (!Contains(safes_, cell)) {
      cells.insert(cell);
    }
  }
  if (count > cells.size()) {
    spdlog::error("Rejected sentence: {} mines among {} unresolved cells",
                  count, cells.size());
    return false;
  }

  KnowledgeBase next(*this);
  next.sentences_.emplace_back(std::move(cells), count);
  bool changed = false;
  if (!next.Deduce(&changed)) {
    if (spdlog::should_log(spdlog::level::err)) {
      spdlog::error("Rejected sentence {}: contradicts the other sentences",
                    ToString(sentence));
    }
    return false;
  }
  *this = std::move(next);
  return true;
}

bool KnowledgeBase::MarkMine(const Cell& cell) {
  if (Contains(safes_, cell)) {
    return false;
  }
  for (const Sentence& sentence : sentences_) {
    if (sentence.GetCount() == 0 && Contains(sentence.GetCells(), cell)) {
      return false;
    }
  }
  mines_.insert(cell);
  for (Sentence& sentence : sentences_) {
    sentence.MarkMine(cell);
  }
  return true;
}

bool KnowledgeBase::MarkSafe(const Cell& cell) {
  if (Contains(mines_, cell)) {
    return false;
  }
  for (const Sentence& sentence : sentences_) {
    if (sentence.GetCount() == sentence.GetCells().size() &&
        Contains(sentence.GetCells(), cell)) {
      return false;
    }
  }
  safes_.insert(cell);
  for (Sentence& sentence : sentences_) {
    sentence.MarkSafe(cell);
  }
  return true;
}

bool KnowledgeBase::Propagate() {
  KnowledgeBase next(*this);
  bool changed = false;
  if (!next.Deduce(&changed)) {
    spdlog::error("Propagation found contradictory sentences");
    return false;
  }
  *this = std::move(next);
  return changed;
}

bool KnowledgeBase::Deduce(bool* changed) {
  std::size_t passes = 0;
  for (;;) {
    ++passes;

    bool pass_changed = false;
    if (!MarkDisclosedCells(&pass_changed)) {
      return false;
    }
    if (RetireSentences()) {
      pass_changed = true;
    }
    if (!ResolveSubsets(&pass_changed)) {
      return false;
    }

    CheckInvariants();

    if (!pass_changed) {
      break;
    }
    *changed = true;
  }

  spdlog::debug(
      "Propagated in {} passes: {} mines, {} safes, {} sentences", passes,
      mines_.size(), safes_.size(), sentences_.size());
  return true;
}

bool KnowledgeBase::MarkDisclosedCells(bool* changed) {
  std::set<Cell> mines;
  std::set<Cell> safes;
  for (const Sentence& sentence : sentences_) {
    for (const Cell& cell : sentence.KnownMines()) {
      if (!Contains(mines_, cell)) {
        mines.insert(cell);
      }
    }
    for (const Cell& cell : sentence.KnownSafes()) {
      if (!Contains(safes_, cell)) {
        safes.insert(cell);
      }
    }
  }

  // Safes and mines are each marked whenever any were found, independently
  // of the other.
  for (const Cell& cell : safes) {
    spdlog::debug("Deduced ({}, {}) is safe", cell.row, cell.col);
    if (!MarkSafe(cell)) {
      return false;
    }
  }
  for (const Cell& cell : mines) {
    spdlog::debug("Deduced ({}, {}) is a mine", cell.row, cell.col);
    if (!MarkMine(cell)) {
      return false;
    }
  }

  if (!mines.empty() || !safes.empty()) {
    *changed = true;
  }
  return true;
}

bool KnowledgeBase::RetireSentences() {
  std::vector<Sentence> next;
  next.reserve(sentences_.size());
  std::set<Sentence> seen;
  for (Sentence& sentence : sentences_) {
    if (sentence.IsEmpty() || !seen.insert(sentence).second) {
      continue;
    }
    next.push_back(std::move(sentence));
  }

  const bool changed = next.size() != sentences_.size();
  sentences_.swap(next);
  return changed;
}

bool KnowledgeBase::ResolveSubsets(bool* changed) {
  std::set<Sentence> known(sentences_.begin(), sentences_.end());
  std::vector<Sentence> derived;

  for (const Sentence& subset : sentences_) {
    for (const Sentence& superset : sentences_) {
      if (!subset.IsStrictSubsetOf(superset)) {
        continue;
      }

      std::set<Cell> cells;
      std::set_difference(superset.GetCells().begin(),
                          superset.GetCells().end(),
                          subset.GetCells().begin(), subset.GetCells().end(),
                          std::inserter(cells, cells.end()));
      if (superset.GetCount() < subset.GetCount() ||
          superset.GetCount() - subset.GetCount() > cells.size()) {
        return false;
      }

      Sentence sentence(std::move(cells),
                        superset.GetCount() - subset.GetCount());
      if (known.insert(sentence).second) {
        if (spdlog::should_log(spdlog::level::trace)) {
          spdlog::trace("Derived {} from {} and {}", ToString(sentence),
                        ToString(superset), ToString(subset));
        }
        derived.push_back(std::move(sentence));
      }
    }
  }

  if (!derived.empty()) {
    *changed = true;
  }
  for (Sentence& sentence : derived) {
    sentences_.push_back(std::move(sentence));
  }
  return true;
}

void KnowledgeBase::CheckInvariants() const {
#ifndef NDEBUG
  for (const Cell& cell : mines_) {
    assert(!Contains(safes_, cell));
  }
  for (const Sentence& sentence : sentences_) {
    assert(sentence.GetCount() <= sentence.GetCells().size());
  }
#endif
}

bool KnowledgeBase::ChooseSafeMove(Cell* move) const {
  for (const Cell& cell : safes_) {
    if (!Contains(moves_made_, cell)) {
      *move = cell;
      return true;
    }
  }
  return false;
}

bool KnowledgeBase::ChooseRandomMove(RandomSource& random, Cell* move) const {
  std::vector<Cell> candidates;
  dim_.ForEach([this, &candidates](const Cell& cell) {
    if (!Contains(moves_made_, cell) && !Contains(mines_, cell)) {
      candidates.push_back(cell);
    }
  });
  if (candidates.empty()) {
    return false;
  }

  const std::size_t index = random.Uniform(candidates.size());
  assert(index < candidates.size());
  *move = candidates[index];
  return true;
}

}  // namespace solver
}  // namespace sweeper
