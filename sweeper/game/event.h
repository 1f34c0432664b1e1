#ifndef SWEEPER_GAME_EVENT_H_
#define SWEEPER_GAME_EVENT_H_

#include <cstddef>

#include "sweeper/game/cell.h"

namespace sweeper {

// A move on the board, made by the player or recommended by a solver.
struct Action {
  enum class Type {
    UNCOVER,

    // Puts a flag on a covered cell, or takes it off again.
    FLAG,
  };

  Type type;
  Cell cell;
};

inline bool operator==(const Action& a, const Action& b) {
  return a.type == b.type && a.cell == b.cell;
}

inline bool operator!=(const Action& a, const Action& b) { return !(a == b); }

// A cell as a player sees it. The last three only appear once a game is lost.
enum class CellState {
  COVERED,
  FLAGGED,
  UNCOVERED,

  // A mine the player never found.
  MINE,

  // The mine the player uncovered.
  LOSING_MINE,

  // A flag on a cell that was safe all along.
  BAD_FLAG,
};

// A fact the board discloses in answer to an action.
//
// One action can disclose many facts: opening an empty area uncovers every
// cell around it, and a loss reveals the whole layout. Subscribers see them in
// the order they happened.
struct Event {
  enum class Type {
    // The cell is safe and is now open. adjacent_mines is set.
    UNCOVER,

    // A flag was put on, or taken off, a covered cell.
    FLAG,
    UNFLAG,

    // After a loss: the cell is a missed mine or a bad flag. revealed is set.
    REVEAL,

    // The last safe cell was uncovered. cell is that cell.
    WIN,

    // A mine was uncovered. cell is the mine, and follows every REVEAL.
    LOSS,
  };

  Type type;
  Cell cell;

  // For UNCOVER, how many of the cell's in-bounds neighbors (never the cell
  // itself) are mines. This is the count a knowledge base observes. Zero for
  // every other event.
  std::size_t adjacent_mines;

  // For REVEAL, either MINE or BAD_FLAG.
  CellState revealed = CellState::COVERED;
};

// Receives the events of every action executed on a Game it subscribed to.
class EventSubscriber {
 public:
  virtual ~EventSubscriber() = default;

  virtual void NotifyEvent(const Event& event) = 0;
};

}  // namespace sweeper

#endif  // SWEEPER_GAME_EVENT_H_
