#include "sweeper/game/game.h"

#include <algorithm>
#include <queue>
#include <random>
#include <utility>

#include "sweeper/game/grid.h"

namespace sweeper {

namespace {

Event MakeEvent(Event::Type type, const Cell& cell) {
  return Event{type, cell, 0};
}

// After a loss, shows the player what a cell really held.
Event RevealEvent(const Cell& cell, CellState revealed) {
  Event event = MakeEvent(Event::Type::REVEAL, cell);
  event.revealed = revealed;
  return event;
}

// A single square of the mine field.
class Square {
 public:
  // Returns true if the square contains a mine.
  bool IsMine() const { return is_mine_; }

  // Sets or clears the mine in this square.
  //
  // Returns false if the square was already in the requested state.
  bool SetMine(bool is_mine) {
    if (is_mine_ == is_mine) {
      return false;
    }
    is_mine_ = is_mine;
    return true;
  }

  // Returns true if the square is flagged.
  bool IsFlagged() const { return state_ == State::FLAGGED; }

  // Returns true if the square is covered.
  bool IsCovered() const { return state_ == State::COVERED; }

  // Toggles a square between flagged and covered.
  //
  // Returns false if the square is uncovered.
  bool ToggleFlagged() {
    switch (state_) {
      case State::COVERED:
        state_ = State::FLAGGED;
        return true;
      case State::FLAGGED:
        state_ = State::COVERED;
        return true;
      case State::UNCOVERED:
      default:
        return false;
    }
  }

  // Uncovers the square if it is covered.
  //
  // Returns false (and does nothing) if the square is flagged or uncovered.
  bool Uncover() {
    if (state_ != State::COVERED) {
      return false;
    }
    state_ = State::UNCOVERED;
    return true;
  }

 private:
  enum class State {
    COVERED,
    UNCOVERED,
    FLAGGED,
  };

  bool is_mine_ = false;
  State state_ = State::COVERED;
};

// The game implementation.
class GameImpl : public Game {
 public:
  // Constructs a game with no mines. Mines are placed with PlaceMine.
  explicit GameImpl(const Dimensions& dim)
      : mines_(0),
        state_(State::NEW),
        remaining_covered_(dim.GetCellCount()),
        grid_(dim.rows, dim.cols),
        has_backup_cell_(false),
        backup_cell_{0, 0} {}

  ~GameImpl() final = default;

  // Places a mine at the given cell.
  //
  // Returns false if the cell already contains a mine.
  bool PlaceMine(const Cell& cell) {
    if (!grid_[cell].SetMine(true)) {
      return false;
    }
    ++mines_;
    --remaining_covered_;
    return true;
  }

  // Sets the cell that receives the mine if the first uncovered cell is a
  // mine. The backup cell must not be a mine.
  void SetBackupCell(const Cell& cell) {
    has_backup_cell_ = true;
    backup_cell_ = cell;
  }

  void Execute(const Action& action) final {
    if (IsGameOver() || !grid_.IsValid(action.cell)) {
      return;
    }

    std::vector<Event> events;
    switch (action.type) {
      case Action::Type::UNCOVER:
        Uncover(action.cell, events);
        break;
      case Action::Type::FLAG:
        ToggleFlagged(action.cell, events);
        break;
    }

    if (state_ == State::NEW && !events.empty()) {
      state_ = State::PLAYING;
    }

    for (const Event& event : events) {
      for (EventSubscriber* subscriber : subscribers_) {
        subscriber->NotifyEvent(event);
      }
    }
  }

  void Subscribe(EventSubscriber* subscriber) final {
    subscribers_.push_back(subscriber);
  }

  const Dimensions& GetDimensions() const final {
    return grid_.GetDimensions();
  }

  std::size_t GetMineCount() const final { return mines_; }

  State GetState() const final { return state_; }

 private:
  // Attempts to uncover the specified cell.
  //
  // Does nothing if the cell is flagged or already uncovered.
  //
  // If the cell contains zero adjacent mines, the adjacent cells will be
  // recursively uncovered.
  void Uncover(const Cell& cell, std::vector<Event>& events) {
    Square& square = grid_[cell];

    if (state_ == State::NEW && has_backup_cell_ && square.IsMine()) {
      square.SetMine(false);
      grid_[backup_cell_].SetMine(true);
    }

    UncoverFrom(cell, events);
  }

  // Toggles the flag on the specified cell.
  //
  // Does nothing if the cell is already uncovered.
  void ToggleFlagged(const Cell& cell, std::vector<Event>& events) {
    Square& square = grid_[cell];
    if (square.ToggleFlagged()) {
      events.push_back(MakeEvent(
          square.IsFlagged() ? Event::Type::FLAG : Event::Type::UNFLAG, cell));
    }
  }

  // Counts the mines among the in-bounds neighbors. The cell itself is never
  // counted.
  std::size_t CountAdjacentMines(const Cell& cell) const {
    return grid_.ForEachAdjacent(cell, [this](const Cell& adjacent) {
      return grid_[adjacent].IsMine();
    });
  }

  // Uncovers cells in a breadth first manner, starting at the given cell.
  //
  // If an uncovered cell has zero adjacent mines, its adjacent cells will also
  // be uncovered.
  void UncoverFrom(const Cell& start, std::vector<Event>& events) {
    std::queue<Cell> uncover_queue;
    auto queue_cell = [this, &uncover_queue](const Cell& cell) {
      if (grid_[cell].IsCovered()) {
        uncover_queue.push(cell);
      }
      return false;
    };
    uncover_queue.push(start);

    while (!uncover_queue.empty()) {
      const Cell cell = uncover_queue.front();
      uncover_queue.pop();
      Square& square = grid_[cell];

      if (!square.Uncover()) {
        // Cell was flagged or already uncovered.
        continue;
      }

      // If a mine was uncovered this is a loss.
      if (square.IsMine()) {
        ShowAllMinesAndLose(cell, events);
        return;
      }

      const std::size_t adjacent_mines = CountAdjacentMines(cell);
      events.push_back(Event{Event::Type::UNCOVER, cell, adjacent_mines});
      --remaining_covered_;

      // If there are no more safe cells to uncover this is a win.
      if (remaining_covered_ == 0) {
        events.push_back(MakeEvent(Event::Type::WIN, cell));
        state_ = State::WIN;
        return;
      }

      // Automatically expand empty areas.
      if (adjacent_mines == 0) {
        grid_.ForEachAdjacent(cell, queue_cell);
      }
    }
  }

  // Generates events to show all mines and bad flags, followed by a loss event
  // at the given location.
  void ShowAllMinesAndLose(const Cell& losing_cell,
                           std::vector<Event>& events) {
    grid_.ForEach([&events, &losing_cell](const Cell& cell,
                                          const Square& square) {
      if (cell == losing_cell) {
        return;
      }
      if (square.IsMine() && !square.IsFlagged()) {
        events.push_back(RevealEvent(cell, CellState::MINE));
      } else if (!square.IsMine() && square.IsFlagged()) {
        events.push_back(RevealEvent(cell, CellState::BAD_FLAG));
      }
    });

    events.push_back(MakeEvent(Event::Type::LOSS, losing_cell));
    state_ = State::LOSS;
  }

  std::size_t mines_;
  State state_;
  std::size_t remaining_covered_;
  Grid<Square> grid_;
  bool has_backup_cell_;
  Cell backup_cell_;
  std::vector<EventSubscriber*> subscribers_;
};

}  // namespace

std::unique_ptr<Game> NewGame(const Difficulty& difficulty, unsigned seed) {
  const Dimensions dim{difficulty.rows, difficulty.cols};
  const std::size_t mines = difficulty.mines;
  if (dim.GetCellCount() == 0 || mines >= dim.GetCellCount()) {
    return nullptr;
  }
  auto game = std::make_unique<GameImpl>(dim);

  // Assign the mines.
  std::default_random_engine g;
  g.seed(seed);
  std::uniform_int_distribution<std::size_t> d(0, dim.GetCellCount() - 1);
  const std::size_t cols = dim.cols;
  auto random_cell = [&g, &d, cols]() {
    const std::size_t rnd = d(g);
    return Cell{rnd / cols, rnd % cols};
  };

  std::vector<Cell> placed;
  placed.reserve(mines);
  while (placed.size() < mines) {
    const Cell cell = random_cell();
    if (game->PlaceMine(cell)) {
      placed.push_back(cell);
    }
  }

  // Choose a backup cell to be a mine if the first cell uncovered is a mine.
  Cell backup = random_cell();
  while (std::find(placed.begin(), placed.end(), backup) != placed.end()) {
    backup = random_cell();
  }
  game->SetBackupCell(backup);

  return std::move(game);
}

std::unique_ptr<Game> NewGameWithMines(const Dimensions& dim,
                                       const std::vector<Cell>& mines) {
  if (dim.GetCellCount() == 0) {
    return nullptr;
  }
  auto game = std::make_unique<GameImpl>(dim);
  std::size_t placed = 0;
  for (const Cell& cell : mines) {
    if (!dim.IsValid(cell)) {
      return nullptr;
    }
    if (game->PlaceMine(cell)) {
      ++placed;
    }
  }
  if (placed == dim.GetCellCount()) {
    return nullptr;
  }
  return std::move(game);
}

}  // namespace sweeper
