#include "sweeper/ui/text_ui.h"

#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "sweeper/game/grid.h"
#include "sweeper/solver/knowledge_base.h"

namespace sweeper {
namespace ui {

namespace {

// Represents player knowledge about the current game.
class BoardView : public EventSubscriber {
 public:
  explicit BoardView(const Dimensions& dim) : grid_(dim.rows, dim.cols) {}

  // Updates player knowledge based on the event.
  void NotifyEvent(const Event& event) final {
    if (!grid_.IsValid(event.cell)) {
      return;
    }
    Square& square = grid_[event.cell];
    switch (event.type) {
      case Event::Type::UNCOVER:
        square.state = CellState::UNCOVERED;
        square.adjacent_mines = event.adjacent_mines;
        break;
      case Event::Type::FLAG:
        square.state = CellState::FLAGGED;
        break;
      case Event::Type::UNFLAG:
        square.state = CellState::COVERED;
        break;
      case Event::Type::WIN:
        // No new knowledge.
        break;
      case Event::Type::LOSS:
        square.state = CellState::LOSING_MINE;
        break;
      case Event::Type::REVEAL:
        square.state = event.revealed;
        break;
    }
  }

  void Print(std::ostream& out) const {
    const std::size_t rows = grid_.GetRows();
    const std::size_t cols = grid_.GetCols();

    for (std::size_t row = 0; row < rows; ++row) {
      for (std::size_t col = 0; col < cols; ++col) {
        const Square& square = grid_[Cell{row, col}];
        switch (square.state) {
          case CellState::UNCOVERED:
            out << square.adjacent_mines;
            break;
          case CellState::COVERED:
            out << '-';
            break;
          case CellState::FLAGGED:
            out << 'F';
            break;
          case CellState::MINE:
            out << '*';
            break;
          case CellState::LOSING_MINE:
            out << 'X';
            break;
          case CellState::BAD_FLAG:
            out << '!';
            break;
        }
        out << ' ';
      }
      out << '\n';
    }
    out << '\n';
  }

 private:
  // Represents player knowledge about a cell.
  struct Square {
    CellState state = CellState::COVERED;

    // The number of adjacent mines.
    // Only valid if the state is UNCOVERED.
    std::size_t adjacent_mines = 0;
  };

  Grid<Square> grid_;
};

class TextUiImpl : public TextUi {
 public:
  TextUiImpl(std::istream& in, std::ostream& out) : in_(in), out_(out) {}
  ~TextUiImpl() final = default;

  bool Play(Game& game, solver::Solver& solver) final {
    BoardView view(game.GetDimensions());
    game.Subscribe(&view);

    while (!game.IsGameOver()) {
      view.Print(out_);
      PrintKnowledge(solver.GetKnowledgeBase());

      std::vector<Action> actions = solver.Analyze();
      if (actions.empty()) {
        // Analysis produced no actions. Get action from user.
        Action action{Action::Type::UNCOVER, Cell{0, 0}};
        if (!GetActionFromPlayer(&action)) {
          out_ << "Quit.\n";
          return false;
        }
        actions.push_back(action);
      } else {
        for (const Action& action : actions) {
          PrintSolverAction(action);
        }
      }
      game.Execute(actions);
    }

    view.Print(out_);

    const bool win = game.GetState() == Game::State::WIN;
    spdlog::info("Game over: {}", win ? "win" : "loss");
    out_ << (win ? "You win!\n\n" : "You lose.\n\n");
    return win;
  }

 private:
  void PrintKnowledge(const solver::KnowledgeBase& kb) {
    out_ << "Known mines: " << kb.GetMines().size()
         << "  Known safe: " << kb.GetSafes().size()
         << "  Sentences: " << kb.GetSentences().size() << "\n";
  }

  void PrintSolverAction(const Action& action) {
    out_ << "Solver: "
         << (action.type == Action::Type::UNCOVER ? "uncover " : "flag ")
         << action.cell.row << ' ' << action.cell.col << '\n';
  }

  // Prompts until the player enters a valid command.
  //
  // Returns false if the player quits or the input ends.
  bool GetActionFromPlayer(Action* action) {
    for (;;) {
      out_ << "Command: " << std::flush;

      std::string line;
      if (!std::getline(in_, line)) {
        return false;
      }
      std::istringstream command(line);

      char c = '\0';
      command >> c;
      bool fail = false;
      switch (c) {
        case 'u':
        case 'U':
          action->type = Action::Type::UNCOVER;
          break;
        case 'f':
        case 'F':
          action->type = Action::Type::FLAG;
          break;
        case 'q':
        case 'Q':
          return false;
        default:
          fail = true;
      }
      fail = fail || !(command >> action->cell.row >> action->cell.col);

      if (!fail) {
        return true;
      }
      out_ << "Invalid command.\n";
    }
  }

  std::istream& in_;
  std::ostream& out_;
};

}  // namespace

std::unique_ptr<TextUi> NewTextUi(std::istream& in, std::ostream& out) {
  return std::make_unique<TextUiImpl>(in, out);
}

}  // namespace ui
}  // namespace sweeper
