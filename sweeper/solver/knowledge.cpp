#include "sweeper/solver/knowledge.h"

#include <set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "sweeper/solver/knowledge_base.h"

namespace sweeper {
namespace solver {
namespace knowledge {

namespace {

class KnowledgeSolver : public Solver {
 public:
  KnowledgeSolver(const Game& game, const Options& options,
                  std::unique_ptr<RandomSource> random)
      : options_(options),
        random_(std::move(random)),
        kb_(game.GetDimensions().rows, game.GetDimensions().cols),
        game_over_(false) {}

  ~KnowledgeSolver() final = default;

  std::vector<Action> Analyze() final {
    std::vector<Action> actions;
    if (game_over_) {
      return actions;
    }

    // Flag the mines we have found. FLAG is a toggle, so only cells that are
    // not already flagged get an action.
    for (const Cell& cell : kb_.GetMines()) {
      if (flagged_.find(cell) == flagged_.end()) {
        actions.push_back(Action{Action::Type::FLAG, cell});
      }
    }

    Cell move{0, 0};
    if (kb_.ChooseSafeMove(&move)) {
      spdlog::debug("Uncovering safe cell ({}, {})", move.row, move.col);
      AddUncover(move, actions);
    } else if (options_.guess && kb_.ChooseRandomMove(*random_, &move)) {
      spdlog::debug("No safe cell known, guessing ({}, {})", move.row,
                    move.col);
      AddUncover(move, actions);
    }
    return actions;
  }

  void NotifyEvent(const Event& event) final {
    switch (event.type) {
      case Event::Type::UNCOVER:
        if (!kb_.Observe(event.cell, event.adjacent_mines)) {
          spdlog::error("Knowledge base rejected ({}, {}) = {}",
                        event.cell.row, event.cell.col, event.adjacent_mines);
        }
        break;
      case Event::Type::FLAG:
        flagged_.insert(event.cell);
        break;
      case Event::Type::UNFLAG:
        flagged_.erase(event.cell);
        break;
      case Event::Type::WIN:
      case Event::Type::LOSS:
        game_over_ = true;
        break;
      case Event::Type::REVEAL:
        // No new knowledge.
        break;
    }
  }

  const KnowledgeBase& GetKnowledgeBase() const final { return kb_; }

 private:
  // Adds an action to uncover the cell. The game refuses to uncover flagged
  // cells, so a flag the player placed there is removed first.
  void AddUncover(const Cell& cell, std::vector<Action>& actions) const {
    if (flagged_.find(cell) != flagged_.end()) {
      actions.push_back(Action{Action::Type::FLAG, cell});
    }
    actions.push_back(Action{Action::Type::UNCOVER, cell});
  }

  const Options options_;
  std::unique_ptr<RandomSource> random_;
  KnowledgeBase kb_;

  // Cells currently flagged in the game.
  std::set<Cell> flagged_;

  bool game_over_;
};

}  // namespace

std::unique_ptr<Solver> New(Game& game, const Options& options,
                            std::unique_ptr<RandomSource> random) {
  std::unique_ptr<Solver> solver =
      std::make_unique<KnowledgeSolver>(game, options, std::move(random));
  game.Subscribe(solver.get());
  return solver;
}

}  // namespace knowledge
}  // namespace solver
}  // namespace sweeper
