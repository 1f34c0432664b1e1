#include "sweeper/ui/game_window.h"

#include <sstream>
#include <utility>
#include <vector>

#include <sigc++/functors/mem_fun.h>
#include <spdlog/spdlog.h>

#include "sweeper/solver/knowledge_base.h"

namespace sweeper {
namespace ui {

GameWindow::GameWindow(const Difficulty& difficulty, unsigned seed)
    : box_(Gtk::ORIENTATION_VERTICAL),
      button_box_(Gtk::ORIENTATION_HORIZONTAL),
      new_game_button_("New Game"),
      ai_move_button_("AI Move"),
      difficulty_(difficulty),
      seed_(seed) {
  set_title("Sweeper");

  button_box_.pack_start(new_game_button_, Gtk::PACK_SHRINK);
  button_box_.pack_start(ai_move_button_, Gtk::PACK_SHRINK);
  box_.pack_start(button_box_, Gtk::PACK_SHRINK);
  box_.pack_start(mine_field_, Gtk::PACK_EXPAND_WIDGET);
  box_.pack_start(status_label_, Gtk::PACK_SHRINK);
  add(box_);

  mine_field_.signal_action().connect(
      sigc::mem_fun(this, &GameWindow::HandleAction));
  new_game_button_.signal_clicked().connect(
      sigc::mem_fun(this, &GameWindow::NewGame));
  ai_move_button_.signal_clicked().connect(
      sigc::mem_fun(this, &GameWindow::OnAiMove));

  NewGame();
  show_all_children();
}

void GameWindow::NewGame() {
  auto game = sweeper::NewGame(difficulty_, seed_);
  if (!game) {
    spdlog::error("Cannot create a {}x{} game with {} mines",
                  difficulty_.rows, difficulty_.cols, difficulty_.mines);
    return;
  }
  spdlog::info("New {}x{} game with {} mines, seed {}", difficulty_.rows,
               difficulty_.cols, difficulty_.mines, seed_);

  // The old solver and mine field subscriptions die with the old game.
  solver_.reset();
  game_ = std::move(game);
  solver_ = solver::New(solver::Algorithm::KNOWLEDGE, *game_, seed_);
  ++seed_;

  mine_field_.Reset(*game_);
  mine_field_.SetKnowledgeBase(&solver_->GetKnowledgeBase());
  UpdateStatus();
}

void GameWindow::HandleAction(Action action) {
  if (!game_) {
    return;
  }
  game_->Execute(action);
  UpdateStatus();
}

void GameWindow::OnAiMove() {
  if (!game_) {
    return;
  }
  std::vector<Action> actions = solver_->Analyze();
  if (actions.empty()) {
    spdlog::debug("Solver has no move");
  }
  game_->Execute(actions);
  UpdateStatus();
}

void GameWindow::UpdateStatus() {
  const solver::KnowledgeBase& kb = solver_->GetKnowledgeBase();

  std::ostringstream status;
  switch (game_->GetState()) {
    case Game::State::WIN:
      status << "You win!  ";
      break;
    case Game::State::LOSS:
      status << "You lose.  ";
      break;
    case Game::State::NEW:
    case Game::State::PLAYING:
      break;
  }
  status << "Known mines: " << kb.GetMines().size()
         << "  Known safe: " << kb.GetSafes().size();
  status_label_.set_text(status.str());

  // Newly proven safe cells change their tint.
  mine_field_.queue_draw();
}

}  // namespace ui
}  // namespace sweeper
