#ifndef SWEEPER_UI_GAME_WINDOW_H_
#define SWEEPER_UI_GAME_WINDOW_H_

#include <memory>

#include <gtkmm/applicationwindow.h>
#include <gtkmm/box.h>
#include <gtkmm/button.h>
#include <gtkmm/label.h>

#include "sweeper/game/difficulty.h"
#include "sweeper/game/game.h"
#include "sweeper/solver/solver.h"
#include "sweeper/ui/mine_field.h"

namespace sweeper {
namespace ui {

// The main window for the game.
class GameWindow : public Gtk::ApplicationWindow {
 public:
  // The seed is used for the first game and incremented for each new game.
  GameWindow(const Difficulty& difficulty, unsigned seed);

 private:
  // Starts a new game.
  void NewGame();

  // Handles an action on the mine field.
  void HandleAction(Action action);

  // Executes one round of the solver's actions.
  void OnAiMove();

  // Shows the game state and what the solver knows.
  void UpdateStatus();

  Gtk::Box box_;
  Gtk::Box button_box_;
  Gtk::Button new_game_button_;
  Gtk::Button ai_move_button_;
  Gtk::Label status_label_;
  MineField mine_field_;

  // Parameters for creating new games.
  const Difficulty difficulty_;
  unsigned seed_;

  // The current game.
  std::unique_ptr<Game> game_;

  // The current solver.
  std::unique_ptr<solver::Solver> solver_;
};

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_GAME_WINDOW_H_
