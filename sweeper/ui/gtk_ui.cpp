#include "sweeper/ui/gtk_ui.h"

#include <memory>

#include <gtkmm/window.h>

#include "sweeper/ui/game_window.h"

namespace sweeper {
namespace ui {

namespace {

constexpr const char* kApplicationId = "com.github.sweeper";

// The master GTK application.
class SweeperApplication : public Gtk::Application {
 public:
  SweeperApplication(const Difficulty& difficulty, unsigned seed)
      : Gtk::Application(kApplicationId),
        difficulty_(difficulty),
        seed_(seed) {}

 private:
  // Handler for the activate signal. Creates the game window.
  void on_activate() final {
    Gtk::Application::on_activate();

    // Activating a running application only raises the existing window.
    if (window_) {
      window_->present();
      return;
    }
    window_ = std::make_unique<GameWindow>(difficulty_, seed_);
    add_window(*window_);
    window_->present();
  }

  const Difficulty difficulty_;
  const unsigned seed_;
  std::unique_ptr<GameWindow> window_;
};

}  // namespace

Glib::RefPtr<Gtk::Application> NewGtkUi(const Difficulty& difficulty,
                                        unsigned seed) {
  return Glib::RefPtr<Gtk::Application>(
      new SweeperApplication(difficulty, seed));
}

}  // namespace ui
}  // namespace sweeper
