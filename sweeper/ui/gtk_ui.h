#ifndef SWEEPER_UI_GTK_UI_H_
#define SWEEPER_UI_GTK_UI_H_

#include <glibmm/refptr.h>
#include <gtkmm/application.h>

#include "sweeper/game/difficulty.h"

namespace sweeper {
namespace ui {

// Creates a new GTK application that will create and manage the game.
//
// To create and start an application:
//   sweeper::ui::NewGtkUi(difficulty, seed)->run();
Glib::RefPtr<Gtk::Application> NewGtkUi(const Difficulty& difficulty,
                                        unsigned seed);

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_GTK_UI_H_
