#ifndef SWEEPER_UI_MINE_FIELD_H_
#define SWEEPER_UI_MINE_FIELD_H_

#include <cstddef>

#include <cairomm/context.h>
#include <cairomm/refptr.h>
#include <gtkmm/drawingarea.h>
#include <sigc++/signal.h>

#include "sweeper/game/game.h"
#include "sweeper/game/grid.h"
#include "sweeper/solver/knowledge_base.h"

namespace sweeper {
namespace ui {

namespace detail {

// The dimensions of the actual area upon which the mine field will be drawn.
// This is a subset of the actual allocated area.
struct DrawingDimensions {
  std::size_t x;
  std::size_t y;
  std::size_t width;
  std::size_t height;
  std::size_t cell_size;
};

// A representation of the GUI's knowledge about a cell.
struct Square {
  CellState state = CellState::COVERED;
  std::size_t adjacent_mines = 0;
};

}  // namespace detail

// A mine field widget.
//
// Cells that the attached knowledge base has proven safe are tinted while
// they are still covered.
class MineField : public Gtk::DrawingArea, public EventSubscriber {
 public:
  MineField();

  // Resets the internal state for a new game and subscribes to it.
  void Reset(Game& game);

  // Sets the knowledge base used to tint cells. May be nullptr.
  void SetKnowledgeBase(const solver::KnowledgeBase* kb);

  // Updates the visual state based on the event.
  void NotifyEvent(const Event& event) final;

  // The signal sent when an Action is peformed on the mine field.
  //
  // Left click uncovers a cell, right click toggles its flag.
  sigc::signal<void, Action>& signal_action() { return signal_action_; }

 protected:
  // Recomputes the drawing dimensions.
  void on_size_allocate(Gtk::Allocation& allocation) final;

  // Draws the widget.
  bool on_draw(const Cairo::RefPtr<Cairo::Context>& cr) final;

  // Handles mouse button presses.
  bool on_button_press_event(GdkEventButton* event) final;

  // Handles mouse button releases.
  bool on_button_release_event(GdkEventButton* event) final;

 private:
  // Computes the cell from mouse event coordinates.
  //
  // Returns false if the point is not on a cell.
  bool GetCellFromPoint(double x, double y, Cell* cell) const;

  // Computes the x coordinate, in pixels, of cells in the specified column.
  std::size_t GetCellX(std::size_t col) const;

  // Computes the y coordinate, in pixels, of cells in the specified row.
  std::size_t GetCellY(std::size_t row) const;

  // Requests a redraw clipped to the specified cell.
  void QueueDrawCell(const Cell& cell);

  // Recomputes the drawing dimensions.
  void UpdateDrawingDimensions(int width, int height);

  // Draws the frame surrounding the mine field.
  void DrawFrame(const Cairo::RefPtr<Cairo::Context>& cr) const;

  // Knowledge about the grid of cells.
  Grid<detail::Square> grid_;

  // The knowledge base used for tinting, if any.
  const solver::KnowledgeBase* kb_;

  // Drawing dimensions, updated each time the widget is allocated.
  detail::DrawingDimensions dim_;

  // The cell under the mouse when a button was pressed.
  bool has_pressed_cell_;
  Cell pressed_cell_;

  // Signal emitted when an action occurs.
  sigc::signal<void, Action> signal_action_;
};

}  // namespace ui
}  // namespace sweeper

#endif  // SWEEPER_UI_MINE_FIELD_H_
