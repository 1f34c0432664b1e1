#include "sweeper/ui/mine_field.h"

#include <algorithm>
#include <array>

#include <cairomm/enums.h>
#include <cairomm/types.h>
#include <gdkmm/types.h>

namespace sweeper {
namespace ui {

using detail::DrawingDimensions;
using detail::Square;

namespace {

// The size of the frame around the mine field.
constexpr std::size_t kFrameSize = 1;

// The default (and minimum) cell size.
constexpr std::size_t kCellSize = 24;

// Encapsulates a simple RGB color.
struct Color {
  double r;
  double g;
  double b;
};

// The color to use for numbers 1 through 8.
constexpr std::array<Color, 8> kNumberColor{{
    {0.0, 0.0, 1.0},  // 1
    {0.0, 0.5, 0.0},  // 2
    {1.0, 0.0, 0.0},  // 3
    {0.0, 0.0, 0.5},  // 4
    {0.5, 0.0, 0.0},  // 5
    {0.0, 0.5, 0.5},  // 6
    {0.5, 0.0, 0.5},  // 7
    {0.0, 0.0, 0.0},  // 8
}};

// Colors used in widget construction.
constexpr Color kFrameColor{0.5, 0.5, 0.5};
constexpr Color kCellColor{0.76, 0.76, 0.76};
constexpr Color kKnownSafeCellColor{0.70, 0.86, 0.70};
constexpr Color kLosingMineCellColor{1.0, 0.0, 0.0};
constexpr Color kCellBorderColor{0.5, 0.5, 0.5};
constexpr Color kLightBevelColor{1.0, 1.0, 1.0};
constexpr Color kDarkBevelColor{0.5, 0.5, 0.5};
constexpr Color kMineColor{0.0, 0.0, 0.0};
constexpr Color kFlagColor{1.0, 0.0, 0.0};
constexpr Color kBadFlagCrossColor{1.0, 0.0, 0.0};

// Sets the source color in the specified context.
void SetColor(const Cairo::RefPtr<Cairo::Context>& cr, const Color& color) {
  cr->set_source_rgb(color.r, color.g, color.b);
}

// A flyweight class to encapsulate the process of drawing a cell.
class CellDrawFlyweight {
 public:
  CellDrawFlyweight(const Cairo::RefPtr<Cairo::Context>& cr,
                    const DrawingDimensions& dim, const Square& square,
                    const Cell& cell, bool known_safe)
      : cr_(cr),
        dim_(dim),
        square_(square),
        cell_(cell),
        known_safe_(known_safe) {}

  CellDrawFlyweight(const CellDrawFlyweight&) = delete;
  CellDrawFlyweight& operator=(const CellDrawFlyweight&) = delete;

  void Draw() const {
    switch (square_.state) {
      case CellState::UNCOVERED:
        DrawUncovered();
        break;
      case CellState::COVERED:
        DrawCovered(known_safe_ ? kKnownSafeCellColor : kCellColor);
        break;
      case CellState::FLAGGED:
        DrawFlagged();
        break;
      case CellState::MINE:
        DrawEmpty(kCellColor);
        DrawMine();
        break;
      case CellState::LOSING_MINE:
        DrawEmpty(kLosingMineCellColor);
        DrawMine();
        break;
      case CellState::BAD_FLAG:
        DrawBadFlag();
        break;
    }
  }

 private:
  // Fills the cell with the specified color.
  void FillCell(const Color& color) const {
    SetColor(cr_, color);
    cr_->rectangle(0.0, 0.0, dim_.cell_size, dim_.cell_size);
    cr_->fill();
  }

  // Draws a sharp single pixel horizontal line of the specified width.
  void DrawHLine(std::size_t x, std::size_t y, std::size_t width) const {
    cr_->move_to(x + 0.5, y + 0.5);
    cr_->line_to(x + width - 0.5, y + 0.5);
  }

  // Draws a sharp single pixel vertical line of the specified height.
  void DrawVLine(std::size_t x, std::size_t y, std::size_t height) const {
    cr_->move_to(x + 0.5, y + 0.5);
    cr_->line_to(x + 0.5, y + height - 0.5);
  }

  // Draws a character in the center of the cell.
  void DrawChar(char c) const {
    const char str[2] = {c, '\0'};

    cr_->select_font_face("monospace", Cairo::FONT_SLANT_NORMAL,
                          Cairo::FONT_WEIGHT_BOLD);
    cr_->set_font_size(.8 * dim_.cell_size);
    Cairo::TextExtents te;
    cr_->get_text_extents(str, te);

    cr_->move_to(dim_.cell_size / 2.0 - te.width / 2 - te.x_bearing,
                 dim_.cell_size / 2.0 - te.height / 2 - te.y_bearing);
    cr_->show_text(str);
  }

  // Draws an empty cell.
  void DrawEmpty(const Color& color) const {
    FillCell(color);
    SetColor(cr_, kCellBorderColor);
    if (cell_.row != 0) {
      DrawHLine(0, 0, dim_.cell_size);
    }
    if (cell_.col != 0) {
      DrawVLine(0, 0, dim_.cell_size);
    }
    cr_->stroke();
  }

  // Draws a cell in the UNCOVERED state with the number of adjacent mines.
  void DrawUncovered() const {
    DrawEmpty(kCellColor);
    if (square_.adjacent_mines > 0 && square_.adjacent_mines <= 8) {
      SetColor(cr_, kNumberColor[square_.adjacent_mines - 1]);
      DrawChar(static_cast<char>('0' + square_.adjacent_mines));
    }
  }

  // Draws a raised cell.
  void DrawCovered(const Color& color) const {
    FillCell(color);

    // Light bevel on top and left.
    SetColor(cr_, kLightBevelColor);
    DrawHLine(0, 0, dim_.cell_size - 1);
    DrawHLine(0, 1, dim_.cell_size - 2);
    DrawVLine(0, 0, dim_.cell_size - 1);
    DrawVLine(1, 0, dim_.cell_size - 2);
    cr_->stroke();

    // Dark bevel on bottom and right.
    SetColor(cr_, kDarkBevelColor);
    DrawHLine(1, dim_.cell_size - 1, dim_.cell_size - 1);
    DrawHLine(2, dim_.cell_size - 2, dim_.cell_size - 2);
    DrawVLine(dim_.cell_size - 1, 1, dim_.cell_size - 1);
    DrawVLine(dim_.cell_size - 2, 2, dim_.cell_size - 2);
    cr_->stroke();
  }

  // Draws a mine in unit coordinates scaled to the cell.
  void DrawMine() const {
    cr_->save();
    cr_->scale(dim_.cell_size, dim_.cell_size);
    SetColor(cr_, kMineColor);
    cr_->arc(0.5, 0.5, 0.25, 0.0, 2.0 * 3.14159265358979);
    cr_->fill();
    cr_->restore();
  }

  // Draws a cell in the FLAGGED state.
  void DrawFlagged() const {
    DrawCovered(kCellColor);

    cr_->save();
    cr_->scale(dim_.cell_size, dim_.cell_size);
    SetColor(cr_, kFlagColor);
    cr_->move_to(0.35, 0.2);
    cr_->line_to(0.75, 0.38);
    cr_->line_to(0.35, 0.56);
    cr_->close_path();
    cr_->fill();

    SetColor(cr_, kMineColor);
    cr_->set_line_width(.06);
    cr_->move_to(0.35, 0.2);
    cr_->line_to(0.35, 0.8);
    cr_->stroke();
    cr_->restore();
  }

  // Draws a cell in the BAD_FLAG state.
  void DrawBadFlag() const {
    DrawFlagged();
    cr_->save();
    SetColor(cr_, kBadFlagCrossColor);
    cr_->scale(dim_.cell_size, dim_.cell_size);
    cr_->set_line_width(.15);
    cr_->set_line_cap(Cairo::LINE_CAP_ROUND);

    const double margin = .15;
    cr_->move_to(margin, margin);
    cr_->line_to(1.0 - margin, 1.0 - margin);
    cr_->move_to(margin, 1.0 - margin);
    cr_->line_to(1.0 - margin, margin);
    cr_->stroke();

    cr_->restore();
  }

  const Cairo::RefPtr<Cairo::Context>& cr_;
  const DrawingDimensions& dim_;
  const Square& square_;
  const Cell cell_;
  const bool known_safe_;
};

}  // namespace

MineField::MineField()
    : kb_(nullptr),
      dim_{0, 0, 0, 0, kCellSize},
      has_pressed_cell_(false),
      pressed_cell_{0, 0} {
  add_events(Gdk::BUTTON_PRESS_MASK | Gdk::BUTTON_RELEASE_MASK);
}

void MineField::Reset(Game& game) {
  game.Subscribe(this);

  grid_.Reset(game.GetDimensions().rows, game.GetDimensions().cols);
  kb_ = nullptr;

  const int min_width = kCellSize * grid_.GetCols() + 2 * kFrameSize;
  const int min_height = kCellSize * grid_.GetRows() + 2 * kFrameSize;
  set_size_request(min_width, min_height);

  UpdateDrawingDimensions(std::max(min_width, get_allocated_width()),
                          std::max(min_height, get_allocated_height()));

  has_pressed_cell_ = false;

  queue_draw();

  // Note: Any connections to signal_action will remain valid.
}

void MineField::SetKnowledgeBase(const solver::KnowledgeBase* kb) {
  kb_ = kb;
  queue_draw();
}

void MineField::NotifyEvent(const Event& event) {
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
      break;
    case Event::Type::LOSS:
      square.state = CellState::LOSING_MINE;
      break;
    case Event::Type::REVEAL:
      square.state = event.revealed;
      break;
  }
  QueueDrawCell(event.cell);
}

void MineField::on_size_allocate(Gtk::Allocation& allocation) {
  Gtk::DrawingArea::on_size_allocate(allocation);
  UpdateDrawingDimensions(allocation.get_width(), allocation.get_height());
}

bool MineField::on_draw(const Cairo::RefPtr<Cairo::Context>& cr) {
  // Defaults for drawing lines.
  cr->set_line_width(1);
  cr->set_line_cap(Cairo::LINE_CAP_SQUARE);

  cr->save();
  cr->translate(dim_.x, dim_.y);
  DrawFrame(cr);
  cr->restore();

  grid_.ForEach([this, &cr](const Cell& cell, const Square& square) {
    const bool known_safe =
        kb_ != nullptr && kb_->GetSafes().count(cell) != 0;

    cr->save();
    cr->translate(GetCellX(cell.col), GetCellY(cell.row));
    CellDrawFlyweight(cr, dim_, square, cell, known_safe).Draw();
    cr->restore();
  });

  return false;
}

bool MineField::on_button_press_event(GdkEventButton* event) {
  if (event->type != GDK_BUTTON_PRESS) {
    return false;
  }
  has_pressed_cell_ = GetCellFromPoint(event->x, event->y, &pressed_cell_);
  return false;
}

bool MineField::on_button_release_event(GdkEventButton* event) {
  if (!has_pressed_cell_) {
    return false;
  }
  has_pressed_cell_ = false;

  // Only a release in the same cell that was pressed counts as a click.
  Cell cell{0, 0};
  if (!GetCellFromPoint(event->x, event->y, &cell) || cell != pressed_cell_) {
    return false;
  }

  if (event->button == 1) {
    signal_action_.emit(Action{Action::Type::UNCOVER, cell});
  } else if (event->button == 3) {
    signal_action_.emit(Action{Action::Type::FLAG, cell});
  }
  return false;
}

bool MineField::GetCellFromPoint(double x, double y, Cell* cell) const {
  if (x < 0 || y < 0 || dim_.cell_size == 0) {
    return false;
  }

  const std::size_t ux = static_cast<std::size_t>(x);
  const std::size_t uy = static_cast<std::size_t>(y);
  const std::size_t min_x = dim_.x + kFrameSize;
  const std::size_t min_y = dim_.y + kFrameSize;
  if (ux < min_x || uy < min_y) {
    return false;
  }

  const Cell result{(uy - min_y) / dim_.cell_size,
                    (ux - min_x) / dim_.cell_size};
  if (!grid_.IsValid(result)) {
    return false;
  }
  *cell = result;
  return true;
}

std::size_t MineField::GetCellX(std::size_t col) const {
  return dim_.x + kFrameSize + col * dim_.cell_size;
}

std::size_t MineField::GetCellY(std::size_t row) const {
  return dim_.y + kFrameSize + row * dim_.cell_size;
}

void MineField::QueueDrawCell(const Cell& cell) {
  queue_draw_area(GetCellX(cell.col), GetCellY(cell.row), dim_.cell_size,
                  dim_.cell_size);
}

void MineField::UpdateDrawingDimensions(int width, int height) {
  const std::size_t rows = grid_.GetRows();
  const std::size_t cols = grid_.GetCols();
  if (rows == 0 || cols == 0 || width <= static_cast<int>(2 * kFrameSize) ||
      height <= static_cast<int>(2 * kFrameSize)) {
    return;
  }

  dim_.cell_size = std::min((width - 2 * kFrameSize) / cols,
                            (height - 2 * kFrameSize) / rows);
  dim_.width = dim_.cell_size * cols + 2 * kFrameSize;
  dim_.height = dim_.cell_size * rows + 2 * kFrameSize;

  // Center the part of the drawing area we are actually using within the
  // total available space.
  dim_.x = width / 2 - dim_.width / 2;
  dim_.y = height / 2 - dim_.height / 2;
}

void MineField::DrawFrame(const Cairo::RefPtr<Cairo::Context>& cr) const {
  SetColor(cr, kFrameColor);
  cr->rectangle(0.0, 0.0, dim_.width, kFrameSize);
  cr->rectangle(0.0, 0.0, kFrameSize, dim_.height);
  cr->rectangle(0.0, dim_.height - kFrameSize, dim_.width, kFrameSize);
  cr->rectangle(dim_.width - kFrameSize, 0.0, kFrameSize, dim_.height);
  cr->fill();
}

}  // namespace ui
}  // namespace sweeper
