#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "alltz/core/color_theme.h"

namespace alltz {

// Screen rectangle in cell coordinates.
struct Rect {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  // Shrinks the rectangle by `margin` cells on every side; never negative.
  Rect inner(int margin) const;

  int right() const { return x + width; }
  int bottom() const { return y + height; }
  bool empty() const { return width <= 0 || height <= 0; }
};

// One terminal cell. Unset fields leave whatever the terminal shows there.
struct Cell {
  std::optional<char32_t> glyph;
  std::optional<Color> fg;
  std::optional<Color> bg;

  bool operator==(const Cell& rhs) const { return glyph == rhs.glyph && fg == rhs.fg && bg == rhs.bg; }
};

// Caller-owned grid of cells the renderer writes into.
class Buffer {
 public:
  Buffer() = default;
  Buffer(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }
  Rect area() const { return Rect{0, 0, width_, height_}; }

  bool in_bounds(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }

  // Throws std::out_of_range outside the grid.
  Cell& at(int x, int y);
  const Cell& at(int x, int y) const;

  // Writes outside the grid are ignored.
  void set_glyph(int x, int y, char32_t glyph, std::optional<Color> fg = std::nullopt);
  void set_bg(int x, int y, Color bg);

  // Draws UTF-8 text starting at (x, y), one code point per cell, stopping at
  // column `max_x` (exclusive; -1 means the buffer edge). Returns cells written.
  int set_string(int x, int y, std::string_view text, std::optional<Color> fg = std::nullopt,
                 std::optional<Color> bg = std::nullopt, int max_x = -1);

  // Row contents as UTF-8; cells without a glyph read as spaces.
  std::string row_text(int y) const;

 private:
  int width_{0};
  int height_{0};
  std::vector<Cell> cells_;
};

// Single-line box around `area` with `title` on the top border.
// Border cells get `border_color` when set.
void draw_block(Buffer& buf, const Rect& area, const std::string& title, std::optional<Color> border_color);

} // namespace alltz
