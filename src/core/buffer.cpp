#include "alltz/core/buffer.h"

#include <algorithm>
#include <stdexcept>

#include "alltz/util/strings.h"

namespace alltz {

Rect Rect::inner(int margin) const {
  Rect r;
  r.x = x + margin;
  r.y = y + margin;
  r.width = std::max(0, width - 2 * margin);
  r.height = std::max(0, height - 2 * margin);
  return r;
}

Buffer::Buffer(int width, int height) : width_(std::max(0, width)), height_(std::max(0, height)) {
  cells_.assign(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), Cell{});
}

Cell& Buffer::at(int x, int y) {
  if (!in_bounds(x, y)) {
    throw std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) + ") outside buffer");
  }
  return cells_[static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)];
}

const Cell& Buffer::at(int x, int y) const {
  if (!in_bounds(x, y)) {
    throw std::out_of_range("cell (" + std::to_string(x) + ", " + std::to_string(y) + ") outside buffer");
  }
  return cells_[static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x)];
}

void Buffer::set_glyph(int x, int y, char32_t glyph, std::optional<Color> fg) {
  if (!in_bounds(x, y)) return;
  Cell& c = at(x, y);
  c.glyph = glyph;
  if (fg) c.fg = fg;
}

void Buffer::set_bg(int x, int y, Color bg) {
  if (!in_bounds(x, y)) return;
  at(x, y).bg = bg;
}

int Buffer::set_string(int x, int y, std::string_view text, std::optional<Color> fg, std::optional<Color> bg,
                       int max_x) {
  const int limit = (max_x < 0) ? width_ : std::min(max_x, width_);
  int written = 0;
  int cx = x;
  for (char32_t cp : utf8_decode(text)) {
    if (cx >= limit) break;
    if (in_bounds(cx, y)) {
      Cell& c = at(cx, y);
      c.glyph = cp;
      if (fg) c.fg = fg;
      if (bg) c.bg = bg;
      ++written;
    }
    ++cx;
  }
  return written;
}

std::string Buffer::row_text(int y) const {
  std::string out;
  if (y < 0 || y >= height_) return out;
  for (int x = 0; x < width_; ++x) utf8_append(at(x, y).glyph.value_or(U' '), out);
  return out;
}

void draw_block(Buffer& buf, const Rect& area, const std::string& title, std::optional<Color> border_color) {
  if (area.width < 2 || area.height < 2) return;
  const int l = area.x;
  const int r = area.right() - 1;
  const int t = area.y;
  const int b = area.bottom() - 1;

  for (int x = l + 1; x < r; ++x) {
    buf.set_glyph(x, t, U'─', border_color);
    buf.set_glyph(x, b, U'─', border_color);
  }
  for (int y = t + 1; y < b; ++y) {
    buf.set_glyph(l, y, U'│', border_color);
    buf.set_glyph(r, y, U'│', border_color);
  }
  buf.set_glyph(l, t, U'┌', border_color);
  buf.set_glyph(r, t, U'┐', border_color);
  buf.set_glyph(l, b, U'└', border_color);
  buf.set_glyph(r, b, U'┘', border_color);

  // Title sits on the top border between the corners.
  if (!title.empty()) buf.set_string(l + 1, t, title, border_color, std::nullopt, r);
}

} // namespace alltz
