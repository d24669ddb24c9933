#include "alltz/util/ansi.h"

#include "alltz/util/strings.h"

namespace alltz {

int ansi_fg_code(Color c) {
  switch (c) {
    case Color::Reset: return 39;
    case Color::Black: return 30;
    case Color::Red: return 31;
    case Color::Green: return 32;
    case Color::Yellow: return 33;
    case Color::Blue: return 34;
    case Color::Magenta: return 35;
    case Color::Cyan: return 36;
    case Color::Gray: return 37;
    case Color::DarkGray: return 90;
    case Color::LightRed: return 91;
    case Color::LightGreen: return 92;
    case Color::LightYellow: return 93;
    case Color::LightBlue: return 94;
    case Color::LightMagenta: return 95;
    case Color::LightCyan: return 96;
    case Color::White: return 97;
  }
  return 39;
}

int ansi_bg_code(Color c) { return c == Color::Reset ? 49 : ansi_fg_code(c) + 10; }

std::string buffer_to_ansi(const Buffer& buf, bool color) {
  std::string out;
  for (int y = 0; y < buf.height(); ++y) {
    std::optional<Color> cur_fg;
    std::optional<Color> cur_bg;
    for (int x = 0; x < buf.width(); ++x) {
      const Cell& c = buf.at(x, y);
      if (color && (c.fg != cur_fg || c.bg != cur_bg)) {
        out += "\x1b[0";
        if (c.fg) out += ";" + std::to_string(ansi_fg_code(*c.fg));
        if (c.bg) out += ";" + std::to_string(ansi_bg_code(*c.bg));
        out += "m";
        cur_fg = c.fg;
        cur_bg = c.bg;
      }
      utf8_append(c.glyph.value_or(U' '), out);
    }
    if (color && (cur_fg || cur_bg)) out += "\x1b[0m";
    out += "\n";
  }
  return out;
}

} // namespace alltz
