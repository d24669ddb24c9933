#pragma once

#include <array>
#include <string>

namespace alltz {

// Named terminal colors (the 16 ANSI colors plus the terminal default).
enum class Color {
  Reset,
  Black,
  Red,
  Green,
  Yellow,
  Blue,
  Magenta,
  Cyan,
  Gray,
  DarkGray,
  LightRed,
  LightGreen,
  LightYellow,
  LightBlue,
  LightMagenta,
  LightCyan,
  White,
};

const char* color_name(Color c);

enum class ColorTheme { Default, Ocean, Forest, Sunset, Cyberpunk, Monochrome };

inline constexpr std::array<ColorTheme, 6> kAllColorThemes = {
    ColorTheme::Default, ColorTheme::Ocean,     ColorTheme::Forest,
    ColorTheme::Sunset,  ColorTheme::Cyberpunk, ColorTheme::Monochrome,
};

const char* theme_name(ColorTheme t);
bool theme_from_string(const std::string& s, ColorTheme& out);

Color selected_border_color(ColorTheme t);
Color current_time_color(ColorTheme t);
Color timeline_position_color(ColorTheme t);

} // namespace alltz
