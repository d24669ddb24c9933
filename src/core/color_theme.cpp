#include "alltz/core/color_theme.h"

#include "alltz/util/strings.h"

namespace alltz {

const char* color_name(Color c) {
  switch (c) {
    case Color::Reset: return "reset";
    case Color::Black: return "black";
    case Color::Red: return "red";
    case Color::Green: return "green";
    case Color::Yellow: return "yellow";
    case Color::Blue: return "blue";
    case Color::Magenta: return "magenta";
    case Color::Cyan: return "cyan";
    case Color::Gray: return "gray";
    case Color::DarkGray: return "dark_gray";
    case Color::LightRed: return "light_red";
    case Color::LightGreen: return "light_green";
    case Color::LightYellow: return "light_yellow";
    case Color::LightBlue: return "light_blue";
    case Color::LightMagenta: return "light_magenta";
    case Color::LightCyan: return "light_cyan";
    case Color::White: return "white";
  }
  return "reset";
}

const char* theme_name(ColorTheme t) {
  switch (t) {
    case ColorTheme::Default: return "default";
    case ColorTheme::Ocean: return "ocean";
    case ColorTheme::Forest: return "forest";
    case ColorTheme::Sunset: return "sunset";
    case ColorTheme::Cyberpunk: return "cyberpunk";
    case ColorTheme::Monochrome: return "monochrome";
  }
  return "default";
}

bool theme_from_string(const std::string& s, ColorTheme& out) {
  const std::string v = to_lower(trim_copy(s));
  for (ColorTheme t : kAllColorThemes) {
    if (v == theme_name(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

Color selected_border_color(ColorTheme t) {
  switch (t) {
    case ColorTheme::Default: return Color::Yellow;
    case ColorTheme::Ocean: return Color::LightCyan;
    case ColorTheme::Forest: return Color::LightGreen;
    case ColorTheme::Sunset: return Color::LightRed;
    case ColorTheme::Cyberpunk: return Color::LightMagenta;
    case ColorTheme::Monochrome: return Color::White;
  }
  return Color::Yellow;
}

Color current_time_color(ColorTheme t) {
  switch (t) {
    case ColorTheme::Default: return Color::Red;
    case ColorTheme::Ocean: return Color::LightYellow;
    case ColorTheme::Forest: return Color::LightRed;
    case ColorTheme::Sunset: return Color::White;
    case ColorTheme::Cyberpunk: return Color::LightGreen;
    case ColorTheme::Monochrome: return Color::White;
  }
  return Color::Red;
}

Color timeline_position_color(ColorTheme t) {
  switch (t) {
    case ColorTheme::Default: return Color::Cyan;
    case ColorTheme::Ocean: return Color::White;
    case ColorTheme::Forest: return Color::Yellow;
    case ColorTheme::Sunset: return Color::LightYellow;
    case ColorTheme::Cyberpunk: return Color::LightCyan;
    case ColorTheme::Monochrome: return Color::Gray;
  }
  return Color::Cyan;
}

} // namespace alltz
