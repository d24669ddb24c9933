#include "alltz/core/activity.h"

namespace alltz {
namespace {

bool in_hour_range(int hour, int start, int end) {
  if (start == end) return false;
  if (start < end) return hour >= start && hour < end;
  return hour >= start || hour < end;
}

struct ActivityPalette {
  Color work;
  Color awake;
  Color night;
};

ActivityPalette palette_for(ColorTheme theme) {
  switch (theme) {
    case ColorTheme::Default: return {Color::Green, Color::Yellow, Color::DarkGray};
    case ColorTheme::Ocean: return {Color::Cyan, Color::Blue, Color::DarkGray};
    case ColorTheme::Forest: return {Color::Green, Color::LightGreen, Color::DarkGray};
    case ColorTheme::Sunset: return {Color::LightRed, Color::Yellow, Color::Magenta};
    case ColorTheme::Cyberpunk: return {Color::LightMagenta, Color::LightCyan, Color::Blue};
    case ColorTheme::Monochrome: return {Color::White, Color::Gray, Color::DarkGray};
  }
  return {Color::Green, Color::Yellow, Color::DarkGray};
}

} // namespace

const char* activity_category_name(ActivityCategory c) {
  switch (c) {
    case ActivityCategory::Work: return "work";
    case ActivityCategory::Awake: return "awake";
    case ActivityCategory::Night: return "night";
  }
  return "awake";
}

ActivityCategory TimeDisplayConfig::classify(int hour) const {
  if (in_hour_range(hour, work_hours_start, work_hours_end)) return ActivityCategory::Work;
  if (in_hour_range(hour, night_hours_start, night_hours_end)) return ActivityCategory::Night;
  return ActivityCategory::Awake;
}

char32_t TimeDisplayConfig::glyph_for(ActivityCategory c) const {
  switch (c) {
    case ActivityCategory::Work: return work_char;
    case ActivityCategory::Awake: return awake_char;
    case ActivityCategory::Night: return night_char;
  }
  return awake_char;
}

Color TimeDisplayConfig::color_for(ActivityCategory c, ColorTheme theme) const {
  const ActivityPalette p = palette_for(theme);
  switch (c) {
    case ActivityCategory::Work: return p.work;
    case ActivityCategory::Awake: return p.awake;
    case ActivityCategory::Night: return p.night;
  }
  return p.awake;
}

} // namespace alltz
