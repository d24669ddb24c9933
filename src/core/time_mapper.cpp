#include "alltz/core/time_mapper.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace alltz {

int TimelineWindow::time_to_position(Instant t, int width) const {
  if (width <= 0) return 0;
  const std::int64_t total = duration().count();
  if (total == 0) return 0;

  const double ratio = static_cast<double>((t - start).count()) / static_cast<double>(total);
  const double column = std::round(ratio * static_cast<double>(width));
  if (column <= 0.0) return 0;
  if (column >= static_cast<double>(width - 1)) return width - 1;
  return static_cast<int>(column);
}

Instant TimelineWindow::column_to_time(int column, int width) const {
  if (width <= 0) return start;
  const double hours = (static_cast<double>(column) / static_cast<double>(width)) *
                       std::chrono::duration<double, std::ratio<3600>>(duration()).count();
  const auto minutes = static_cast<std::int64_t>(hours * 60.0);
  return start + std::chrono::minutes(minutes);
}

std::vector<TrackCell> timeline_display(const TimelineWindow& window, const TimeZone& zone,
                                        const TimeDisplayConfig& config, ColorTheme theme, int width) {
  std::vector<TrackCell> out;
  if (width <= 0) return out;
  out.reserve(static_cast<std::size_t>(width));
  for (int i = 0; i < width; ++i) {
    TrackCell c;
    c.local_hour = zone.to_local(window.column_to_time(i, width)).hour;
    c.category = config.classify(c.local_hour);
    c.glyph = config.glyph_for(c.category);
    c.color = config.color_for(c.category, theme);
    out.push_back(c);
  }
  return out;
}

} // namespace alltz
