#pragma once

#include <chrono>
#include <vector>

#include "alltz/core/activity.h"
#include "alltz/core/civil_time.h"
#include "alltz/core/time_zone.h"

namespace alltz {

// The 48-hour interval a timeline shows: [position - 24h, position + 24h].
//
// The window depends only on the scrub position, never on the current time.
struct TimelineWindow {
  static constexpr std::chrono::hours kHalfSpan{24};

  Instant start{};
  Instant end{};

  static TimelineWindow around(Instant position) { return {position - kHalfSpan, position + kHalfSpan}; }

  std::chrono::seconds duration() const { return end - start; }

  // Half-open membership test: start <= t < end.
  bool contains(Instant t) const { return t >= start && t < end; }

  // Maps an instant to a column in [0, width - 1]. Monotonic and saturating:
  // instants before `start` map to 0, instants at or after `end` to width - 1.
  // A zero-length window maps everything to column 0.
  int time_to_position(Instant t, int width) const;

  // Inverse direction: the instant at fraction column/width of the window,
  // truncated to whole minutes from `start`.
  Instant column_to_time(int column, int width) const;
};

// Background glyph of one timeline column.
struct TrackCell {
  char32_t glyph{U' '};
  Color color{Color::Reset};
  int local_hour{0};
  ActivityCategory category{ActivityCategory::Awake};
};

// Shades every column of a `width`-column track by the activity category of
// the local hour (in `zone`) that the column represents.
std::vector<TrackCell> timeline_display(const TimelineWindow& window, const TimeZone& zone,
                                        const TimeDisplayConfig& config, ColorTheme theme, int width);

} // namespace alltz
