#pragma once

#include "alltz/core/color_theme.h"

namespace alltz {

enum class ActivityCategory { Work, Awake, Night };

const char* activity_category_name(ActivityCategory c);

// Hour-of-day thresholds and glyphs used to shade the timeline.
//
// Hour ranges are half-open [start, end) and may wrap past midnight
// (e.g. night 22..6). A range with start == end is empty.
struct TimeDisplayConfig {
  int work_hours_start{9};
  int work_hours_end{17};
  int night_hours_start{22};
  int night_hours_end{6};

  char32_t work_char{U'▓'};
  char32_t awake_char{U'▒'};
  char32_t night_char{U'░'};

  ActivityCategory classify(int hour) const;
  char32_t glyph_for(ActivityCategory c) const;
  Color color_for(ActivityCategory c, ColorTheme theme) const;

  // Hour at which date labels are anchored: the middle of the working day.
  int work_midpoint_hour() const { return (work_hours_start + work_hours_end) / 2; }
};

} // namespace alltz
