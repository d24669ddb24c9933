#pragma once

#include <optional>
#include <string>
#include <vector>

#include "alltz/core/activity.h"
#include "alltz/core/civil_time.h"
#include "alltz/core/display_options.h"
#include "alltz/core/time_mapper.h"
#include "alltz/core/time_zone.h"

namespace alltz {

// Start column for a label of `length` cells centered on `anchor` in a track
// of `width` cells: anchor - length/2, floored at 0, then pulled left so the
// label ends inside the track. A label wider than the track starts at 0 and is
// cut at the right edge when drawn.
int centered_start(int anchor, int length, int width);

struct PlacedLabel {
  std::string text;
  int anchor{0};
  int start{0};
  int length{0};
};

struct DateLabel : PlacedLabel {
  CivilDate date;
};

// One "DD Mon" label per local calendar day touched by the window, anchored at
// the middle of that day's working hours. Days whose anchor wall-clock time is
// skipped or repeated by a DST change get no label.
std::vector<DateLabel> date_labels(const TimelineWindow& window, const TimeZone& zone, const TimeDisplayConfig& config,
                                   int width);

// "HH:MM Www" / "hh:mm AM Www" for `position` in `zone`, centered on the
// column of `position`.
PlacedLabel time_caption(const TimelineWindow& window, const TimeZone& zone, Instant position, TimeFormat format,
                         int width);

} // namespace alltz
