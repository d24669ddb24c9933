#include "alltz/core/label_placer.h"

#include <algorithm>
#include <utility>

#include "alltz/util/log.h"
#include "alltz/util/strings.h"
#include "alltz/util/time.h"

namespace alltz {

int centered_start(int anchor, int length, int width) {
  const int half = length / 2;
  int start = (anchor >= half) ? anchor - half : 0;
  start = std::min(start, std::max(0, width - length));
  return std::max(0, start);
}

std::vector<DateLabel> date_labels(const TimelineWindow& window, const TimeZone& zone, const TimeDisplayConfig& config,
                                   int width) {
  std::vector<DateLabel> out;
  if (width <= 0) return out;

  const int anchor_hour = config.work_midpoint_hour();
  const CivilDate first = zone.to_local(window.start).date;
  const CivilDate last = zone.to_local(window.end).date;

  for (CivilDate day = first; day <= last; day = day.add_days(1)) {
    CivilDateTime anchor_local;
    anchor_local.date = day;
    anchor_local.hour = anchor_hour;

    const LocalResolution res = zone.resolve_local(anchor_local);
    if (!res.is_unique()) {
      log::debug("Timeline " + zone.id() + ": no date label for " + day.to_string() + " (" +
                 local_resolution_kind_name(res.kind) + " local time)");
      continue;
    }

    DateLabel label;
    label.date = day;
    label.text = format_day_month(day);
    label.length = static_cast<int>(utf8_length(label.text));
    label.anchor = window.time_to_position(res.earliest, width);
    label.start = centered_start(label.anchor, label.length, width);
    out.push_back(std::move(label));
  }
  return out;
}

PlacedLabel time_caption(const TimelineWindow& window, const TimeZone& zone, Instant position, TimeFormat format,
                         int width) {
  PlacedLabel label;
  label.text = format_clock(zone.to_local(position), format);
  label.length = static_cast<int>(utf8_length(label.text));
  label.anchor = window.time_to_position(position, width);
  label.start = centered_start(label.anchor, label.length, width);
  return label;
}

} // namespace alltz
