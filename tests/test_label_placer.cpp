#include <iostream>
#include <string>
#include <vector>

#include "alltz/core/label_placer.h"
#include "alltz/core/zone_catalog.h"

#define ALLTZ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_label_placer() {
  using alltz::centered_start;
  using alltz::instant_from_unix;

  // Centering and clamping.
  ALLTZ_ASSERT(centered_start(50, 6, 100) == 47);
  ALLTZ_ASSERT(centered_start(2, 6, 100) == 0);
  ALLTZ_ASSERT(centered_start(0, 6, 100) == 0);
  ALLTZ_ASSERT(centered_start(99, 6, 100) == 94);
  ALLTZ_ASSERT(centered_start(3, 4, 4) == 0);
  // Wider than the track: starts at the left edge.
  ALLTZ_ASSERT(centered_start(5, 10, 4) == 0);
  ALLTZ_ASSERT(centered_start(0, 10, 4) == 0);

  // Every label that fits stays inside the track, whatever its anchor.
  for (int width = 1; width <= 60; ++width) {
    for (int length = 1; length <= width + 3; ++length) {
      for (int anchor = 0; anchor < width; ++anchor) {
        const int start = centered_start(anchor, length, width);
        ALLTZ_ASSERT(start >= 0);
        if (length <= width) {
          ALLTZ_ASSERT(start + length <= width);
        } else {
          ALLTZ_ASSERT(start == 0);
        }
      }
    }
  }

  const auto catalog = alltz::ZoneCatalog::with_builtin_zones();
  const auto window = alltz::TimelineWindow::around(instant_from_unix(1772971200)); // 2026-03-08T12:00Z

  // UTC with default hours: anchors at 13:00 on each of the three days.
  {
    const auto utc = catalog.load("UTC");
    const alltz::TimeDisplayConfig cfg;
    const auto labels = alltz::date_labels(window, *utc, cfg, 100);
    ALLTZ_ASSERT(labels.size() == 3);
    ALLTZ_ASSERT(labels[0].text == "07 Mar");
    ALLTZ_ASSERT(labels[0].anchor == 2);
    ALLTZ_ASSERT(labels[0].start == 0);
    ALLTZ_ASSERT(labels[1].text == "08 Mar");
    ALLTZ_ASSERT(labels[1].anchor == 52);
    ALLTZ_ASSERT(labels[1].start == 49);
    ALLTZ_ASSERT(labels[1].length == 6);
    ALLTZ_ASSERT(labels[2].text == "09 Mar");
    ALLTZ_ASSERT(labels[2].anchor == 99);
    ALLTZ_ASSERT(labels[2].start == 94);
    for (const auto& l : labels) {
      ALLTZ_ASSERT(l.start >= 0);
      ALLTZ_ASSERT(l.start + l.length <= 100);
    }
    ALLTZ_ASSERT(alltz::date_labels(window, *utc, cfg, 0).empty());
  }

  // New York with working hours 01-03: the 02:00 anchor of 08 Mar falls in
  // the skipped hour, so that day has no label.
  {
    const auto ny = catalog.load("America/New_York");
    alltz::TimeDisplayConfig cfg;
    cfg.work_hours_start = 1;
    cfg.work_hours_end = 3;
    ALLTZ_ASSERT(cfg.work_midpoint_hour() == 2);

    const auto labels = alltz::date_labels(window, *ny, cfg, 96);
    ALLTZ_ASSERT(labels.size() == 2);
    ALLTZ_ASSERT(labels[0].text == "07 Mar");
    ALLTZ_ASSERT(labels[1].text == "09 Mar");
    ALLTZ_ASSERT(labels[0].date < labels[1].date);
  }

  // New York with working hours 01-02: 01:00 on 01 Nov happens twice when the
  // clocks fall back, so that day has no label either.
  {
    const auto ny = catalog.load("America/New_York");
    alltz::TimeDisplayConfig cfg;
    cfg.work_hours_start = 1;
    cfg.work_hours_end = 2;
    ALLTZ_ASSERT(cfg.work_midpoint_hour() == 1);

    alltz::CivilDateTime anchor;
    anchor.date = alltz::CivilDate::from_ymd(2026, 11, 1);
    anchor.hour = 1;
    ALLTZ_ASSERT(ny->resolve_local(anchor).kind == alltz::LocalResolution::Kind::Ambiguous);

    const auto fall_window = alltz::TimelineWindow::around(instant_from_unix(1793534400)); // 2026-11-01T12:00Z
    const auto labels = alltz::date_labels(fall_window, *ny, cfg, 96);
    ALLTZ_ASSERT(labels.size() == 2);
    ALLTZ_ASSERT(labels[0].text == "31 Oct");
    ALLTZ_ASSERT(labels[1].text == "02 Nov");
  }

  // Caption under the scrub position.
  {
    const auto utc = catalog.load("UTC");
    const auto cap = alltz::time_caption(window, *utc, window.start + alltz::TimelineWindow::kHalfSpan,
                                         alltz::TimeFormat::TwentyFourHour, 100);
    ALLTZ_ASSERT(cap.text == "12:00 Sun");
    ALLTZ_ASSERT(cap.anchor == 50);
    ALLTZ_ASSERT(cap.start == 46);

    const auto cap12 = alltz::time_caption(window, *utc, instant_from_unix(1772971200), alltz::TimeFormat::TwelveHour,
                                           100);
    ALLTZ_ASSERT(cap12.text == "12:00 PM Sun");
    ALLTZ_ASSERT(cap12.start == 44);

    const auto ny = catalog.load("America/New_York");
    const auto cap_ny = alltz::time_caption(window, *ny, instant_from_unix(1772953200),
                                            alltz::TimeFormat::TwentyFourHour, 100);
    ALLTZ_ASSERT(cap_ny.text == "03:00 Sun");

    // Narrow track: the caption is pinned to column 0.
    const auto narrow = alltz::time_caption(window, *utc, instant_from_unix(1772971200),
                                            alltz::TimeFormat::TwelveHour, 5);
    ALLTZ_ASSERT(narrow.start == 0);
  }

  return 0;
}
