#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "alltz/core/dst_detector.h"
#include "alltz/core/zone_catalog.h"

#define ALLTZ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool events_inside(const std::vector<alltz::DstEvent>& events, const alltz::TimelineWindow& w) {
  for (const auto& ev : events) {
    if (!w.contains(ev.at)) return false;
    if (ev.kind != alltz::DstTransition::SpringForward && ev.kind != alltz::DstTransition::FallBack) return false;
  }
  return true;
}

} // namespace

int test_dst_detector() {
  using alltz::DstTransition;
  using alltz::instant_from_unix;
  using std::chrono::hours;

  const auto catalog = alltz::ZoneCatalog::with_builtin_zones();

  // New York, 2026-03-08: offset goes from -5h to -4h between 07:00Z and 08:00Z;
  // the 06:00Z sample sees it one hour ahead.
  {
    const auto ny = catalog.load("America/New_York");
    const auto window = alltz::TimelineWindow::around(instant_from_unix(1772971200));
    const alltz::DstTransitionDetector det(*ny, window);

    const auto events = det.scan_range();
    ALLTZ_ASSERT(events.size() == 1);
    ALLTZ_ASSERT(alltz::to_unix_seconds(events[0].at) == 1772949600);
    ALLTZ_ASSERT(events[0].kind == DstTransition::FallBack);
    ALLTZ_ASSERT(events_inside(events, window));

    ALLTZ_ASSERT(det.detect_at(instant_from_unix(1772949600)) == DstTransition::FallBack);
    ALLTZ_ASSERT(!det.detect_at(instant_from_unix(1772949600 - 3600)).has_value());
    ALLTZ_ASSERT(!det.detect_at(instant_from_unix(1772953200)).has_value());
  }

  // Sydney, 2026-04-05: offset drops from +11h to +10h at 16:00Z the day before.
  {
    const auto syd = catalog.load("Australia/Sydney");
    const auto window = alltz::TimelineWindow::around(instant_from_unix(1775390400));
    const auto events = alltz::DstTransitionDetector(*syd, window).scan_range();
    ALLTZ_ASSERT(events.size() == 1);
    ALLTZ_ASSERT(alltz::to_unix_seconds(events[0].at) == 1775314800);
    ALLTZ_ASSERT(events[0].kind == DstTransition::SpringForward);
    ALLTZ_ASSERT(events_inside(events, window));
  }

  // Lord Howe changes by 30 minutes at 15:30Z; the 15:00Z sample catches it.
  {
    const auto lhi = catalog.load("Australia/Lord_Howe");
    const auto window = alltz::TimelineWindow::around(instant_from_unix(1791115200));
    const auto events = alltz::DstTransitionDetector(*lhi, window).scan_range();
    ALLTZ_ASSERT(events.size() == 1);
    ALLTZ_ASSERT(alltz::to_unix_seconds(events[0].at) == 1791039600);
    ALLTZ_ASSERT(events_inside(events, window));
  }

  ALLTZ_ASSERT(std::string(alltz::dst_transition_name(DstTransition::FallBack)) == "fall_back");

  // A window with no change in it.
  {
    const auto ny = catalog.load("America/New_York");
    const auto window = alltz::TimelineWindow::around(instant_from_unix(1784116800));
    ALLTZ_ASSERT(alltz::DstTransitionDetector(*ny, window).scan_range().empty());
  }

  // Zones without DST never report anything, wherever the window is.
  for (const char* id : {"UTC", "Asia/Tokyo", "UTC+5:30", "Asia/Kathmandu"}) {
    const auto zone = catalog.load(id);
    for (std::int64_t t = 1767225600; t < 1798761600; t += 86400 * 11) {
      const auto window = alltz::TimelineWindow::around(instant_from_unix(t));
      ALLTZ_ASSERT(alltz::DstTransitionDetector(*zone, window).scan_range().empty());
    }
  }

  // Every event the scan finds over a year of windows stays inside its window.
  {
    const auto berlin = catalog.load("Europe/Berlin");
    int found = 0;
    for (std::int64_t t = 1767225600; t < 1798761600; t += 86400) {
      const auto window = alltz::TimelineWindow::around(instant_from_unix(t) + hours(5));
      const auto events = alltz::DstTransitionDetector(*berlin, window).scan_range();
      ALLTZ_ASSERT(events_inside(events, window));
      found += static_cast<int>(events.size());
    }
    // Each of the two yearly changes is seen from two consecutive daily windows.
    ALLTZ_ASSERT(found == 4);
  }

  return 0;
}
