#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "alltz/core/timeline_widget.h"
#include "alltz/core/zone_catalog.h"

#define ALLTZ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using alltz::TimelineWidget;
using PP = TimelineWidget::PaintPass;

TimelineWidget make_widget(alltz::Instant position, alltz::Instant now, const alltz::TimeZone& zone,
                           const alltz::TimeDisplayConfig& cfg) {
  return TimelineWidget(position, now, zone, false, alltz::TimeFormat::TwentyFourHour, alltz::ZoneDisplayMode::Short,
                        cfg, alltz::ColorTheme::Default, false, true);
}

bool untouched(const alltz::Buffer& buf) {
  for (int y = 0; y < buf.height(); ++y) {
    for (int x = 0; x < buf.width(); ++x) {
      if (!(buf.at(x, y) == alltz::Cell{})) return false;
    }
  }
  return true;
}

} // namespace

int test_timeline_widget() {
  using alltz::Buffer;
  using alltz::Color;
  using alltz::Rect;
  using alltz::instant_from_unix;

  const auto catalog = alltz::ZoneCatalog::with_builtin_zones();
  const auto utc = catalog.load("UTC");
  const auto ny = catalog.load("America/New_York");
  const alltz::TimeDisplayConfig cfg;
  const auto noon = instant_from_unix(1772971200); // 2026-03-08T12:00Z, Sunday

  // Construction keeps every input as given.
  {
    const TimelineWidget w(noon, noon + std::chrono::hours(3), *ny, true, alltz::TimeFormat::TwelveHour,
                           alltz::ZoneDisplayMode::Full, cfg, alltz::ColorTheme::Sunset, true, false);
    ALLTZ_ASSERT(w.timeline_position == noon);
    ALLTZ_ASSERT(w.current_time == noon + std::chrono::hours(3));
    ALLTZ_ASSERT(&w.timezone == ny.get());
    ALLTZ_ASSERT(w.selected);
    ALLTZ_ASSERT(w.display_format == alltz::TimeFormat::TwelveHour);
    ALLTZ_ASSERT(w.timezone_display_mode == alltz::ZoneDisplayMode::Full);
    ALLTZ_ASSERT(&w.time_config == &cfg);
    ALLTZ_ASSERT(w.color_theme == alltz::ColorTheme::Sunset);
    ALLTZ_ASSERT(w.show_date);
    ALLTZ_ASSERT(!w.show_dst);
  }

  // Position mapping and per-hour shading.
  {
    const auto w = make_widget(noon, noon, *utc, cfg);
    ALLTZ_ASSERT(w.time_to_position(noon, 100) == 50);
    ALLTZ_ASSERT(w.time_to_position(noon - std::chrono::hours(48), 100) == 0);
    ALLTZ_ASSERT(w.time_to_position(noon + std::chrono::hours(48), 100) == 99);

    ALLTZ_ASSERT(w.hour_display(14).glyph == U'▓');
    ALLTZ_ASSERT(w.hour_display(14).category == alltz::ActivityCategory::Work);
    ALLTZ_ASSERT(w.hour_display(7).glyph == U'▒');
    ALLTZ_ASSERT(w.hour_display(7).color == Color::Yellow);
    ALLTZ_ASSERT(w.hour_display(2).glyph == U'░');
    ALLTZ_ASSERT(w.hour_display(2).color == Color::DarkGray);
    ALLTZ_ASSERT(w.timeline_display(100).size() == 100);
  }

  // Titles.
  {
    auto w = make_widget(noon, noon, *utc, cfg);
    ALLTZ_ASSERT(w.title() == "UTC UTC");
    w.timezone_display_mode = alltz::ZoneDisplayMode::Full;
    ALLTZ_ASSERT(w.title() == "UTC (UTC) UTC UTC");

    auto n = make_widget(noon, noon, *ny, cfg);
    ALLTZ_ASSERT(n.title() == "New York UTC-4");
    n.timezone_display_mode = alltz::ZoneDisplayMode::Full;
    ALLTZ_ASSERT(n.title() == "New York (America/New_York) EDT UTC-4");
    // The title follows the scrub position, not the current time.
    n.timeline_position = instant_from_unix(1784116800 - 86400 * 200);
    ALLTZ_ASSERT(n.title() == "New York (America/New_York) EST UTC-5");
  }

  // Pass selection.
  {
    auto w = make_widget(noon, noon, *utc, cfg);
    const Rect area{0, 0, 102, 4};
    ALLTZ_ASSERT((w.paint_passes(area) == std::vector<PP>{PP::Frame, PP::Background, PP::NowMarker, PP::DstMarkers,
                                                          PP::TimeCaption}));
    w.current_time = noon - std::chrono::hours(12);
    w.show_date = true;
    w.show_dst = false;
    ALLTZ_ASSERT((w.paint_passes(area) == std::vector<PP>{PP::Frame, PP::Background, PP::NowMarker, PP::ScrubMarker,
                                                          PP::DateLabels, PP::TimeCaption}));
    // One inner row: no room for the caption.
    ALLTZ_ASSERT((w.paint_passes(Rect{0, 0, 102, 3}) == std::vector<PP>{PP::Frame, PP::Background, PP::NowMarker,
                                                                        PP::ScrubMarker, PP::DateLabels}));
    ALLTZ_ASSERT(w.paint_passes(Rect{0, 0, 3, 4}).empty());
    ALLTZ_ASSERT(w.paint_passes(Rect{0, 0, 102, 2}).empty());
    ALLTZ_ASSERT(std::string(alltz::paint_pass_name(PP::DstMarkers)) == "dst_markers");
  }

  // Full render in UTC with the scrub position at the current time.
  {
    const auto w = make_widget(noon, noon, *utc, cfg);
    Buffer buf(102, 4);
    w.render(Rect{0, 0, 102, 4}, buf);

    ALLTZ_ASSERT(buf.at(0, 0).glyph == U'┌');
    ALLTZ_ASSERT(!buf.at(0, 0).fg.has_value());
    ALLTZ_ASSERT(buf.at(1, 0).glyph == U'U');
    ALLTZ_ASSERT(buf.at(101, 3).glyph == U'┘');

    // Background: 12:00 work, 16:48 work, 17:16 awake, 00:00 night.
    ALLTZ_ASSERT(buf.at(1, 1).glyph == U'▓' && buf.at(1, 1).fg == Color::Green);
    ALLTZ_ASSERT(buf.at(11, 1).glyph == U'▓');
    ALLTZ_ASSERT(buf.at(12, 1).glyph == U'▒' && buf.at(12, 1).fg == Color::Yellow);
    ALLTZ_ASSERT(buf.at(26, 1).glyph == U'░' && buf.at(26, 1).fg == Color::DarkGray);

    // Now marker in the middle; the scrub marker is not drawn over it.
    ALLTZ_ASSERT(buf.at(51, 1).glyph == alltz::kNowMarkerGlyph);
    ALLTZ_ASSERT(buf.at(51, 1).fg == Color::Red);

    // Caption centered under column 50 of the track.
    const std::string caption = "12:00 Sun";
    for (std::size_t i = 0; i < caption.size(); ++i) {
      ALLTZ_ASSERT(buf.at(47 + static_cast<int>(i), 2).glyph == static_cast<char32_t>(caption[i]));
    }
    ALLTZ_ASSERT(!buf.at(46, 2).glyph.has_value());
    ALLTZ_ASSERT(!buf.at(56, 2).glyph.has_value());
  }

  // Date labels are drawn over the markers.
  {
    auto w = make_widget(noon, noon, *utc, cfg);
    w.show_date = true;
    Buffer buf(102, 4);
    w.render(Rect{0, 0, 102, 4}, buf);
    ALLTZ_ASSERT(buf.at(50, 1).glyph == U'0');
    ALLTZ_ASSERT(buf.at(51, 1).glyph == U'8');
    ALLTZ_ASSERT(buf.at(51, 1).fg == Color::White);
    ALLTZ_ASSERT(buf.at(51, 1).bg == Color::DarkGray);
    ALLTZ_ASSERT(buf.at(1, 1).glyph == U'0');
    ALLTZ_ASSERT(buf.at(95, 1).glyph == U'0');
    ALLTZ_ASSERT(buf.at(100, 1).glyph == U'r');
  }

  // Scrub and now markers on different columns; selected border colour.
  {
    TimelineWidget w(noon, noon - std::chrono::hours(12), *utc, true, alltz::TimeFormat::TwelveHour,
                     alltz::ZoneDisplayMode::Short, cfg, alltz::ColorTheme::Ocean, false, true);
    Buffer buf(102, 4);
    w.render(Rect{0, 0, 102, 4}, buf);
    ALLTZ_ASSERT(buf.at(26, 1).glyph == alltz::kNowMarkerGlyph);
    ALLTZ_ASSERT(buf.at(26, 1).fg == Color::LightYellow);
    ALLTZ_ASSERT(buf.at(51, 1).glyph == alltz::kScrubMarkerGlyph);
    ALLTZ_ASSERT(buf.at(51, 1).fg == Color::White);
    ALLTZ_ASSERT(buf.at(0, 0).fg == Color::LightCyan);
    ALLTZ_ASSERT(buf.at(0, 3).fg == Color::LightCyan);
    ALLTZ_ASSERT(buf.at(45, 2).glyph == U'1');
  }

  // DST marker in New York: the change is seen from the 06:00Z sample.
  {
    const auto w = make_widget(noon, noon, *ny, cfg);
    ALLTZ_ASSERT(w.dst_transitions_in_range().size() == 1);
    ALLTZ_ASSERT(w.detect_dst_transition(instant_from_unix(1772949600)) == alltz::DstTransition::FallBack);

    Buffer buf(98, 3);
    w.render(Rect{0, 0, 98, 3}, buf);
    ALLTZ_ASSERT(buf.at(37, 1).glyph == alltz::kFallBackGlyph);
    ALLTZ_ASSERT(buf.at(37, 1).fg == Color::Yellow);

    auto hidden = make_widget(noon, noon, *ny, cfg);
    hidden.show_dst = false;
    Buffer buf2(98, 3);
    hidden.render(Rect{0, 0, 98, 3}, buf2);
    ALLTZ_ASSERT(buf2.at(37, 1).glyph != alltz::kFallBackGlyph);
  }

  // Rendering into an offset area leaves the rest of the buffer alone.
  {
    const auto w = make_widget(noon, noon, *utc, cfg);
    Buffer buf(30, 10);
    w.render(Rect{5, 4, 20, 4}, buf);
    ALLTZ_ASSERT(buf.at(5, 4).glyph == U'┌');
    ALLTZ_ASSERT(buf.at(24, 7).glyph == U'┘');
    ALLTZ_ASSERT(!buf.at(4, 4).glyph.has_value());
    ALLTZ_ASSERT(!buf.at(25, 5).glyph.has_value());
    ALLTZ_ASSERT(!buf.at(5, 8).glyph.has_value());
  }

  // Degenerate areas draw nothing at all.
  {
    const auto w = make_widget(noon, noon, *utc, cfg);
    Buffer buf(10, 5);
    w.render(Rect{0, 0, 3, 5}, buf);
    w.render(Rect{0, 0, 10, 2}, buf);
    w.render(Rect{0, 0, 0, 0}, buf);
    ALLTZ_ASSERT(untouched(buf));
  }

  return 0;
}
