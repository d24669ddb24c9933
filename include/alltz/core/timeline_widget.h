#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "alltz/core/activity.h"
#include "alltz/core/buffer.h"
#include "alltz/core/civil_time.h"
#include "alltz/core/color_theme.h"
#include "alltz/core/display_options.h"
#include "alltz/core/dst_detector.h"
#include "alltz/core/label_placer.h"
#include "alltz/core/time_mapper.h"
#include "alltz/core/time_zone.h"

namespace alltz {

inline constexpr char32_t kNowMarkerGlyph = U'│';
inline constexpr char32_t kScrubMarkerGlyph = U'┃';
inline constexpr char32_t kSpringForwardGlyph = U'⇈';
inline constexpr char32_t kFallBackGlyph = U'⇊';

// One zone's 48-hour activity timeline.
//
// A widget is built for a single render call. It borrows the zone and the
// activity configuration; both must outlive the widget and are never modified.
class TimelineWidget {
 public:
  // Layers drawn by render(), in order. Later passes overwrite earlier ones
  // where they share a cell.
  enum class PaintPass {
    Frame,
    Background,
    NowMarker,
    ScrubMarker,
    DstMarkers,
    DateLabels,
    TimeCaption,
  };

  static constexpr std::array<PaintPass, 7> kPaintOrder = {
      PaintPass::Frame,      PaintPass::Background, PaintPass::NowMarker,   PaintPass::ScrubMarker,
      PaintPass::DstMarkers, PaintPass::DateLabels, PaintPass::TimeCaption,
  };

  TimelineWidget(Instant timeline_position, Instant current_time, const TimeZone& timezone, bool selected,
                 TimeFormat display_format, ZoneDisplayMode timezone_display_mode,
                 const TimeDisplayConfig& time_config, ColorTheme color_theme, bool show_date, bool show_dst);

  Instant timeline_position;
  Instant current_time;
  const TimeZone& timezone;
  bool selected;
  TimeFormat display_format;
  ZoneDisplayMode timezone_display_mode;
  const TimeDisplayConfig& time_config;
  ColorTheme color_theme;
  bool show_date;
  bool show_dst;

  TimelineWindow window() const { return TimelineWindow::around(timeline_position); }
  int time_to_position(Instant t, int width) const { return window().time_to_position(t, width); }

  // Glyph and color of one hour of the day under this widget's configuration.
  TrackCell hour_display(int hour) const;
  std::vector<TrackCell> timeline_display(int width) const;

  std::optional<DstTransition> detect_dst_transition(Instant t) const;
  std::vector<DstEvent> dst_transitions_in_range() const;

  // Border title for the configured display mode.
  std::string title() const;

  // The passes render() would run for `area`, in order. Empty when the area
  // is too small to hold a timeline.
  std::vector<PaintPass> paint_passes(const Rect& area) const;

  void render(const Rect& area, Buffer& buf) const;

 private:
  struct Layout {
    Rect area;
    Rect inner;
    int now_col{0};
    int scrub_col{0};
  };

  std::optional<Layout> layout_for(const Rect& area) const;
  std::vector<PaintPass> passes_for(const Layout& layout) const;
  void paint(PaintPass pass, const Layout& layout, Buffer& buf) const;
};

const char* paint_pass_name(TimelineWidget::PaintPass p);

} // namespace alltz
