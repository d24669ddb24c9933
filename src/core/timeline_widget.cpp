#include "alltz/core/timeline_widget.h"

namespace alltz {
namespace {

constexpr Color kSpringForwardColor = Color::Green;
constexpr Color kFallBackColor = Color::Yellow;
constexpr Color kDateLabelFg = Color::White;
constexpr Color kDateLabelBg = Color::DarkGray;

} // namespace

const char* paint_pass_name(TimelineWidget::PaintPass p) {
  switch (p) {
    case TimelineWidget::PaintPass::Frame: return "frame";
    case TimelineWidget::PaintPass::Background: return "background";
    case TimelineWidget::PaintPass::NowMarker: return "now_marker";
    case TimelineWidget::PaintPass::ScrubMarker: return "scrub_marker";
    case TimelineWidget::PaintPass::DstMarkers: return "dst_markers";
    case TimelineWidget::PaintPass::DateLabels: return "date_labels";
    case TimelineWidget::PaintPass::TimeCaption: return "time_caption";
  }
  return "frame";
}

TimelineWidget::TimelineWidget(Instant timeline_position, Instant current_time, const TimeZone& timezone,
                               bool selected, TimeFormat display_format, ZoneDisplayMode timezone_display_mode,
                               const TimeDisplayConfig& time_config, ColorTheme color_theme, bool show_date,
                               bool show_dst)
    : timeline_position(timeline_position),
      current_time(current_time),
      timezone(timezone),
      selected(selected),
      display_format(display_format),
      timezone_display_mode(timezone_display_mode),
      time_config(time_config),
      color_theme(color_theme),
      show_date(show_date),
      show_dst(show_dst) {}

TrackCell TimelineWidget::hour_display(int hour) const {
  TrackCell c;
  c.local_hour = hour;
  c.category = time_config.classify(hour);
  c.glyph = time_config.glyph_for(c.category);
  c.color = time_config.color_for(c.category, color_theme);
  return c;
}

std::vector<TrackCell> TimelineWidget::timeline_display(int width) const {
  return alltz::timeline_display(window(), timezone, time_config, color_theme, width);
}

std::optional<DstTransition> TimelineWidget::detect_dst_transition(Instant t) const {
  return DstTransitionDetector(timezone, window()).detect_at(t);
}

std::vector<DstEvent> TimelineWidget::dst_transitions_in_range() const {
  return DstTransitionDetector(timezone, window()).scan_range();
}

std::string TimelineWidget::title() const {
  if (timezone_display_mode == ZoneDisplayMode::Full) return timezone.full_display_name(timeline_position);
  return timezone.display_name() + " " + timezone.offset_string(timeline_position);
}

std::optional<TimelineWidget::Layout> TimelineWidget::layout_for(const Rect& area) const {
  Layout l;
  l.area = area;
  l.inner = area.inner(1);
  if (l.inner.width < 2 || l.inner.height < 1) return std::nullopt;
  l.now_col = time_to_position(current_time, l.inner.width);
  l.scrub_col = time_to_position(timeline_position, l.inner.width);
  return l;
}

std::vector<TimelineWidget::PaintPass> TimelineWidget::passes_for(const Layout& layout) const {
  std::vector<PaintPass> out;
  for (PaintPass p : kPaintOrder) {
    switch (p) {
      case PaintPass::ScrubMarker:
        // The now marker wins when both land on the same column.
        if (layout.scrub_col == layout.now_col) continue;
        break;
      case PaintPass::DstMarkers:
        if (!show_dst) continue;
        break;
      case PaintPass::DateLabels:
        if (!show_date) continue;
        break;
      case PaintPass::TimeCaption:
        if (layout.inner.height < 2) continue;
        break;
      default:
        break;
    }
    out.push_back(p);
  }
  return out;
}

std::vector<TimelineWidget::PaintPass> TimelineWidget::paint_passes(const Rect& area) const {
  const auto layout = layout_for(area);
  if (!layout) return {};
  return passes_for(*layout);
}

void TimelineWidget::render(const Rect& area, Buffer& buf) const {
  const auto layout = layout_for(area);
  if (!layout) return;
  for (PaintPass p : passes_for(*layout)) paint(p, *layout, buf);
}

void TimelineWidget::paint(PaintPass pass, const Layout& layout, Buffer& buf) const {
  const Rect& inner = layout.inner;
  const int row = inner.y;
  const int right = inner.right();

  switch (pass) {
    case PaintPass::Frame: {
      std::optional<Color> border;
      if (selected) border = selected_border_color(color_theme);
      draw_block(buf, layout.area, title(), border);
      break;
    }
    case PaintPass::Background: {
      const auto track = timeline_display(inner.width);
      for (int i = 0; i < inner.width && i < static_cast<int>(track.size()); ++i) {
        buf.set_glyph(inner.x + i, row, track[static_cast<std::size_t>(i)].glyph,
                      track[static_cast<std::size_t>(i)].color);
      }
      break;
    }
    case PaintPass::NowMarker:
      buf.set_glyph(inner.x + layout.now_col, row, kNowMarkerGlyph, current_time_color(color_theme));
      break;
    case PaintPass::ScrubMarker:
      buf.set_glyph(inner.x + layout.scrub_col, row, kScrubMarkerGlyph, timeline_position_color(color_theme));
      break;
    case PaintPass::DstMarkers:
      for (const DstEvent& ev : dst_transitions_in_range()) {
        const int col = time_to_position(ev.at, inner.width);
        if (ev.kind == DstTransition::SpringForward) {
          buf.set_glyph(inner.x + col, row, kSpringForwardGlyph, kSpringForwardColor);
        } else {
          buf.set_glyph(inner.x + col, row, kFallBackGlyph, kFallBackColor);
        }
      }
      break;
    case PaintPass::DateLabels:
      // Labels overwrite whatever markers or background share their columns.
      for (const DateLabel& label : date_labels(window(), timezone, time_config, inner.width)) {
        buf.set_string(inner.x + label.start, row, label.text, kDateLabelFg, kDateLabelBg, right);
      }
      break;
    case PaintPass::TimeCaption: {
      const PlacedLabel caption = time_caption(window(), timezone, timeline_position, display_format, inner.width);
      buf.set_string(inner.x + caption.start, row + 1, caption.text, std::nullopt, std::nullopt, right);
      break;
    }
  }
}

} // namespace alltz
