#pragma once

#include <optional>
#include <vector>

#include "alltz/core/civil_time.h"
#include "alltz/core/time_mapper.h"
#include "alltz/core/time_zone.h"

namespace alltz {

enum class DstTransition {
  SpringForward, // UTC offset decreased between two samples
  FallBack,      // UTC offset increased between two samples
};

const char* dst_transition_name(DstTransition t);

struct DstEvent {
  // Sample instant at which the change was observed (the change happens
  // within the hour that follows it).
  Instant at{};
  DstTransition kind{DstTransition::SpringForward};
};

// Finds UTC offset changes of a zone inside a timeline window by sampling the
// offset once per hour.
//
// Changes that do not line up with the hourly samples are reported at the
// sample that precedes them.
class DstTransitionDetector {
 public:
  DstTransitionDetector(const TimeZone& zone, const TimelineWindow& window) : zone_(zone), window_(window) {}

  // Compares the offset at `t` with the offset one hour later.
  std::optional<DstTransition> detect_at(Instant t) const;

  // Samples window.start, window.start + 1h, ... while the sample is before
  // window.end. Every returned event satisfies window.contains(event.at).
  std::vector<DstEvent> scan_range() const;

 private:
  const TimeZone& zone_;
  TimelineWindow window_;
};

} // namespace alltz
