#include "alltz/core/dst_detector.h"

#include <chrono>

namespace alltz {

const char* dst_transition_name(DstTransition t) {
  switch (t) {
    case DstTransition::SpringForward: return "spring_forward";
    case DstTransition::FallBack: return "fall_back";
  }
  return "spring_forward";
}

std::optional<DstTransition> DstTransitionDetector::detect_at(Instant t) const {
  const auto before = zone_.utc_offset(t);
  const auto after = zone_.utc_offset(t + std::chrono::hours(1));
  if (after > before) return DstTransition::FallBack;
  if (after < before) return DstTransition::SpringForward;
  return std::nullopt;
}

std::vector<DstEvent> DstTransitionDetector::scan_range() const {
  std::vector<DstEvent> out;
  if (!zone_.observes_dst()) return out;
  for (Instant cur = window_.start; cur < window_.end; cur += std::chrono::hours(1)) {
    if (const auto kind = detect_at(cur)) out.push_back(DstEvent{cur, *kind});
  }
  return out;
}

} // namespace alltz
