#pragma once

#include <chrono>
#include <string>

#include "alltz/core/civil_time.h"

namespace alltz {

// Result of mapping a wall-clock reading back to an absolute instant.
//
// Around DST changes a local time can occur twice (clocks fall back) or not at
// all (clocks spring forward); callers decide what to do with each case.
struct LocalResolution {
  enum class Kind { Unique, Ambiguous, Skipped };

  Kind kind{Kind::Skipped};

  // Unique: both hold the single instant.
  // Ambiguous: earliest < latest, the two instants showing this wall clock.
  // Skipped: unspecified.
  Instant earliest{};
  Instant latest{};

  static LocalResolution unique(Instant t) { return {Kind::Unique, t, t}; }
  static LocalResolution ambiguous(Instant a, Instant b) { return {Kind::Ambiguous, a, b}; }
  static LocalResolution skipped() { return {}; }

  bool is_unique() const { return kind == Kind::Unique; }
};

const char* local_resolution_kind_name(LocalResolution::Kind k);

// Time zone conversion capability consumed by the timeline.
class TimeZone {
 public:
  virtual ~TimeZone() = default;

  // Canonical identifier, e.g. "America/New_York".
  virtual const std::string& id() const = 0;

  // Short human label, e.g. "New York".
  virtual std::string display_name() const = 0;

  // Local time minus UTC at instant t.
  virtual std::chrono::seconds utc_offset(Instant t) const = 0;

  // Zone abbreviation in effect at t ("EST", "CEST", "+0530").
  virtual std::string abbreviation(Instant t) const = 0;

  virtual LocalResolution resolve_local(const CivilDateTime& local) const = 0;

  // True if the zone's rules contain any offset change.
  virtual bool observes_dst() const = 0;

  CivilDateTime to_local(Instant t) const;
  std::string offset_string(Instant t) const;
  std::string full_display_name(Instant t) const;
};

// A time zone described by a POSIX TZ rule string, e.g.
//   "EST5EDT,M3.2.0,M11.1.0"
//   "AEST-10AEDT,M10.1.0,M4.1.0/3"
//   "<+0545>-5:45"
// Offsets in the rule are POSIX-style (positive west of Greenwich).
class PosixTimeZone : public TimeZone {
 public:
  // Throws std::runtime_error if `rule` cannot be parsed.
  PosixTimeZone(std::string id, const std::string& rule, std::string label = "");

  const std::string& id() const override { return id_; }
  std::string display_name() const override;
  std::chrono::seconds utc_offset(Instant t) const override;
  std::string abbreviation(Instant t) const override;
  LocalResolution resolve_local(const CivilDateTime& local) const override;
  bool observes_dst() const override { return has_dst_; }

  const std::string& rule() const { return rule_; }
  std::chrono::seconds standard_offset() const { return std_offset_; }
  std::chrono::seconds daylight_offset() const { return dst_offset_; }

  // Rule date (a day within a year) plus local time of day the change happens.
  struct Transition {
    enum class Form { MonthWeekDay, Julian1, Julian0 };
    Form form{Form::MonthWeekDay};
    int month{0};
    int week{0};
    int weekday{0};
    int day{0};
    int time_seconds{2 * 3600};

    CivilDate date_in(int year) const;
  };

 private:
  bool in_dst(Instant t) const;
  std::int64_t transition_utc(int year, const Transition& tr, std::chrono::seconds offset_before) const;

  std::string id_;
  std::string label_;
  std::string rule_;
  std::string std_abbrev_;
  std::string dst_abbrev_;
  std::chrono::seconds std_offset_{0};
  std::chrono::seconds dst_offset_{0};
  bool has_dst_{false};
  Transition start_;
  Transition end_;
};

} // namespace alltz
