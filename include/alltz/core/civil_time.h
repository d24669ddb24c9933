#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace alltz {

// An absolute instant with one-second resolution.
using Instant = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

inline Instant instant_from_unix(std::int64_t seconds) { return Instant(std::chrono::seconds(seconds)); }
inline std::int64_t to_unix_seconds(Instant t) { return t.time_since_epoch().count(); }

// Current system time truncated to whole seconds.
Instant now_instant();

// Proleptic Gregorian calendar date, stored as days since 1970-01-01.
class CivilDate {
 public:
  static CivilDate from_ymd(int year, int month, int day);
  static CivilDate parse_iso_ymd(const std::string& iso);

  CivilDate() = default;
  explicit CivilDate(std::int64_t days_since_epoch) : days_(days_since_epoch) {}

  std::int64_t days_since_epoch() const { return days_; }
  CivilDate add_days(std::int64_t delta) const { return CivilDate(days_ + delta); }

  struct YMD {
    int year;
    int month;
    int day;
  };

  YMD to_ymd() const;

  // 0 = Sunday ... 6 = Saturday.
  int weekday() const;

  std::string to_string() const;

  bool operator==(const CivilDate& rhs) const { return days_ == rhs.days_; }
  bool operator!=(const CivilDate& rhs) const { return days_ != rhs.days_; }
  bool operator<(const CivilDate& rhs) const { return days_ < rhs.days_; }
  bool operator<=(const CivilDate& rhs) const { return days_ <= rhs.days_; }

 private:
  std::int64_t days_{0};
};

// A wall-clock reading in some (unspecified) time zone.
struct CivilDateTime {
  CivilDate date;
  int hour{0};
  int minute{0};
  int second{0};

  // Seconds since 1970-01-01T00:00:00 on the same wall clock.
  std::int64_t local_seconds() const;
  static CivilDateTime from_local_seconds(std::int64_t local_seconds);

  bool operator==(const CivilDateTime& rhs) const {
    return date == rhs.date && hour == rhs.hour && minute == rhs.minute && second == rhs.second;
  }
};

// Parses an instant given on the command line or in tests:
//   "2026-03-08T12:00Z", "2026-03-08T12:00:30Z", "2026-03-08 12:00" (all UTC)
//   or a signed count of Unix seconds ("1772971200").
// Throws std::runtime_error on anything else.
Instant parse_instant(const std::string& text);

// "YYYY-MM-DDTHH:MM:SSZ".
std::string format_instant_utc(Instant t);

} // namespace alltz
