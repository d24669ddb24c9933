#include "alltz/util/time.h"

#include <cstdio>
#include <cstdlib>

#include "alltz/util/strings.h"

namespace alltz {

const char* month_abbrev(int month) {
  static constexpr const char* kMonths[12] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                              "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  if (month < 1 || month > 12) return "???";
  return kMonths[month - 1];
}

const char* weekday_abbrev(int weekday) {
  static constexpr const char* kDays[7] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  if (weekday < 0 || weekday > 6) return "???";
  return kDays[weekday];
}

std::string format_day_month(const CivilDate& date) {
  const auto ymd = date.to_ymd();
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d %s", ymd.day, month_abbrev(ymd.month));
  return std::string(buf);
}

std::string format_clock(const CivilDateTime& dt, TimeFormat format) {
  char buf[32];
  const char* day = weekday_abbrev(dt.date.weekday());
  if (format == TimeFormat::TwelveHour) {
    const int h12 = (dt.hour % 12 == 0) ? 12 : dt.hour % 12;
    std::snprintf(buf, sizeof(buf), "%02d:%02d %s %s", h12, dt.minute, dt.hour < 12 ? "AM" : "PM", day);
  } else {
    std::snprintf(buf, sizeof(buf), "%02d:%02d %s", dt.hour, dt.minute, day);
  }
  return std::string(buf);
}

std::string format_utc_offset(std::chrono::seconds offset) {
  const long long total = offset.count();
  if (total == 0) return "UTC";
  const long long mag = std::llabs(total);
  const long long hours = mag / 3600;
  const long long minutes = (mag % 3600) / 60;
  char buf[24];
  if (minutes == 0) {
    std::snprintf(buf, sizeof(buf), "UTC%c%lld", total < 0 ? '-' : '+', hours);
  } else {
    std::snprintf(buf, sizeof(buf), "UTC%c%lld:%02lld", total < 0 ? '-' : '+', hours, minutes);
  }
  return std::string(buf);
}

bool time_format_from_string(const std::string& s, TimeFormat& out) {
  const std::string v = to_lower(trim_copy(s));
  if (v == "24h" || v == "24" || v == "twenty_four_hour") {
    out = TimeFormat::TwentyFourHour;
    return true;
  }
  if (v == "12h" || v == "12" || v == "twelve_hour") {
    out = TimeFormat::TwelveHour;
    return true;
  }
  return false;
}

bool zone_display_mode_from_string(const std::string& s, ZoneDisplayMode& out) {
  const std::string v = to_lower(trim_copy(s));
  if (v == "short") {
    out = ZoneDisplayMode::Short;
    return true;
  }
  if (v == "full") {
    out = ZoneDisplayMode::Full;
    return true;
  }
  return false;
}

} // namespace alltz
