#include "alltz/core/civil_time.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "alltz/util/strings.h"

namespace alltz {
namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

// Howard Hinnant's algorithms (public domain):
// https://howardhinnant.github.io/date_algorithms.html
constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr CivilDate::YMD civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp + (mp < 10 ? 3 : -9);
  return CivilDate::YMD{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

constexpr bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

// Floor division for negative local-second counts (pre-1970 wall clocks).
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

bool all_digits(const std::string& s, std::size_t pos, std::size_t len) {
  if (pos + len > s.size()) return false;
  for (std::size_t k = pos; k < pos + len; ++k) {
    if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
  }
  return true;
}

int field(const std::string& s, std::size_t pos, std::size_t len) { return std::stoi(s.substr(pos, len)); }

} // namespace

Instant now_instant() {
  return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

CivilDate CivilDate::from_ymd(int year, int month, int day) {
  if (month < 1 || month > 12) throw std::runtime_error("month out of range: " + std::to_string(month));
  if (day < 1 || day > days_in_month(year, month)) {
    throw std::runtime_error("day out of range: " + std::to_string(day));
  }
  return CivilDate(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

CivilDate CivilDate::parse_iso_ymd(const std::string& iso) {
  if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-' || !all_digits(iso, 0, 4) || !all_digits(iso, 5, 2) ||
      !all_digits(iso, 8, 2)) {
    throw std::runtime_error("Invalid date format, expected YYYY-MM-DD: " + iso);
  }
  return from_ymd(field(iso, 0, 4), field(iso, 5, 2), field(iso, 8, 2));
}

CivilDate::YMD CivilDate::to_ymd() const { return civil_from_days(days_); }

int CivilDate::weekday() const {
  // 1970-01-01 was a Thursday.
  const std::int64_t w = (days_ + 4) % 7;
  return static_cast<int>(w < 0 ? w + 7 : w);
}

std::string CivilDate::to_string() const {
  const auto ymd = to_ymd();
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << ymd.year << '-' << std::setw(2) << ymd.month << '-' << std::setw(2)
     << ymd.day;
  return ss.str();
}

std::int64_t CivilDateTime::local_seconds() const {
  return date.days_since_epoch() * kSecondsPerDay + hour * 3600 + minute * 60 + second;
}

CivilDateTime CivilDateTime::from_local_seconds(std::int64_t local_seconds) {
  const std::int64_t days = floor_div(local_seconds, kSecondsPerDay);
  const std::int64_t rem = local_seconds - days * kSecondsPerDay;
  CivilDateTime out;
  out.date = CivilDate(days);
  out.hour = static_cast<int>(rem / 3600);
  out.minute = static_cast<int>((rem % 3600) / 60);
  out.second = static_cast<int>(rem % 60);
  return out;
}

Instant parse_instant(const std::string& raw) {
  const std::string s = trim_copy(raw);
  if (s.empty()) throw std::runtime_error("Empty instant");

  // Raw Unix seconds.
  {
    std::size_t k = (s[0] == '-') ? 1 : 0;
    if (k < s.size() && all_digits(s, k, s.size() - k)) return instant_from_unix(std::stoll(s));
  }

  // YYYY-MM-DD[T ]HH:MM[:SS][Z]
  if (s.size() >= 16 && (s[10] == 'T' || s[10] == ' ') && s[13] == ':' && all_digits(s, 11, 2) &&
      all_digits(s, 14, 2)) {
    const CivilDate date = CivilDate::parse_iso_ymd(s.substr(0, 10));
    std::size_t pos = 16;
    int sec = 0;
    if (pos < s.size() && s[pos] == ':') {
      if (!all_digits(s, pos + 1, 2)) throw std::runtime_error("Invalid seconds in instant: " + s);
      sec = field(s, pos + 1, 2);
      pos += 3;
    }
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) ++pos;
    if (pos != s.size()) throw std::runtime_error("Unexpected trailing characters in instant: " + s);

    CivilDateTime dt;
    dt.date = date;
    dt.hour = field(s, 11, 2);
    dt.minute = field(s, 14, 2);
    dt.second = sec;
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) throw std::runtime_error("Time out of range: " + s);
    return instant_from_unix(dt.local_seconds());
  }

  throw std::runtime_error("Invalid instant, expected YYYY-MM-DDTHH:MM[:SS]Z or Unix seconds: " + s);
}

std::string format_instant_utc(Instant t) {
  const auto dt = CivilDateTime::from_local_seconds(to_unix_seconds(t));
  std::ostringstream ss;
  ss << dt.date.to_string() << 'T' << std::setfill('0') << std::setw(2) << dt.hour << ':' << std::setw(2)
     << dt.minute << ':' << std::setw(2) << dt.second << 'Z';
  return ss.str();
}

} // namespace alltz
