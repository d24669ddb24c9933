#include "alltz/core/time_zone.h"

#include <cctype>
#include <stdexcept>
#include <utility>

#include "alltz/util/time.h"

namespace alltz {
namespace {

constexpr int kSecondsPerHour = 3600;

// Parser for POSIX TZ rule strings:
//   std offset [dst [offset] [,start[/time],end[/time]]]
struct RuleParser {
  const std::string& s;
  std::size_t i{0};

  char peek() const { return i < s.size() ? s[i] : '\0'; }
  bool done() const { return i >= s.size(); }

  [[noreturn]] void fail(const std::string& msg) const {
    throw std::runtime_error("Invalid POSIX TZ rule '" + s + "' at " + std::to_string(i) + ": " + msg);
  }

  std::string parse_abbrev() {
    std::string out;
    if (peek() == '<') {
      ++i;
      while (!done() && peek() != '>') {
        const char c = peek();
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-') fail("bad quoted abbreviation");
        out.push_back(c);
        ++i;
      }
      if (peek() != '>') fail("unterminated quoted abbreviation");
      ++i;
    } else {
      while (std::isalpha(static_cast<unsigned char>(peek()))) out.push_back(s[i++]);
    }
    if (out.size() < 3) fail("abbreviation must have at least 3 characters");
    return out;
  }

  int parse_number(int max_value) {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected digit");
    int v = 0;
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
      v = v * 10 + (s[i++] - '0');
      if (v > max_value) fail("number out of range");
    }
    return v;
  }

  // [+|-]hh[:mm[:ss]], returned in seconds with the sign applied.
  int parse_hms(int max_hours) {
    int sign = 1;
    if (peek() == '+') {
      ++i;
    } else if (peek() == '-') {
      sign = -1;
      ++i;
    }
    int secs = parse_number(max_hours) * kSecondsPerHour;
    if (peek() == ':') {
      ++i;
      secs += parse_number(59) * 60;
      if (peek() == ':') {
        ++i;
        secs += parse_number(59);
      }
    }
    return sign * secs;
  }

  PosixTimeZone::Transition parse_transition() {
    using Form = PosixTimeZone::Transition::Form;
    PosixTimeZone::Transition tr;
    if (peek() == 'M') {
      ++i;
      tr.form = Form::MonthWeekDay;
      tr.month = parse_number(12);
      if (peek() != '.') fail("expected '.' after month");
      ++i;
      tr.week = parse_number(5);
      if (peek() != '.') fail("expected '.' after week");
      ++i;
      tr.weekday = parse_number(6);
      if (tr.month < 1 || tr.week < 1) fail("month and week start at 1");
    } else if (peek() == 'J') {
      ++i;
      tr.form = Form::Julian1;
      tr.day = parse_number(365);
      if (tr.day < 1) fail("Julian day starts at 1");
    } else {
      tr.form = Form::Julian0;
      tr.day = parse_number(365);
    }
    if (peek() == '/') {
      ++i;
      tr.time_seconds = parse_hms(167);
    }
    return tr;
  }
};

} // namespace

const char* local_resolution_kind_name(LocalResolution::Kind k) {
  switch (k) {
    case LocalResolution::Kind::Unique: return "unique";
    case LocalResolution::Kind::Ambiguous: return "ambiguous";
    case LocalResolution::Kind::Skipped: return "skipped";
  }
  return "skipped";
}

CivilDateTime TimeZone::to_local(Instant t) const {
  return CivilDateTime::from_local_seconds(to_unix_seconds(t) + utc_offset(t).count());
}

std::string TimeZone::offset_string(Instant t) const { return format_utc_offset(utc_offset(t)); }

std::string TimeZone::full_display_name(Instant t) const {
  return display_name() + " (" + id() + ") " + abbreviation(t) + " " + offset_string(t);
}

CivilDate PosixTimeZone::Transition::date_in(int year) const {
  const CivilDate jan1 = CivilDate::from_ymd(year, 1, 1);
  const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  switch (form) {
    case Form::Julian1:
      // Jn counts 1..365 and never refers to February 29.
      return jan1.add_days(day - 1 + ((leap && day >= 60) ? 1 : 0));
    case Form::Julian0:
      return jan1.add_days(day);
    case Form::MonthWeekDay:
      break;
  }

  const CivilDate first = CivilDate::from_ymd(year, month, 1);
  CivilDate d = first.add_days((weekday - first.weekday() + 7) % 7 + (week - 1) * 7);
  // Week 5 means "last": step back while we spilled into the next month.
  while (d.to_ymd().month != month) d = d.add_days(-7);
  return d;
}

PosixTimeZone::PosixTimeZone(std::string id, const std::string& rule, std::string label)
    : id_(std::move(id)), label_(std::move(label)), rule_(rule) {
  RuleParser p{rule_};
  std_abbrev_ = p.parse_abbrev();
  if (p.done()) p.fail("missing standard offset");
  std_offset_ = std::chrono::seconds(-p.parse_hms(24));
  dst_offset_ = std_offset_;
  if (p.done()) return;

  dst_abbrev_ = p.parse_abbrev();
  has_dst_ = true;
  dst_offset_ = std_offset_ + std::chrono::hours(1);
  if (!p.done() && p.peek() != ',') dst_offset_ = std::chrono::seconds(-p.parse_hms(24));

  if (p.done()) {
    // No explicit rules: fall back to the current US rules, as tzcode does.
    const std::string us_rules = "M3.2.0,M11.1.0";
    RuleParser us{us_rules};
    start_ = us.parse_transition();
    ++us.i;
    end_ = us.parse_transition();
    return;
  }

  if (p.peek() != ',') p.fail("expected ',' before DST start rule");
  ++p.i;
  start_ = p.parse_transition();
  if (p.peek() != ',') p.fail("expected ',' before DST end rule");
  ++p.i;
  end_ = p.parse_transition();
  if (!p.done()) p.fail("unexpected trailing characters");
  if (dst_offset_ == std_offset_) has_dst_ = false;
}

std::string PosixTimeZone::display_name() const {
  if (!label_.empty()) return label_;
  std::string name = id_;
  const auto slash = name.find_last_of('/');
  if (slash != std::string::npos) name = name.substr(slash + 1);
  for (char& c : name) {
    if (c == '_') c = ' ';
  }
  return name;
}

std::int64_t PosixTimeZone::transition_utc(int year, const Transition& tr,
                                           std::chrono::seconds offset_before) const {
  const std::int64_t local = tr.date_in(year).days_since_epoch() * 86400 + tr.time_seconds;
  return local - offset_before.count();
}

bool PosixTimeZone::in_dst(Instant t) const {
  if (!has_dst_) return false;
  const std::int64_t u = to_unix_seconds(t);
  const int year = CivilDateTime::from_local_seconds(u + std_offset_.count()).date.to_ymd().year;
  const std::int64_t start = transition_utc(year, start_, std_offset_);
  const std::int64_t end = transition_utc(year, end_, dst_offset_);
  if (start < end) return u >= start && u < end;
  // Southern hemisphere: DST spans the turn of the year.
  return u < end || u >= start;
}

std::chrono::seconds PosixTimeZone::utc_offset(Instant t) const { return in_dst(t) ? dst_offset_ : std_offset_; }

std::string PosixTimeZone::abbreviation(Instant t) const { return in_dst(t) ? dst_abbrev_ : std_abbrev_; }

LocalResolution PosixTimeZone::resolve_local(const CivilDateTime& local) const {
  const std::int64_t l = local.local_seconds();
  const Instant as_std = instant_from_unix(l - std_offset_.count());
  if (!has_dst_) return LocalResolution::unique(as_std);

  const Instant as_dst = instant_from_unix(l - dst_offset_.count());
  const bool std_ok = !in_dst(as_std);
  const bool dst_ok = in_dst(as_dst);
  if (std_ok && dst_ok && as_std != as_dst) {
    return as_std < as_dst ? LocalResolution::ambiguous(as_std, as_dst) : LocalResolution::ambiguous(as_dst, as_std);
  }
  if (std_ok) return LocalResolution::unique(as_std);
  if (dst_ok) return LocalResolution::unique(as_dst);
  return LocalResolution::skipped();
}

} // namespace alltz
