#include "alltz/core/zone_catalog.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "alltz/util/log.h"
#include "alltz/util/strings.h"

namespace alltz {
namespace {

struct BuiltinZone {
  const char* id;
  const char* rule;
};

// Current rules only; historical rule changes are not modelled.
constexpr BuiltinZone kBuiltinZones[] = {
    {"UTC", "UTC0"},
    {"Etc/UTC", "UTC0"},
    {"America/New_York", "EST5EDT,M3.2.0,M11.1.0"},
    {"America/Toronto", "EST5EDT,M3.2.0,M11.1.0"},
    {"America/Chicago", "CST6CDT,M3.2.0,M11.1.0"},
    {"America/Mexico_City", "CST6"},
    {"America/Denver", "MST7MDT,M3.2.0,M11.1.0"},
    {"America/Phoenix", "MST7"},
    {"America/Los_Angeles", "PST8PDT,M3.2.0,M11.1.0"},
    {"America/Vancouver", "PST8PDT,M3.2.0,M11.1.0"},
    {"America/Anchorage", "AKST9AKDT,M3.2.0,M11.1.0"},
    {"America/Halifax", "AST4ADT,M3.2.0,M11.1.0"},
    {"America/St_Johns", "NST3:30NDT,M3.2.0,M11.1.0"},
    {"America/Sao_Paulo", "<-03>3"},
    {"America/Argentina/Buenos_Aires", "<-03>3"},
    {"America/Santiago", "<-04>4<-03>,M9.1.6/24,M4.1.6/24"},
    {"Pacific/Honolulu", "HST10"},
    {"Europe/London", "GMT0BST,M3.5.0/1,M10.5.0"},
    {"Europe/Dublin", "IST-1GMT0,M10.5.0,M3.5.0/1"},
    {"Europe/Lisbon", "WET0WEST,M3.5.0/1,M10.5.0"},
    {"Europe/Paris", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Berlin", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Madrid", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Rome", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Amsterdam", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Stockholm", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Warsaw", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Athens", "EET-2EEST,M3.5.0/3,M10.5.0/4"},
    {"Europe/Helsinki", "EET-2EEST,M3.5.0/3,M10.5.0/4"},
    {"Europe/Kyiv", "EET-2EEST,M3.5.0/3,M10.5.0/4"},
    {"Europe/Istanbul", "<+03>-3"},
    {"Europe/Moscow", "MSK-3"},
    {"Africa/Cairo", "EET-2EEST,M4.5.5/0,M10.5.4/24"},
    {"Africa/Johannesburg", "SAST-2"},
    {"Africa/Lagos", "WAT-1"},
    {"Africa/Nairobi", "EAT-3"},
    {"Asia/Dubai", "<+04>-4"},
    {"Asia/Tehran", "<+0330>-3:30"},
    {"Asia/Karachi", "PKT-5"},
    {"Asia/Kolkata", "IST-5:30"},
    {"Asia/Kathmandu", "<+0545>-5:45"},
    {"Asia/Dhaka", "<+06>-6"},
    {"Asia/Bangkok", "<+07>-7"},
    {"Asia/Jakarta", "WIB-7"},
    {"Asia/Shanghai", "CST-8"},
    {"Asia/Hong_Kong", "HKT-8"},
    {"Asia/Singapore", "<+08>-8"},
    {"Asia/Taipei", "CST-8"},
    {"Asia/Seoul", "KST-9"},
    {"Asia/Tokyo", "JST-9"},
    {"Australia/Perth", "AWST-8"},
    {"Australia/Darwin", "ACST-9:30"},
    {"Australia/Adelaide", "ACST-9:30ACDT,M10.1.0,M4.1.0/3"},
    {"Australia/Brisbane", "AEST-10"},
    {"Australia/Sydney", "AEST-10AEDT,M10.1.0,M4.1.0/3"},
    {"Australia/Melbourne", "AEST-10AEDT,M10.1.0,M4.1.0/3"},
    {"Australia/Lord_Howe", "<+1030>-10:30<+11>-11,M10.1.0,M4.1.0"},
    {"Pacific/Auckland", "NZST-12NZDT,M9.5.0,M4.1.0/3"},
    {"Pacific/Chatham", "<+1245>-12:45<+1345>,M9.5.0/2:45,M4.1.0/3:45"},
};

bool iequals(const std::string& a, const std::string& b) { return to_lower(a) == to_lower(b); }

// "UTC", "GMT", "UTC+5", "UTC-3:30", "GMT+10" -> POSIX rule; empty if `id` is not of that shape.
std::string fixed_offset_rule(const std::string& id) {
  const std::string v = to_lower(trim_copy(id));
  if (v == "utc" || v == "gmt" || v == "z") return "UTC0";
  if (v.size() < 5 || (v.compare(0, 3, "utc") != 0 && v.compare(0, 3, "gmt") != 0)) return {};
  const char sign = v[3];
  if (sign != '+' && sign != '-') return {};

  std::size_t i = 4;
  int hours = 0;
  int minutes = 0;
  std::size_t digits = 0;
  while (i < v.size() && std::isdigit(static_cast<unsigned char>(v[i])) && digits < 2) {
    hours = hours * 10 + (v[i++] - '0');
    ++digits;
  }
  if (digits == 0) return {};
  if (i < v.size()) {
    if (v[i] != ':' || i + 3 != v.size() || !std::isdigit(static_cast<unsigned char>(v[i + 1])) ||
        !std::isdigit(static_cast<unsigned char>(v[i + 2]))) {
      return {};
    }
    minutes = (v[i + 1] - '0') * 10 + (v[i + 2] - '0');
  }
  if (hours > 14 || minutes > 59) return {};
  if (hours == 0 && minutes == 0) return "UTC0";

  // POSIX offsets are positive west of Greenwich, so the sign flips.
  char buf[32];
  if (minutes == 0) {
    std::snprintf(buf, sizeof(buf), "<%c%02d>%c%d", sign, hours, sign == '+' ? '-' : '+', hours);
  } else {
    std::snprintf(buf, sizeof(buf), "<%c%02d%02d>%c%d:%02d", sign, hours, minutes, sign == '+' ? '-' : '+', hours,
                  minutes);
  }
  return std::string(buf);
}

// IANA ids contain '/' in their name part; POSIX rules only after the first ','.
bool looks_like_posix_rule(const std::string& id) {
  const std::string head = id.substr(0, id.find(','));
  return std::any_of(head.begin(), head.end(), [](unsigned char c) { return std::isdigit(c); }) &&
         head.find('/') == std::string::npos;
}

} // namespace

ZoneCatalog ZoneCatalog::with_builtin_zones() {
  ZoneCatalog c;
  c.entries_.reserve(std::size(kBuiltinZones));
  for (const auto& z : kBuiltinZones) c.entries_.push_back(ZoneCatalogEntry{z.id, z.rule, {}});
  return c;
}

void ZoneCatalog::add(ZoneCatalogEntry entry) {
  if (trim_copy(entry.id).empty()) throw std::runtime_error("Zone id must not be empty");
  // Validate eagerly so bad configuration is reported where it is loaded.
  PosixTimeZone probe(entry.id, entry.posix_rule, entry.label);
  (void)probe;

  for (auto& e : entries_) {
    if (iequals(e.id, entry.id)) {
      log::debug("Zone catalog: overriding " + e.id + " with rule " + entry.posix_rule);
      e = std::move(entry);
      return;
    }
  }
  entries_.push_back(std::move(entry));
}

const ZoneCatalogEntry* ZoneCatalog::find(const std::string& id) const {
  for (const auto& e : entries_) {
    if (iequals(e.id, id)) return &e;
  }
  return nullptr;
}

std::vector<ZoneCatalogEntry> ZoneCatalog::entries() const {
  std::vector<ZoneCatalogEntry> out = entries_;
  std::sort(out.begin(), out.end(), [](const ZoneCatalogEntry& a, const ZoneCatalogEntry& b) { return a.id < b.id; });
  return out;
}

std::unique_ptr<TimeZone> ZoneCatalog::load(const std::string& id, const std::string& label) const {
  if (const auto* e = find(id)) {
    return std::make_unique<PosixTimeZone>(e->id, e->posix_rule, label.empty() ? e->label : label);
  }

  const std::string fixed = fixed_offset_rule(id);
  if (!fixed.empty()) {
    return std::make_unique<PosixTimeZone>(trim_copy(id), fixed, label);
  }

  if (looks_like_posix_rule(id)) {
    try {
      return std::make_unique<PosixTimeZone>(id, id, label);
    } catch (const std::runtime_error& e) {
      throw std::runtime_error("Unknown time zone '" + id + "' (" + e.what() + ")");
    }
  }

  throw std::runtime_error("Unknown time zone: " + id);
}

} // namespace alltz
