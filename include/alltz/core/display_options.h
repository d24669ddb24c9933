#pragma once

#include <string>

namespace alltz {

enum class TimeFormat { TwentyFourHour, TwelveHour };

// How a zone's title is rendered on the timeline border.
enum class ZoneDisplayMode {
  Short, // "<display name> <offset>"
  Full,  // "<display name> (<id>) <abbreviation> <offset>"
};

inline const char* time_format_name(TimeFormat f) { return f == TimeFormat::TwelveHour ? "12h" : "24h"; }
inline const char* zone_display_mode_name(ZoneDisplayMode m) { return m == ZoneDisplayMode::Full ? "full" : "short"; }

bool time_format_from_string(const std::string& s, TimeFormat& out);
bool zone_display_mode_from_string(const std::string& s, ZoneDisplayMode& out);

} // namespace alltz
