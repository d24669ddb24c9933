#pragma once

#include <chrono>
#include <string>

#include "alltz/core/civil_time.h"
#include "alltz/core/display_options.h"

namespace alltz {

// "Jan".."Dec" for month 1..12, "???" otherwise.
const char* month_abbrev(int month);

// "Sun".."Sat" for weekday 0..6, "???" otherwise.
const char* weekday_abbrev(int weekday);

// Format a date as "DD Mon", e.g. "05 Jul".
std::string format_day_month(const CivilDate& date);

// Format a wall-clock reading as "HH:MM Www" (24-hour) or "hh:mm AM Www" (12-hour).
std::string format_clock(const CivilDateTime& dt, TimeFormat format);

// Format a UTC offset compactly: "UTC", "UTC+2", "UTC-5", "UTC+5:30", "UTC-9:30".
std::string format_utc_offset(std::chrono::seconds offset);

} // namespace alltz
