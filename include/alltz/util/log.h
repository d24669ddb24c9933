#pragma once

#include <string>

namespace alltz::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Parses "debug", "info", "warn", "error" or "off" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool level_from_string(const std::string& s, Level& out);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace alltz::log
