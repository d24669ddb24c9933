#include "alltz/util/log.h"

#include <iostream>
#include <mutex>

#include "alltz/util/strings.h"

namespace alltz::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Warn;

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  if (g_level == Level::Off || l < g_level) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

bool level_from_string(const std::string& s, Level& out) {
  const std::string v = to_lower(s);
  if (v == "debug") {
    out = Level::Debug;
  } else if (v == "info") {
    out = Level::Info;
  } else if (v == "warn" || v == "warning") {
    out = Level::Warn;
  } else if (v == "error") {
    out = Level::Error;
  } else if (v == "off" || v == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace alltz::log
