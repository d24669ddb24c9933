#include "alltz/core/app_config.h"

#include <cmath>
#include <stdexcept>

#include "alltz/util/file_io.h"
#include "alltz/util/log.h"
#include "alltz/util/strings.h"

namespace alltz {
namespace {

[[noreturn]] void type_error(const std::string& key, const char* expected, const json::Value& v) {
  throw std::runtime_error("config: '" + key + "' must be " + expected + " (got " + json::type_name(v) + ")");
}

const std::string& get_string(const json::Value& v, const std::string& key) {
  const auto* s = v.as_string();
  if (!s) type_error(key, "a string", v);
  return *s;
}

bool get_bool(const json::Value& v, const std::string& key) {
  const auto* b = v.as_bool();
  if (!b) type_error(key, "a boolean", v);
  return *b;
}

int get_int(const json::Value& v, const std::string& key) {
  const auto* n = v.as_number();
  if (!n || std::floor(*n) != *n || std::fabs(*n) > 1e9) type_error(key, "an integer", v);
  return static_cast<int>(*n);
}

char32_t get_glyph(const json::Value& v, const std::string& key) {
  const std::u32string cps = utf8_decode(get_string(v, key));
  if (cps.size() != 1) throw std::runtime_error("config: '" + key + "' must be a single character");
  return cps.front();
}

// Reads an hour threshold; out-of-range values keep the default with a warning.
void read_hour(const json::Value& hours, const char* name, int& out, AppConfig& cfg) {
  const json::Value* v = hours.find(name);
  if (!v) return;
  const std::string key = std::string("hours.") + name;
  const int h = get_int(*v, key);
  if (h < 0 || h > 23) {
    cfg.warnings.push_back(key + " must be within 0..23 (got " + std::to_string(h) + "), keeping " +
                           std::to_string(out));
    return;
  }
  out = h;
}

ZoneSelection read_zone(const json::Value& v, std::size_t index) {
  const std::string key = "zones[" + std::to_string(index) + "]";
  ZoneSelection z;
  if (const auto* s = v.as_string()) {
    z.id = trim_copy(*s);
  } else if (v.is_object()) {
    z.id = trim_copy(get_string(v.at("id"), key + ".id"));
    if (const auto* label = v.find("label")) z.label = get_string(*label, key + ".label");
  } else {
    type_error(key, "a string or an object", v);
  }
  if (z.id.empty()) throw std::runtime_error("config: '" + key + "' has an empty zone id");
  return z;
}

ZoneCatalogEntry read_custom_zone(const json::Value& v, std::size_t index) {
  const std::string key = "custom_zones[" + std::to_string(index) + "]";
  if (!v.is_object()) type_error(key, "an object", v);
  const json::Value* id = v.find("id");
  const json::Value* posix = v.find("posix");
  if (!id || !posix) throw std::runtime_error("config: '" + key + "' needs both 'id' and 'posix'");
  ZoneCatalogEntry e;
  e.id = trim_copy(get_string(*id, key + ".id"));
  e.posix_rule = trim_copy(get_string(*posix, key + ".posix"));
  if (const auto* label = v.find("label")) e.label = get_string(*label, key + ".label");
  return e;
}

} // namespace

AppConfig app_config_from_json(const json::Value& root) {
  if (!root.is_object()) type_error("<root>", "an object", root);
  AppConfig cfg;

  if (const auto* v = root.find("time_format")) {
    const std::string& s = get_string(*v, "time_format");
    if (!time_format_from_string(s, cfg.time_format)) {
      throw std::runtime_error("config: unknown time_format '" + s + "' (expected 24h or 12h)");
    }
  }
  if (const auto* v = root.find("zone_display")) {
    const std::string& s = get_string(*v, "zone_display");
    if (!zone_display_mode_from_string(s, cfg.zone_display)) {
      throw std::runtime_error("config: unknown zone_display '" + s + "' (expected short or full)");
    }
  }
  if (const auto* v = root.find("theme")) {
    const std::string& s = get_string(*v, "theme");
    if (!theme_from_string(s, cfg.theme)) throw std::runtime_error("config: unknown theme '" + s + "'");
  }
  if (const auto* v = root.find("show_date")) cfg.show_date = get_bool(*v, "show_date");
  if (const auto* v = root.find("show_dst")) cfg.show_dst = get_bool(*v, "show_dst");
  if (const auto* v = root.find("width")) {
    const int w = get_int(*v, "width");
    if (w < kMinWidth || w > kMaxWidth) {
      cfg.warnings.push_back("width must be within " + std::to_string(kMinWidth) + ".." + std::to_string(kMaxWidth) +
                             " (got " + std::to_string(w) + "), keeping " + std::to_string(cfg.width));
    } else {
      cfg.width = w;
    }
  }

  if (const auto* hours = root.find("hours")) {
    if (!hours->is_object()) type_error("hours", "an object", *hours);
    read_hour(*hours, "work_start", cfg.hours.work_hours_start, cfg);
    read_hour(*hours, "work_end", cfg.hours.work_hours_end, cfg);
    read_hour(*hours, "night_start", cfg.hours.night_hours_start, cfg);
    read_hour(*hours, "night_end", cfg.hours.night_hours_end, cfg);
  }

  if (const auto* glyphs = root.find("glyphs")) {
    if (!glyphs->is_object()) type_error("glyphs", "an object", *glyphs);
    if (const auto* g = glyphs->find("work")) cfg.hours.work_char = get_glyph(*g, "glyphs.work");
    if (const auto* g = glyphs->find("awake")) cfg.hours.awake_char = get_glyph(*g, "glyphs.awake");
    if (const auto* g = glyphs->find("night")) cfg.hours.night_char = get_glyph(*g, "glyphs.night");
  }

  if (const auto* zones = root.find("zones")) {
    if (!zones->is_array()) type_error("zones", "an array", *zones);
    cfg.zones.clear();
    const auto& arr = zones->array();
    for (std::size_t i = 0; i < arr.size(); ++i) cfg.zones.push_back(read_zone(arr[i], i));
  }

  if (const auto* custom = root.find("custom_zones")) {
    if (!custom->is_array()) type_error("custom_zones", "an array", *custom);
    const auto& arr = custom->array();
    for (std::size_t i = 0; i < arr.size(); ++i) cfg.custom_zones.push_back(read_custom_zone(arr[i], i));
  }

  for (const auto& w : cfg.warnings) log::warn(w);
  return cfg;
}

AppConfig load_app_config(const std::string& path) {
  const std::string text = read_text_file(path);
  try {
    AppConfig cfg = app_config_from_json(json::parse(text));
    log::debug("Loaded configuration from " + path);
    return cfg;
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
}

std::string check_grid_size(int width, int height, std::size_t zone_count) {
  if (width < kMinWidth || width > kMaxWidth) {
    return "width must be within " + std::to_string(kMinWidth) + ".." + std::to_string(kMaxWidth) + " (got " +
           std::to_string(width) + ")";
  }
  if (height < kMinZoneHeight || height > kMaxZoneHeight) {
    return "height must be within " + std::to_string(kMinZoneHeight) + ".." + std::to_string(kMaxZoneHeight) +
           " (got " + std::to_string(height) + ")";
  }
  if (zone_count == 0) return "no zones to show";
  if (zone_count > static_cast<std::size_t>(kMaxGridRows / height)) {
    return std::to_string(zone_count) + " zones of height " + std::to_string(height) + " exceed " +
           std::to_string(kMaxGridRows) + " rows";
  }
  return {};
}

ZoneCatalog build_zone_catalog(const AppConfig& cfg) {
  ZoneCatalog catalog = ZoneCatalog::with_builtin_zones();
  for (const auto& z : cfg.custom_zones) {
    try {
      catalog.add(z);
    } catch (const std::runtime_error& e) {
      throw std::runtime_error("config: custom zone '" + z.id + "': " + e.what());
    }
  }
  return catalog;
}

} // namespace alltz
