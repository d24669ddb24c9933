#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "alltz/core/activity.h"
#include "alltz/core/app_config.h"
#include "alltz/core/buffer.h"
#include "alltz/core/civil_time.h"
#include "alltz/core/color_theme.h"
#include "alltz/core/timeline_widget.h"
#include "alltz/core/zone_catalog.h"
#include "alltz/util/ansi.h"
#include "alltz/util/file_io.h"
#include "alltz/util/log.h"
#include "alltz/util/strings.h"

namespace {

#ifndef ALLTZ_VERSION
#define ALLTZ_VERSION "unknown"
#endif

// Leaves `out` alone when the flag is absent. Returns false if its value is
// not an integer.
bool get_int_arg(int argc, char** argv, const std::string& key, int& out) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return alltz::parse_int(argv[i + 1], out);
  }
  return true;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "alltz v" << ALLTZ_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "alltz") << " [options]\n\n";
  std::cout << "Renders a 48-hour activity timeline for each zone, centered on the scrub position.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config PATH    Configuration JSON (default: $XDG_CONFIG_HOME/alltz/config.json if present)\n";
  std::cout << "  --zones A,B,...  Zones to show (IANA ids, UTC+H[:MM], or POSIX TZ rules)\n";
  std::cout << "  --at INSTANT     Scrub position (YYYY-MM-DDTHH:MM[:SS]Z or Unix seconds; default: now)\n";
  std::cout << "  --now INSTANT    Override the current time used for the now marker\n";
  std::cout << "  --width N        Timeline width in cells, border included (4..1000, default: 80)\n";
  std::cout << "  --height N       Rows per zone, border included (3..100, default: 4)\n";
  std::cout << "  --12h | --24h    Caption time format\n";
  std::cout << "  --full           Show full zone titles\n";
  std::cout << "  --theme NAME     Color theme (see --list-themes)\n";
  std::cout << "  --no-date        Hide date labels\n";
  std::cout << "  --no-dst         Hide DST transition markers\n";
  std::cout << "  --select N       Highlight the border of the N-th zone (0-based)\n";
  std::cout << "  --no-color       Print plain text without ANSI colors\n";
  std::cout << "  --list-zones     Print the built-in and configured zones, then exit\n";
  std::cout << "  --list-themes    Print the color theme names, then exit\n";
  std::cout << "  --log-level LVL  debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --verbose        Same as --log-level debug\n";
  std::cout << "  --quiet          Only print the timelines\n";
  std::cout << "  -h, --help       Show this help\n";
  std::cout << "  --version        Print version and exit\n";
}

// One line naming the glyphs the timelines use.
std::string legend(const alltz::AppConfig& cfg) {
  std::string out;
  for (alltz::ActivityCategory c :
       {alltz::ActivityCategory::Work, alltz::ActivityCategory::Awake, alltz::ActivityCategory::Night}) {
    out += alltz::utf8_encode(cfg.hours.glyph_for(c)) + " " + alltz::activity_category_name(c) + "  ";
  }
  if (cfg.show_dst) {
    out += alltz::utf8_encode(alltz::kSpringForwardGlyph) + " " +
           alltz::dst_transition_name(alltz::DstTransition::SpringForward) + "  ";
    out += alltz::utf8_encode(alltz::kFallBackGlyph) + " " + alltz::dst_transition_name(alltz::DstTransition::FallBack) +
           "  ";
  }
  out += alltz::utf8_encode(alltz::kNowMarkerGlyph) + " now  " + alltz::utf8_encode(alltz::kScrubMarkerGlyph) + " scrub";
  return out;
}

alltz::AppConfig load_config(int argc, char** argv) {
  const std::string explicit_path = get_str_arg(argc, argv, "--config", "");
  if (!explicit_path.empty()) return alltz::load_app_config(explicit_path);

  const std::string default_path = alltz::default_config_path();
  if (alltz::file_exists(default_path)) return alltz::load_app_config(default_path);

  alltz::log::debug("No configuration file found, using defaults");
  return alltz::AppConfig{};
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << ALLTZ_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    if (has_flag(argc, argv, "--verbose")) {
      alltz::log::set_level(alltz::log::Level::Debug);
    } else {
      const std::string lvl = get_str_arg(argc, argv, "--log-level", "");
      alltz::log::Level parsed = alltz::log::Level::Warn;
      if (!lvl.empty()) {
        if (!alltz::log::level_from_string(lvl, parsed)) {
          std::cerr << "Unknown --log-level: '" << lvl << "'\n\n";
          print_usage(argv[0]);
          return 2;
        }
        alltz::log::set_level(parsed);
      }
    }

    if (has_flag(argc, argv, "--list-themes")) {
      for (alltz::ColorTheme t : alltz::kAllColorThemes) {
        std::cout << alltz::theme_name(t) << "\tborder=" << alltz::color_name(alltz::selected_border_color(t))
                  << " now=" << alltz::color_name(alltz::current_time_color(t))
                  << " scrub=" << alltz::color_name(alltz::timeline_position_color(t)) << "\n";
      }
      return 0;
    }

    alltz::AppConfig cfg = load_config(argc, argv);

    const std::string zones_arg = get_str_arg(argc, argv, "--zones", "");
    if (!zones_arg.empty()) {
      cfg.zones.clear();
      for (const auto& id : alltz::split_list(zones_arg)) cfg.zones.push_back(alltz::ZoneSelection{id, ""});
    }
    if (has_flag(argc, argv, "--12h")) cfg.time_format = alltz::TimeFormat::TwelveHour;
    if (has_flag(argc, argv, "--24h")) cfg.time_format = alltz::TimeFormat::TwentyFourHour;
    if (has_flag(argc, argv, "--full")) cfg.zone_display = alltz::ZoneDisplayMode::Full;
    if (has_flag(argc, argv, "--no-date")) cfg.show_date = false;
    if (has_flag(argc, argv, "--no-dst")) cfg.show_dst = false;
    const std::string theme_arg = get_str_arg(argc, argv, "--theme", "");
    if (!theme_arg.empty() && !alltz::theme_from_string(theme_arg, cfg.theme)) {
      std::cerr << "Unknown --theme: '" << theme_arg << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    int height = 4;
    int selected = -1;
    const std::pair<const char*, int*> int_flags[] = {
        {"--width", &cfg.width}, {"--height", &height}, {"--select", &selected}};
    for (const auto& [flag, dst] : int_flags) {
      if (!get_int_arg(argc, argv, flag, *dst)) {
        std::cerr << flag << " expects an integer\n\n";
        print_usage(argv[0]);
        return 2;
      }
    }
    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool color = !has_flag(argc, argv, "--no-color");

    const alltz::ZoneCatalog catalog = alltz::build_zone_catalog(cfg);

    if (has_flag(argc, argv, "--list-zones")) {
      for (const auto& e : catalog.entries()) {
        const auto zone = catalog.load(e.id, e.label);
        std::cout << e.id << "\t" << e.posix_rule << "\t" << (zone->observes_dst() ? "dst" : "fixed") << "\n";
      }
      return 0;
    }

    if (const std::string err = alltz::check_grid_size(cfg.width, height, cfg.zones.size()); !err.empty()) {
      std::cerr << "Cannot render: " << err << "\n\n";
      print_usage(argv[0]);
      return 2;
    }

    const std::string now_arg = get_str_arg(argc, argv, "--now", "");
    const alltz::Instant now = now_arg.empty() ? alltz::now_instant() : alltz::parse_instant(now_arg);
    const std::string at_arg = get_str_arg(argc, argv, "--at", "");
    const alltz::Instant position = at_arg.empty() ? now : alltz::parse_instant(at_arg);

    std::vector<std::unique_ptr<alltz::TimeZone>> zones;
    zones.reserve(cfg.zones.size());
    for (const auto& z : cfg.zones) zones.push_back(catalog.load(z.id, z.label));

    alltz::log::info("Rendering " + std::to_string(zones.size()) + " zone(s): format=" +
                     alltz::time_format_name(cfg.time_format) + " titles=" +
                     alltz::zone_display_mode_name(cfg.zone_display) + " theme=" + alltz::theme_name(cfg.theme));

    alltz::Buffer buf(cfg.width, height * static_cast<int>(zones.size()));
    for (std::size_t i = 0; i < zones.size(); ++i) {
      const alltz::TimelineWidget widget(position, now, *zones[i], static_cast<int>(i) == selected, cfg.time_format,
                                         cfg.zone_display, cfg.hours, cfg.theme, cfg.show_date, cfg.show_dst);
      widget.render(alltz::Rect{0, static_cast<int>(i) * height, cfg.width, height}, buf);
    }

    if (!quiet) {
      std::cout << "Scrub " << alltz::format_instant_utc(position) << "  Now " << alltz::format_instant_utc(now)
                << "\n";
    }
    std::cout << alltz::buffer_to_ansi(buf, color);
    if (!quiet) std::cout << legend(cfg) << "\n";
    return 0;
  } catch (const std::exception& e) {
    alltz::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
