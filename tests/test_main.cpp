#include "test.h"

#include "alltz/util/log.h"

int main() {
  // Keep expected warnings from the config tests out of the output.
  alltz::log::set_level(alltz::log::Level::Off);

  int fails = 0;
  fails += test_civil_time();
  fails += test_time_zone();
  fails += test_zone_catalog();
  fails += test_activity();
  fails += test_time_mapper();
  fails += test_dst_detector();
  fails += test_label_placer();
  fails += test_buffer();
  fails += test_timeline_widget();
  fails += test_json_errors();
  fails += test_app_config();
  fails += test_ansi();
  fails += test_strings();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
