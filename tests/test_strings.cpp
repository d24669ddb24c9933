#include <iostream>
#include <string>
#include <vector>

#include "alltz/util/strings.h"

#define ALLTZ_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_strings() {
  using alltz::parse_int;

  // Integer flag values.
  {
    int v = 7;
    ALLTZ_ASSERT(parse_int("80", v) && v == 80);
    ALLTZ_ASSERT(parse_int(" -3 ", v) && v == -3);
    ALLTZ_ASSERT(parse_int("+12", v) && v == 12);
    ALLTZ_ASSERT(parse_int("2147483647", v) && v == 2147483647);

    v = 7;
    ALLTZ_ASSERT(!parse_int("", v));
    ALLTZ_ASSERT(!parse_int("abc", v));
    ALLTZ_ASSERT(!parse_int("12abc", v));
    ALLTZ_ASSERT(!parse_int("1.5", v));
    ALLTZ_ASSERT(!parse_int("+", v));
    ALLTZ_ASSERT(!parse_int("+-4", v));
    ALLTZ_ASSERT(!parse_int("99999999999", v));
    ALLTZ_ASSERT(v == 7);
  }

  ALLTZ_ASSERT(alltz::to_lower("Europe/BERLIN") == "europe/berlin");
  ALLTZ_ASSERT(alltz::trim_copy("  UTC \t") == "UTC");
  ALLTZ_ASSERT((alltz::split_list(" UTC, ,Asia/Tokyo,") == std::vector<std::string>{"UTC", "Asia/Tokyo"}));

  // Code points, not bytes.
  ALLTZ_ASSERT(alltz::utf8_length("a\xE2\x96\x93" "b") == 3);
  ALLTZ_ASSERT(alltz::utf8_decode("\xE2\x96\x93") == std::u32string(1, U'▓'));
  ALLTZ_ASSERT(alltz::utf8_encode(U'░') == "\xE2\x96\x91");
  // A truncated sequence decodes to U+FFFD.
  ALLTZ_ASSERT(alltz::utf8_decode("\xE2\x96") == std::u32string(1, U'\uFFFD'));

  return 0;
}
