#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace alltz {

std::string to_lower(std::string s);

std::string trim_copy(std::string_view s);

// Parses a whole string as a base-10 int (surrounding spaces allowed).
// Returns false on junk, trailing characters or overflow; `out` is then unchanged.
bool parse_int(std::string_view s, int& out);

// Splits on `sep`, trimming each piece and dropping empty pieces.
std::vector<std::string> split_list(std::string_view s, char sep = ',');

// UTF-8 helpers for the cell grid. Labels and glyphs are counted in code points;
// every code point the timeline draws occupies exactly one terminal column.
std::size_t utf8_length(std::string_view s);
std::u32string utf8_decode(std::string_view s);
void utf8_append(char32_t cp, std::string& out);
std::string utf8_encode(char32_t cp);

} // namespace alltz
