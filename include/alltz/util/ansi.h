#pragma once

#include <optional>
#include <string>

#include "alltz/core/buffer.h"
#include "alltz/core/color_theme.h"

namespace alltz {

// SGR parameter for a foreground color (30-37, 90-97; 39 for Reset).
int ansi_fg_code(Color c);
// SGR parameter for a background color (40-47, 100-107; 49 for Reset).
int ansi_bg_code(Color c);

// Renders the buffer as lines of UTF-8 text. With `color`, style changes are
// emitted as SGR escape sequences and every line ends with a reset.
std::string buffer_to_ansi(const Buffer& buf, bool color);

} // namespace alltz
