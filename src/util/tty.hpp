#pragma once

#include <cstdio>

namespace checkfiles {

// Whether `stream` is attached to a terminal that understands ANSI colors.
bool
tty_supports_color(std::FILE* stream);

}  // namespace checkfiles
