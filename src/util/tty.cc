#include "tty.hpp"

#include <cstdlib>
#include <string>

#ifdef CHECKFILES_PLATFORM_POSIX
#include <unistd.h>
#endif

using namespace checkfiles;

bool
checkfiles::tty_supports_color(std::FILE* stream) {
#ifdef CHECKFILES_PLATFORM_POSIX
    // If we're not outputting to a terminal, we don't output any colors.
    // NOTE: This prevents colored output when piping to less or when
    //       redirecting to files, which is what hooks usually do.
    if (stream == nullptr || isatty(fileno(stream)) == 0) {
        return false;
    }

    // https://no-color.org
    if (getenv("NO_COLOR") != nullptr) {
        return false;
    }

    const char* term = getenv("TERM");
    if (term == nullptr || std::string(term) == "dumb") {
        return false;
    }
    return true;
#else
    return false;
#endif
}
