#include "tty.hpp"

#include <cstdlib>
#include <string>

#ifdef PATCHY_PLATFORM_POSIX
#include <unistd.h>
#endif

bool
patchy::tty_supports_color() {
#ifdef PATCHY_PLATFORM_POSIX
    // NOTE: This will prevent colored output when piping to less or when
    //       redirecting to files.
    if (isatty(STDOUT_FILENO) == 0) {
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
