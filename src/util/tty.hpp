#pragma once

namespace patchy {

// True when stdout is a terminal that is not known to be dumb. Colored
// output is only the default when this holds.
bool
tty_supports_color();

}  // namespace patchy
