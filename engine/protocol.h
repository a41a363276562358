#pragma once

#include <iosfwd>

namespace isolation {

// Line-oriented command loop in the style of UCI. Reads commands until "quit"
// or end of input; replies and "info" log lines go to `out`.
void protocol_loop(std::istream& in, std::ostream& out);
void protocol_loop();

}  // namespace isolation
