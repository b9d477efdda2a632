#pragma once

#include <string>
#include <vector>

namespace patchy {

// Decode UTF-8 into code points. Each byte that does not start a valid
// sequence decodes to U+FFFD on its own.
std::vector<char32_t>
utf8_decode(const std::string& s);

}  // namespace patchy
