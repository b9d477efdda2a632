#include "utf8.hpp"

namespace {

const char32_t kReplacementCharacter = 0xFFFD;

// Length of the sequence introduced by `lead`, or 0 if it can't start one.
int
sequence_length(unsigned char lead) {
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 0;
}

bool
is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Decode the code point at `pos` and advance past it.
char32_t
decode_one(const std::string& s, std::string::size_type& pos) {
    const auto lead = static_cast<unsigned char>(s[pos]);
    const int length = sequence_length(lead);
    if (length == 0 || pos + length > s.size()) {
        pos++;
        return kReplacementCharacter;
    }
    if (length == 1) {
        pos++;
        return lead;
    }

    char32_t cp = lead & (0xFF >> (length + 1));
    for (int i = 1; i < length; i++) {
        const auto c = static_cast<unsigned char>(s[pos + i]);
        if (!is_continuation(c)) {
            pos++;
            return kReplacementCharacter;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    // Overlong three and four byte forms, surrogates and values past U+10FFFF
    if ((length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) ||
        cp > 0x10FFFF) {
        pos++;
        return kReplacementCharacter;
    }

    pos += length;
    return cp;
}

}  // namespace

std::vector<char32_t>
patchy::utf8_decode(const std::string& s) {
    std::vector<char32_t> code_points;
    code_points.reserve(s.size());
    std::string::size_type pos = 0;
    while (pos < s.size()) {
        code_points.push_back(decode_one(s, pos));
    }
    return code_points;
}
