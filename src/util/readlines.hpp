#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

// A line as the diff sees it. The text keeps its terminator, so joining the
// lines of a text gives back the exact text.
struct Line {
    uint32_t checksum;
    std::string line;

    bool
    operator==(const Line& other) const {
        return checksum == other.checksum && line == other.line;
    }
};

// Split text into Lines that keep their '\n'. A final line without a
// terminator is kept; an empty text gives no lines.
void
parselines(const std::string& input_text, std::vector<Line>& lines);

// Split text on '\n' without terminators. A '\r' in front of the '\n' is
// dropped and a trailing terminator does not add an empty line.
std::vector<std::string>
split_lines(const std::string& text);

std::string
join_lines(const std::vector<std::string>& lines, const std::string& separator = "\n");

// True for lines that are empty or hold only whitespace.
bool
is_blank(const std::string& line);

}  // namespace patchy
