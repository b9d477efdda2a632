#include "readlines.hpp"

#include "util/hash.hpp"

#include <string>
#include <vector>

namespace {

struct LineParserState {
    explicit LineParserState(const std::string& source) : source(source) {
    }

    const std::string& source;
    std::string::size_type pos = 0;

    bool
    done() const {
        return pos >= source.size();
    }
};

// Read up to and including the next delimiter. Returns false once the input
// is exhausted.
bool
getdelim(LineParserState& s, std::string& line, char delim) {
    line.clear();
    if (s.done()) {
        return false;
    }

    auto end = s.source.find(delim, s.pos);
    if (end == std::string::npos) {
        end = s.source.size();
    } else {
        end += 1;
    }
    line.assign(s.source, s.pos, end - s.pos);
    s.pos = end;
    return true;
}

}  // namespace

void
patchy::parselines(const std::string& input_text, std::vector<Line>& lines) {
    lines.clear();

    LineParserState state{input_text};
    std::string line;
    while (getdelim(state, line, '\n')) {
        uint32_t checksum = hash::hash(line);
        lines.push_back({checksum, std::move(line)});
    }
}

std::vector<std::string>
patchy::split_lines(const std::string& text) {
    std::vector<std::string> lines;

    LineParserState state{text};
    std::string line;
    while (getdelim(state, line, '\n')) {
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
        }
        lines.push_back(line);
    }
    return lines;
}

std::string
patchy::join_lines(const std::vector<std::string>& lines, const std::string& separator) {
    std::string result;
    for (std::size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            result += separator;
        }
        result += lines[i];
    }
    return result;
}

bool
patchy::is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}
