#include "marker_segmenter.hpp"

#include "util/readlines.hpp"

#include <cctype>

using namespace patchy;

namespace {

const std::string kEllipsis = "\xE2\x80\xA6";  // U+2026

void
skip_spaces(const std::string& s, std::string::size_type& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        pos++;
    }
}

// Consumes "..." (or more dots) or a U+2026. Fewer than three dots do not
// count as an ellipsis.
bool
match_ellipsis(const std::string& s, std::string::size_type& pos) {
    if (s.compare(pos, kEllipsis.size(), kEllipsis) == 0) {
        pos += kEllipsis.size();
        return true;
    }
    auto end = pos;
    while (end < s.size() && s[end] == '.') {
        end++;
    }
    if (end - pos < 3) {
        return false;
    }
    pos = end;
    return true;
}

bool
match_word(const std::string& s, std::string::size_type& pos, const std::string& word) {
    if (pos + word.size() > s.size()) {
        return false;
    }
    for (std::size_t i = 0; i < word.size(); i++) {
        auto c = static_cast<unsigned char>(s[pos + i]);
        if (std::tolower(c) != word[i]) {
            return false;
        }
    }
    pos += word.size();
    return true;
}

// <token> [space] <ellipsis> [space] existing [space] code [space] [ellipsis]
//
// "code" must end the word, so "existing codebase" is not a marker.
bool
match_marker_at(const std::string& line, std::string::size_type pos) {
    skip_spaces(line, pos);
    if (!match_ellipsis(line, pos)) {
        return false;
    }
    skip_spaces(line, pos);
    if (!match_word(line, pos, "existing")) {
        return false;
    }
    skip_spaces(line, pos);
    if (!match_word(line, pos, "code")) {
        return false;
    }
    return pos == line.size() || !std::isalnum(static_cast<unsigned char>(line[pos]));
}

}  // namespace

bool
patchy::is_elision_marker(const std::string& line, const std::vector<std::string>& comment_tokens) {
    for (const auto& token : comment_tokens) {
        if (token.empty()) {
            continue;
        }
        auto pos = line.find(token);
        while (pos != std::string::npos) {
            if (match_marker_at(line, pos + token.size())) {
                return true;
            }
            pos = line.find(token, pos + 1);
        }
    }
    return false;
}

std::vector<Fragment>
patchy::segment_edit(const std::string& edit_text, const std::vector<std::string>& comment_tokens) {
    const auto edit_lines = split_lines(edit_text);

    std::vector<Fragment> fragments;
    Fragment current;
    for (const auto& line : edit_lines) {
        if (is_elision_marker(line, comment_tokens)) {
            if (!current.empty()) {
                fragments.push_back(std::move(current));
                current = Fragment{};
            }
        } else {
            current.push_back(line);
        }
    }

    if (!current.empty()) {
        fragments.push_back(std::move(current));
    }

    if (fragments.empty() && !edit_lines.empty()) {
        fragments.push_back(edit_lines);
    }

    return fragments;
}
