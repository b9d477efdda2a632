#pragma once

/*
    Tagged line diff between two texts.

    Every line of both texts shows up exactly once: lines only in the
    original are Removed, lines only in the final text are Added, the rest is
    Unchanged. Removed and unchanged lines come in original order, added lines
    where they end up in the final text.
*/

#include <string>
#include <vector>

namespace patchy {

enum class DiffTag {
    Unchanged,
    Removed,
    Added,
};

struct DiffLine {
    DiffTag tag;

    // Keeps the line terminator, if the line had one.
    std::string text;
};

bool
compute_line_diff(const std::string& original, const std::string& final_text, std::vector<DiffLine>& diff);

// Every line of `text` tagged Added.
std::vector<DiffLine>
all_added(const std::string& text);

// Concatenate the lines tagged Unchanged and `tag`. With Removed this gives
// back the original text and with Added the final one.
std::string
reconstruct(const std::vector<DiffLine>& diff, DiffTag tag);

std::string
repr(DiffTag tag);

}  // namespace patchy
