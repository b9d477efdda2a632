#pragma once

#include "processing/marker_segmenter.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

// The part of the buffer a fragment replaces. Lines [start, start +
// replace_count) are removed and the fragment goes in at `start`.
struct SpliceWindow {
    int64_t start = 0;
    int64_t end = 0;
    int64_t replace_count = 0;
};

// start = max(0, anchor - C), end = min(len, anchor + C) and
// replace_count = min(end - start, fragment_len).
SpliceWindow
splice_window(int64_t anchor, int64_t context_lines, int64_t fragment_len, int64_t buffer_len);

// Replace the window around `anchor` with the fragment, in place.
SpliceWindow
splice_block(std::vector<std::string>& buffer, int64_t anchor, const Fragment& fragment, int64_t context_lines);

}  // namespace patchy
