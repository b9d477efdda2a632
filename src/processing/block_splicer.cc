#include "block_splicer.hpp"

#include <algorithm>
#include <iterator>

using namespace patchy;

SpliceWindow
patchy::splice_window(int64_t anchor, int64_t context_lines, int64_t fragment_len, int64_t buffer_len) {
    SpliceWindow window;
    window.start = std::max<int64_t>(0, anchor - context_lines);
    window.end = std::min<int64_t>(buffer_len, anchor + context_lines);

    // An anchor outside the buffer gives an empty window.
    window.start = std::min(window.start, buffer_len);
    const int64_t available = std::max<int64_t>(0, window.end - window.start);
    window.replace_count = std::min(available, std::max<int64_t>(0, fragment_len));
    return window;
}

SpliceWindow
patchy::splice_block(std::vector<std::string>& buffer,
                     int64_t anchor,
                     const Fragment& fragment,
                     int64_t context_lines) {
    const auto window = splice_window(anchor, context_lines, static_cast<int64_t>(fragment.size()),
                                      static_cast<int64_t>(buffer.size()));

    std::vector<std::string> spliced;
    spliced.reserve(buffer.size() - static_cast<std::size_t>(window.replace_count) + fragment.size());

    auto head_end = buffer.begin() + window.start;
    auto tail_begin = head_end + window.replace_count;

    std::move(buffer.begin(), head_end, std::back_inserter(spliced));
    spliced.insert(spliced.end(), fragment.begin(), fragment.end());
    std::move(tail_begin, buffer.end(), std::back_inserter(spliced));

    buffer = std::move(spliced);
    return window;
}
