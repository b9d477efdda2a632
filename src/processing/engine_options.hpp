#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

// Tunables of the fragment engine. The config file and the command line can
// override the defaults.
struct EngineOptions {
    // Lines on each side of the anchor that a fragment may replace.
    int64_t context_lines = 3;

    // Non-empty fragment lines collected as matching context. Only the first
    // one takes part in the match.
    int64_t match_context_lines = 3;

    // A fuzzy match must score strictly above this to be accepted.
    double similarity_threshold = 0.6;

    // Comment tokens that can introduce an elision marker.
    std::vector<std::string> comment_tokens = {"//", "#", "--", "/*", "<!--"};

    // Print per-fragment traces to stderr.
    bool verbose = false;
};

}  // namespace patchy
