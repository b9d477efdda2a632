#pragma once

/*
    Find where a fragment belongs in the working buffer.

    The first non-empty fragment line is looked up verbatim first; the first
    identical buffer line wins. Failing that, every buffer line is scored by
    normalized edit distance and the best one is used if it scores above the
    threshold. Anything else anchors at line 0.
*/

#include "processing/engine_options.hpp"
#include "processing/marker_segmenter.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

enum class MatchKind {
    Exact,
    Fuzzy,
    Default,
};

struct AnchorMatch {
    int64_t index = 0;
    MatchKind kind = MatchKind::Default;

    // Best similarity seen; 1.0 for exact matches.
    double score = 0.0;
};

// Levenshtein distance between code point sequences.
int64_t
edit_distance(const std::vector<char32_t>& a, const std::vector<char32_t>& b);

// 1 - distance / max(len(a), len(b)), counted in code points. Two empty
// strings are identical.
double
similarity(const std::string& a, const std::string& b);

// The first `max_lines` non-blank lines of the fragment.
std::vector<std::string>
collect_match_context(const Fragment& fragment, int64_t max_lines);

AnchorMatch
locate_anchor(const Fragment& fragment, const std::vector<std::string>& buffer, const EngineOptions& options);

std::string
repr(MatchKind kind);

}  // namespace patchy
