#include "anchor_locator.hpp"

#include "util/readlines.hpp"
#include "util/utf8.hpp"

#include <algorithm>
#include <cstdlib>

using namespace patchy;

namespace {

double
similarity_from_distance(int64_t distance, std::size_t len_a, std::size_t len_b) {
    const auto max_len = std::max(len_a, len_b);
    if (max_len == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(distance) / static_cast<double>(max_len);
}

// Similarity can't exceed this no matter what the strings contain.
double
similarity_upper_bound(std::size_t len_a, std::size_t len_b) {
    const auto max_len = std::max(len_a, len_b);
    if (max_len == 0) {
        return 1.0;
    }
    const auto diff = len_a > len_b ? len_a - len_b : len_b - len_a;
    return 1.0 - static_cast<double>(diff) / static_cast<double>(max_len);
}

}  // namespace

int64_t
patchy::edit_distance(const std::vector<char32_t>& a, const std::vector<char32_t>& b) {
    // Keep the shorter sequence along the rows.
    const auto& longer = a.size() >= b.size() ? a : b;
    const auto& shorter = a.size() >= b.size() ? b : a;

    const auto n = shorter.size();
    std::vector<int64_t> prev(n + 1);
    std::vector<int64_t> curr(n + 1);
    for (std::size_t j = 0; j <= n; j++) {
        prev[j] = static_cast<int64_t>(j);
    }

    for (std::size_t i = 1; i <= longer.size(); i++) {
        curr[0] = static_cast<int64_t>(i);
        for (std::size_t j = 1; j <= n; j++) {
            const int64_t cost = longer[i - 1] == shorter[j - 1] ? 0 : 1;
            const int64_t deletion = prev[j] + 1;
            const int64_t insertion = curr[j - 1] + 1;
            const int64_t substitution = prev[j - 1] + cost;
            curr[j] = std::min({deletion, insertion, substitution});
        }
        std::swap(prev, curr);
    }

    return prev[n];
}

double
patchy::similarity(const std::string& a, const std::string& b) {
    const auto cps_a = utf8_decode(a);
    const auto cps_b = utf8_decode(b);
    return similarity_from_distance(edit_distance(cps_a, cps_b), cps_a.size(), cps_b.size());
}

std::vector<std::string>
patchy::collect_match_context(const Fragment& fragment, int64_t max_lines) {
    std::vector<std::string> context;
    for (const auto& line : fragment) {
        if (static_cast<int64_t>(context.size()) >= max_lines) {
            break;
        }
        if (!is_blank(line)) {
            context.push_back(line);
        }
    }
    return context;
}

AnchorMatch
patchy::locate_anchor(const Fragment& fragment,
                      const std::vector<std::string>& buffer,
                      const EngineOptions& options) {
    AnchorMatch match;

    const auto context = collect_match_context(fragment, options.match_context_lines);
    if (context.empty() || buffer.empty()) {
        return match;
    }

    const auto& needle = context[0];

    for (std::size_t i = 0; i < buffer.size(); i++) {
        if (buffer[i] == needle) {
            match.index = static_cast<int64_t>(i);
            match.kind = MatchKind::Exact;
            match.score = 1.0;
            return match;
        }
    }

    const auto needle_cps = utf8_decode(needle);

    double best_score = 0.0;
    int64_t best_index = 0;
    for (std::size_t i = 0; i < buffer.size(); i++) {
        const auto line_cps = utf8_decode(buffer[i]);

        // OPT: Lines whose length alone rules out beating the current best
        //      are skipped. Ties keep the earlier line, so this can't change
        //      the result.
        if (similarity_upper_bound(needle_cps.size(), line_cps.size()) <= best_score) {
            continue;
        }

        const auto score = similarity_from_distance(edit_distance(line_cps, needle_cps), line_cps.size(),
                                                    needle_cps.size());
        if (score > best_score) {
            best_score = score;
            best_index = static_cast<int64_t>(i);
        }
    }

    match.score = best_score;
    if (best_score > options.similarity_threshold) {
        match.index = best_index;
        match.kind = MatchKind::Fuzzy;
    }
    return match;
}

std::string
patchy::repr(MatchKind kind) {
    switch (kind) {
        case MatchKind::Exact:
            return "exact";
        case MatchKind::Fuzzy:
            return "fuzzy";
        case MatchKind::Default:
            return "default";
    }
    return "unknown";
}
