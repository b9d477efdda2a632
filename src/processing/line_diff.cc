#include "line_diff.hpp"

#include "algorithms/myers_greedy.hpp"
#include "util/readlines.hpp"

#include <gsl/span>

#include <utility>

using namespace patchy;

bool
patchy::compute_line_diff(const std::string& original,
                          const std::string& final_text,
                          std::vector<DiffLine>& diff) {
    diff.clear();

    std::vector<Line> a_lines;
    std::vector<Line> b_lines;
    parselines(original, a_lines);
    parselines(final_text, b_lines);

    DiffInput<Line> diff_input{gsl::span<Line>{a_lines}, gsl::span<Line>{b_lines}};
    DiffResult result = MyersGreedy<Line>(diff_input).compute();

    if (result.status == DiffResultStatus::Failed) {
        return false;
    }

    diff.reserve(result.edit_sequence.size());
    for (const auto& e : result.edit_sequence) {
        switch (e.type) {
            case EditType::Delete:
                diff.push_back({DiffTag::Removed, a_lines[static_cast<size_t>(e.a_index)].line});
                break;
            case EditType::Insert:
                diff.push_back({DiffTag::Added, b_lines[static_cast<size_t>(e.b_index)].line});
                break;
            case EditType::Common:
                diff.push_back({DiffTag::Unchanged, a_lines[static_cast<size_t>(e.a_index)].line});
                break;
        }
    }
    return true;
}

std::vector<DiffLine>
patchy::all_added(const std::string& text) {
    std::vector<Line> lines;
    parselines(text, lines);

    std::vector<DiffLine> diff;
    diff.reserve(lines.size());
    for (auto& line : lines) {
        diff.push_back({DiffTag::Added, std::move(line.line)});
    }
    return diff;
}

std::string
patchy::reconstruct(const std::vector<DiffLine>& diff, DiffTag tag) {
    std::string text;
    for (const auto& line : diff) {
        if (line.tag == DiffTag::Unchanged || line.tag == tag) {
            text += line.text;
        }
    }
    return text;
}

std::string
patchy::repr(DiffTag tag) {
    switch (tag) {
        case DiffTag::Unchanged:
            return "unchanged";
        case DiffTag::Removed:
            return "removed";
        case DiffTag::Added:
            return "added";
    }
    return "unknown";
}
