#include "edit_apply.hpp"

#include "util/file_io.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

#include <cstdio>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace patchy;

namespace {

void
set_io_error(EditOutcome& outcome, std::string error) {
    outcome.success = false;
    outcome.error_kind = EditErrorKind::Io;
    outcome.error = std::move(error);
}

void
print_trace(const std::string& path, const std::vector<FragmentTrace>& traces) {
    for (std::size_t i = 0; i < traces.size(); i++) {
        const auto& t = traces[i];
        fmt::print(stderr, "{}: fragment {}/{} ({} lines): {} anchor at line {} (score {:.3f}), replaced {} lines from {}\n",
                   path, i + 1, traces.size(), t.fragment_size, repr(t.match.kind), t.match.index + 1,
                   t.match.score, t.window.replace_count, t.window.start + 1);
    }
}

}  // namespace

std::string
patchy::apply_fragments(const std::string& original,
                        const std::string& edit_text,
                        const EngineOptions& options,
                        std::vector<FragmentTrace>* traces) {
    auto buffer = split_lines(original);
    const auto fragments = segment_edit(edit_text, options.comment_tokens);

    TRACE("apply_fragments: {} buffer lines, {} fragments\n", buffer.size(), fragments.size());

    for (const auto& fragment : fragments) {
        const auto match = locate_anchor(fragment, buffer, options);
        const auto window = splice_block(buffer, match.index, fragment, options.context_lines);
        if (traces) {
            traces->push_back({match, window, fragment.size()});
        }
    }

    return join_lines(buffer);
}

bool
patchy::edit_file(const std::string& path,
                  const std::string& instructions,
                  const std::string& edit_text,
                  const EngineOptions& options,
                  EditOutcome& outcome) {
    outcome = EditOutcome{};
    outcome.file = path;

    if (options.verbose) {
        fmt::print(stderr, "editing {} - {}\n", path, instructions);
    }

    std::string error;
    if (!file_exists(path)) {
        if (!write_file(path, edit_text, error)) {
            set_io_error(outcome, error);
            return false;
        }
        outcome.success = true;
        outcome.created = true;
        outcome.changes = all_added(edit_text);
        return true;
    }

    std::string original;
    if (!read_file(path, original, error)) {
        set_io_error(outcome, error);
        return false;
    }

    std::vector<FragmentTrace> traces;
    const auto updated = apply_fragments(original, edit_text, options, &traces);
    if (options.verbose) {
        print_trace(path, traces);
    }

    if (!write_file(path, updated, error)) {
        set_io_error(outcome, error);
        return false;
    }

    if (!compute_line_diff(original, updated, outcome.changes)) {
        // The file is already written at this point.
        fmt::print(stderr, "warning: could not compute diff for '{}'\n", path);
    }

    outcome.success = true;
    outcome.created = false;
    return true;
}
