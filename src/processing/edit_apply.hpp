#pragma once

/*
    Apply edit text to a file.

    A missing file is created with the edit text as its content. An existing
    file is split into a working buffer; each fragment of the edit text is
    anchored and spliced into that buffer in turn, so later fragments see the
    result of earlier ones. The buffer is joined with '\n' and written back
    over the file. Nothing is rolled back on failure.
*/

#include "processing/anchor_locator.hpp"
#include "processing/block_splicer.hpp"
#include "processing/engine_options.hpp"
#include "processing/line_diff.hpp"
#include "processing/marker_segmenter.hpp"

#include <string>
#include <vector>

namespace patchy {

enum class EditErrorKind {
    None,
    Io,
};

struct EditOutcome {
    bool success = false;
    std::string file;
    bool created = false;
    std::vector<DiffLine> changes;

    EditErrorKind error_kind = EditErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return error_kind == EditErrorKind::None;
    }
};

// What happened to one fragment.
struct FragmentTrace {
    AnchorMatch match;
    SpliceWindow window;
    std::size_t fragment_size = 0;
};

// Run every fragment of `edit_text` against the lines of `original` and
// return the joined result. Pass `traces` to see where each fragment went.
std::string
apply_fragments(const std::string& original,
                const std::string& edit_text,
                const EngineOptions& options,
                std::vector<FragmentTrace>* traces = nullptr);

// `instructions` is only shown to the user; it does not change the result.
bool
edit_file(const std::string& path,
          const std::string& instructions,
          const std::string& edit_text,
          const EngineOptions& options,
          EditOutcome& outcome);

}  // namespace patchy
