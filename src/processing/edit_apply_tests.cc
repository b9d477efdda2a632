#include "processing/edit_apply.hpp"
#include "util/file_io.hpp"
#include "util/scoped_temp_dir.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchy;

namespace {

std::string
slurp(const std::string& path) {
    std::string content, error;
    REQUIRE(read_file(path, content, error));
    return content;
}

void
spit(const std::string& path, const std::string& content) {
    std::string error;
    REQUIRE(write_file(path, content, error));
}

}  // namespace

TEST_CASE("apply_fragments") {
    EngineOptions options;

    SUBCASE("window_heuristic_scenario") {
        std::vector<FragmentTrace> traces;
        auto result = apply_fragments("a\nb\nc\nd\ne", "b\nX\nd", options, &traces);
        CHECK(result == "b\nX\nd\nd\ne");
        REQUIRE(traces.size() == 1);
        CHECK(traces[0].match.index == 1);
        CHECK(traces[0].match.kind == MatchKind::Exact);
        CHECK(traces[0].window.start == 0);
        CHECK(traces[0].window.end == 4);
        CHECK(traces[0].window.replace_count == 3);
    }

    SUBCASE("markers_never_reach_the_output") {
        std::string original = "line 1\nline 2\nline 3\nline 4\nline 5\nline 6\nline 7\nline 8\nline 9\nline 10";
        std::string edit = "// ... existing code ...\nline 8\nline 8.5\n// ... existing code ...\n";
        std::vector<FragmentTrace> traces;
        auto result = apply_fragments(original, edit, options, &traces);
        REQUIRE(traces.size() == 1);
        CHECK(traces[0].match.index == 7);
        CHECK(result.find("existing code") == std::string::npos);
        CHECK(result == "line 1\nline 2\nline 3\nline 4\nline 8\nline 8.5\nline 7\nline 8\nline 9\nline 10");
    }

    SUBCASE("fragments_see_earlier_splices") {
        std::string original = "a\nb\nc\nd\ne\nf\ng\nh\ni\nj";
        std::string edit = "h\nH2\n// ... existing code ...\nH2\nH3";
        std::vector<FragmentTrace> traces;
        auto result = apply_fragments(original, edit, options, &traces);
        REQUIRE(traces.size() == 2);
        // The second fragment anchors on a line the first one inserted.
        CHECK(traces[1].match.kind == MatchKind::Exact);
        CHECK(traces[1].match.index == 5);
        CHECK(result == "a\nb\nH2\nH3\nh\nH2\ng\nh\ni\nj");
    }

    SUBCASE("empty_edit_keeps_lines") {
        CHECK(apply_fragments("a\nb\n", "", options) == "a\nb");
    }

    SUBCASE("unmatched_fragment_lands_at_top") {
        auto result = apply_fragments("alpha\nbeta\ngamma\ndelta", "something else entirely", options);
        CHECK(result == "something else entirely\nbeta\ngamma\ndelta");
    }
}

TEST_CASE("edit_file") {
    ScopedTempDir dir;
    EngineOptions options;

    SUBCASE("create_new_file") {
        auto path = dir.file("new.txt");
        std::string edit_text = "first\n// ... existing code ...\nlast\n";

        EditOutcome outcome;
        REQUIRE(edit_file(path, "create it", edit_text, options, outcome));
        CHECK(outcome.success);
        CHECK(outcome.created);
        CHECK(outcome.is_ok());
        CHECK(outcome.file == path);
        CHECK(slurp(path) == edit_text);

        REQUIRE(outcome.changes.size() == 3);
        for (const auto& line : outcome.changes) {
            CHECK(line.tag == DiffTag::Added);
        }
        CHECK(reconstruct(outcome.changes, DiffTag::Added) == edit_text);
    }

    SUBCASE("modify_existing_file") {
        auto path = dir.file("existing.txt");
        spit(path, "a\nb\nc\nd\ne\n");

        EditOutcome outcome;
        REQUIRE(edit_file(path, "", "b\nX\nd", options, outcome));
        CHECK(outcome.success);
        CHECK_FALSE(outcome.created);
        CHECK(slurp(path) == "b\nX\nd\nd\ne");

        CHECK(reconstruct(outcome.changes, DiffTag::Removed) == "a\nb\nc\nd\ne\n");
        CHECK(reconstruct(outcome.changes, DiffTag::Added) == "b\nX\nd\nd\ne");
    }

    SUBCASE("instructions_do_not_matter") {
        auto path_a = dir.file("a.txt");
        auto path_b = dir.file("b.txt");
        spit(path_a, "x\ny\nz\n");
        spit(path_b, "x\ny\nz\n");

        EditOutcome outcome_a, outcome_b;
        REQUIRE(edit_file(path_a, "rename y", "y2\nz", options, outcome_a));
        REQUIRE(edit_file(path_b, "something unrelated", "y2\nz", options, outcome_b));
        CHECK(slurp(path_a) == slurp(path_b));
    }

    SUBCASE("missing_parent_directory_is_an_io_error") {
        auto path = dir.file("no/such/dir/file.txt");

        EditOutcome outcome;
        CHECK_FALSE(edit_file(path, "", "content", options, outcome));
        CHECK_FALSE(outcome.success);
        CHECK(outcome.error_kind == EditErrorKind::Io);
        CHECK_FALSE(outcome.error.empty());
        CHECK_FALSE(file_exists(path));
    }

    SUBCASE("directory_target_is_an_io_error") {
        EditOutcome outcome;
        CHECK_FALSE(edit_file(dir.path().string(), "", "content", options, outcome));
        CHECK(outcome.error_kind == EditErrorKind::Io);
    }
}
