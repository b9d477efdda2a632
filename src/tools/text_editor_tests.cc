#include "tools/text_editor.hpp"
#include "util/file_io.hpp"
#include "util/scoped_temp_dir.hpp"

#include <doctest.h>
#include <fmt/format.h>

#include <string>

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

TextEditorRequest
make_request(const std::string& command, const std::string& path) {
    TextEditorRequest request;
    request.command = command;
    request.path = path;
    return request;
}

}  // namespace

TEST_CASE("text_editor_command_from_string") {
    CHECK(text_editor_command_from_string("view") == TextEditorCommand::View);
    CHECK(text_editor_command_from_string("create") == TextEditorCommand::Create);
    CHECK(text_editor_command_from_string("str_replace") == TextEditorCommand::StrReplace);
    CHECK(text_editor_command_from_string("insert") == TextEditorCommand::Insert);
    CHECK(text_editor_command_from_string("undo_edit") == TextEditorCommand::UndoEdit);
    CHECK(text_editor_command_from_string("edit") == TextEditorCommand::Edit);
    CHECK(text_editor_command_from_string("delete") == TextEditorCommand::Unknown);
    CHECK(repr(TextEditorCommand::StrReplace) == "str_replace");
}

TEST_CASE("text_editor_run") {
    ScopedTempDir dir;
    BackupStore backups;
    EditContext context{backups};
    EngineOptions options;

    SUBCASE("unknown_command") {
        auto result = text_editor_run(context, make_request("delete", dir.file("x.txt")), options);
        CHECK_FALSE(result.success);
        CHECK(result.message == "Unknown command: delete");
    }

    SUBCASE("view") {
        auto path = dir.file("view.txt");
        spit(path, "hello\n");

        auto result = text_editor_run(context, make_request("view", path), options);
        CHECK(result.success);
        CHECK_FALSE(result.changes_made);
        REQUIRE(result.file_content);
        CHECK(*result.file_content == "hello\n");

        auto missing = text_editor_run(context, make_request("view", dir.file("missing.txt")), options);
        CHECK_FALSE(missing.success);
        CHECK(missing.message.find("Failed to read file") == 0);

        auto no_path = text_editor_run(context, make_request("view", ""), options);
        CHECK(no_path.message == "File path is required for view command");
    }

    SUBCASE("create") {
        auto path = dir.file("sub/dir/new.txt");
        auto request = make_request("create", path);
        request.file_text = "content";

        auto result = text_editor_run(context, request, options);
        CHECK(result.success);
        CHECK(result.changes_made);
        CHECK(slurp(path) == "content");

        auto again = text_editor_run(context, request, options);
        CHECK_FALSE(again.success);
        CHECK(again.message == fmt::format("File {} already exists. Use str_replace to modify existing files.", path));
    }

    SUBCASE("str_replace_replaces_every_occurrence") {
        auto path = dir.file("replace.txt");
        spit(path, "foo bar foo");

        auto request = make_request("str_replace", path);
        request.old_str = "foo";
        request.new_str = "baz";

        auto result = text_editor_run(context, request, options);
        CHECK(result.success);
        CHECK(slurp(path) == "baz bar baz");
        CHECK(backups.contains(path));
    }

    SUBCASE("str_replace_missing_text") {
        auto path = dir.file("replace.txt");
        spit(path, "abc");

        auto request = make_request("str_replace", path);
        request.old_str = "xyz";

        auto result = text_editor_run(context, request, options);
        CHECK_FALSE(result.success);
        CHECK(result.message == fmt::format("String 'xyz' not found in file {}", path));
        REQUIRE(result.file_content);
        CHECK(*result.file_content == "abc");
        CHECK(slurp(path) == "abc");
    }

    SUBCASE("str_replace_requires_old_str") {
        auto result = text_editor_run(context, make_request("str_replace", dir.file("a.txt")), options);
        CHECK(result.message == "File path and old_str are required for str_replace command");
    }

    SUBCASE("insert") {
        auto path = dir.file("insert.txt");
        spit(path, "one\ntwo\nthree\n");

        auto request = make_request("insert", path);
        request.insert_line = 2;
        request.new_str = "one and a half";

        auto result = text_editor_run(context, request, options);
        CHECK(result.success);
        CHECK(slurp(path) == "one\none and a half\ntwo\nthree");

        request.insert_line = 5;
        result = text_editor_run(context, request, options);
        CHECK(result.success);
        CHECK(slurp(path) == "one\none and a half\ntwo\nthree\none and a half");
    }

    SUBCASE("insert_out_of_range") {
        auto path = dir.file("insert.txt");
        spit(path, "one\ntwo\n");

        auto request = make_request("insert", path);
        request.insert_line = 4;
        request.new_str = "x";

        auto result = text_editor_run(context, request, options);
        CHECK_FALSE(result.success);
        CHECK(result.message == "Invalid line number: 4. File has 2 lines.");

        request.insert_line = 0;
        result = text_editor_run(context, request, options);
        CHECK(result.message == "Invalid line number: 0. File has 2 lines.");
        CHECK(slurp(path) == "one\ntwo\n");
    }

    SUBCASE("undo_restores_previous_content") {
        auto path = dir.file("undo.txt");
        spit(path, "original");

        auto request = make_request("str_replace", path);
        request.old_str = "original";
        request.new_str = "changed";
        REQUIRE(text_editor_run(context, request, options).success);
        CHECK(slurp(path) == "changed");

        auto undo = text_editor_run(context, make_request("undo_edit", path), options);
        CHECK(undo.success);
        CHECK(undo.message.find("Successfully restored " + path + " from backup created at ") == 0);
        CHECK(slurp(path) == "original");
        CHECK_FALSE(backups.contains(path));

        auto again = text_editor_run(context, make_request("undo_edit", path), options);
        CHECK_FALSE(again.success);
        CHECK(again.message == "No backup found for file: " + path);
    }

    SUBCASE("edit_snapshots_existing_file") {
        auto path = dir.file("edit.txt");
        spit(path, "a\nb\nc\nd\ne\n");

        auto request = make_request("edit", path);
        request.code_edit = "b\nX\nd";

        auto result = text_editor_run(context, request, options);
        CHECK(result.success);
        CHECK(result.message == "Successfully edited " + path);
        CHECK_FALSE(result.changes.empty());
        CHECK(slurp(path) == "b\nX\nd\nd\ne");

        REQUIRE(text_editor_run(context, make_request("undo_edit", path), options).success);
        CHECK(slurp(path) == "a\nb\nc\nd\ne\n");
    }

    SUBCASE("edit_creates_missing_file") {
        auto path = dir.file("fresh.txt");
        auto request = make_request("edit", path);
        request.code_edit = "hello";

        auto result = text_editor_run(context, request, options);
        CHECK(result.success);
        CHECK(result.message == "Successfully created " + path);
        CHECK_FALSE(backups.contains(path));
    }
}

TEST_CASE("format_tool_response") {
    TextEditorResult result;
    result.success = false;
    result.message = "nope";
    CHECK(format_tool_response(result) == "Tool execution failed: nope");

    result.success = true;
    result.message = "done";
    CHECK(format_tool_response(result) == "Tool execution successful: done");

    result.file_content = "body";
    CHECK(format_tool_response(result) == "Tool execution successful: done\n\nFile content:\nbody");
}
