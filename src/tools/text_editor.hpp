#pragma once

/*
    Direct file edit commands: view, create, str_replace, insert, undo_edit
    and the fragment based edit.

    Commands that change an existing file take a snapshot in the context's
    BackupStore first; undo_edit puts the latest snapshot back. Failures are
    reported in the result and never thrown.
*/

#include "processing/edit_apply.hpp"
#include "processing/engine_options.hpp"
#include "tools/backup_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchy {

enum class TextEditorCommand {
    Unknown,
    View,
    Create,
    StrReplace,
    Insert,
    UndoEdit,
    Edit,
};

TextEditorCommand
text_editor_command_from_string(const std::string& s);

std::string
repr(TextEditorCommand command);

struct TextEditorRequest {
    std::string command;
    std::string path;

    // create
    std::string file_text;

    // str_replace, insert
    std::string old_str;
    std::string new_str;

    // insert; 1-based
    int64_t insert_line = 0;

    // edit
    std::string instructions;
    std::string code_edit;
};

struct TextEditorResult {
    bool success = false;
    std::string message;
    std::optional<std::string> file_content;
    bool changes_made = false;

    // Only filled in by the edit command
    std::vector<DiffLine> changes;
};

TextEditorResult
text_editor_run(EditContext& context, const TextEditorRequest& request, const EngineOptions& options);

// The text handed back to whoever issued the command.
std::string
format_tool_response(const TextEditorResult& result);

}  // namespace patchy
