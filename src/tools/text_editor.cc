#include "text_editor.hpp"

#include "util/file_io.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>

using namespace patchy;

namespace {

TextEditorResult
failure(std::string message, std::optional<std::string> file_content = std::nullopt) {
    TextEditorResult result;
    result.success = false;
    result.message = std::move(message);
    result.file_content = std::move(file_content);
    return result;
}

TextEditorResult
success(std::string message, std::optional<std::string> file_content, bool changes_made) {
    TextEditorResult result;
    result.success = true;
    result.message = std::move(message);
    result.file_content = std::move(file_content);
    result.changes_made = changes_made;
    return result;
}

std::string
replace_all(const std::string& text, const std::string& from, const std::string& to) {
    std::string result;
    std::string::size_type pos = 0;
    std::string::size_type match = 0;
    while ((match = text.find(from, pos)) != std::string::npos) {
        result.append(text, pos, match - pos);
        result += to;
        pos = match + from.size();
    }
    result.append(text, pos, std::string::npos);
    return result;
}

TextEditorResult
run_view(const TextEditorRequest& request) {
    const auto& path = request.path;
    if (path.empty()) {
        return failure("File path is required for view command");
    }

    std::string content, error;
    if (!read_file(path, content, error)) {
        return failure(fmt::format("Failed to read file {}: {}", path, error));
    }
    return success(fmt::format("Successfully read file: {}", path), content, false);
}

TextEditorResult
run_create(const TextEditorRequest& request) {
    const auto& path = request.path;
    if (path.empty()) {
        return failure("File path is required for create command");
    }

    if (file_exists(path)) {
        return failure(
            fmt::format("File {} already exists. Use str_replace to modify existing files.", path));
    }

    std::string error;
    if (!create_parent_directories(path, error)) {
        return failure(fmt::format("Failed to create file {}: {}", path, error));
    }

    if (!write_file(path, request.file_text, error)) {
        return failure(fmt::format("Failed to create file {}: {}", path, error));
    }
    return success(fmt::format("Successfully created file: {}", path), request.file_text, true);
}

TextEditorResult
run_str_replace(EditContext& context, const TextEditorRequest& request) {
    const auto& path = request.path;
    if (path.empty() || request.old_str.empty()) {
        return failure("File path and old_str are required for str_replace command");
    }

    std::string current, error;
    if (!read_file(path, current, error)) {
        return failure(fmt::format("Failed to read file {}: {}", path, error));
    }

    context.backups.snapshot(path, current);

    if (current.find(request.old_str) == std::string::npos) {
        return failure(fmt::format("String '{}' not found in file {}", request.old_str, path), current);
    }

    auto updated = replace_all(current, request.old_str, request.new_str);
    if (!write_file(path, updated, error)) {
        return failure(fmt::format("Failed to write to file {}: {}", path, error));
    }
    return success(fmt::format("Successfully replaced text in {}", path), updated, true);
}

TextEditorResult
run_insert(EditContext& context, const TextEditorRequest& request) {
    const auto& path = request.path;
    if (path.empty()) {
        return failure("File path is required for insert command");
    }

    std::string current, error;
    if (!read_file(path, current, error)) {
        return failure(fmt::format("Failed to read file {}: {}", path, error));
    }

    context.backups.snapshot(path, current);

    auto lines = split_lines(current);
    const auto line_count = static_cast<int64_t>(lines.size());
    if (request.insert_line <= 0 || request.insert_line > line_count + 1) {
        return failure(fmt::format("Invalid line number: {}. File has {} lines.", request.insert_line, line_count),
                       current);
    }

    lines.insert(lines.begin() + (request.insert_line - 1), request.new_str);
    auto updated = join_lines(lines);

    if (!write_file(path, updated, error)) {
        return failure(fmt::format("Failed to write to file {}: {}", path, error));
    }
    return success(fmt::format("Successfully inserted text at line {} in {}", request.insert_line, path), updated,
                   true);
}

TextEditorResult
run_undo(EditContext& context, const TextEditorRequest& request) {
    const auto& path = request.path;
    if (path.empty()) {
        return failure("File path is required for undo_edit command");
    }

    if (!context.backups.contains(path)) {
        return failure(fmt::format("No backup found for file: {}", path));
    }

    // Only drop the snapshot once it is back on disk.
    auto backup = context.backups.take(path);
    std::string error;
    if (!write_file(path, backup->original_content, error)) {
        context.backups.snapshot(path, backup->original_content);
        return failure(fmt::format("Failed to restore file {}: {}", path, error));
    }

    return success(fmt::format("Successfully restored {} from backup created at {}", path,
                               format_timestamp(backup->timestamp)),
                   backup->original_content, true);
}

TextEditorResult
run_edit(EditContext& context, const TextEditorRequest& request, const EngineOptions& options) {
    const auto& path = request.path;
    if (path.empty()) {
        return failure("File path is required for edit command");
    }

    if (file_exists(path)) {
        std::string current, error;
        if (!read_file(path, current, error)) {
            return failure(fmt::format("Failed to read file {}: {}", path, error));
        }
        context.backups.snapshot(path, current);
    }

    EditOutcome outcome;
    if (!edit_file(path, request.instructions, request.code_edit, options, outcome)) {
        return failure(fmt::format("Failed to edit file {}: {}", path, outcome.error));
    }

    auto result = success(fmt::format("Successfully {} {}", outcome.created ? "created" : "edited", path),
                          std::nullopt, true);
    result.changes = std::move(outcome.changes);
    return result;
}

}  // namespace

TextEditorCommand
patchy::text_editor_command_from_string(const std::string& s) {
    if (s == "view")
        return TextEditorCommand::View;
    else if (s == "create")
        return TextEditorCommand::Create;
    else if (s == "str_replace")
        return TextEditorCommand::StrReplace;
    else if (s == "insert")
        return TextEditorCommand::Insert;
    else if (s == "undo_edit")
        return TextEditorCommand::UndoEdit;
    else if (s == "edit")
        return TextEditorCommand::Edit;
    return TextEditorCommand::Unknown;
}

std::string
patchy::repr(TextEditorCommand command) {
    switch (command) {
        case TextEditorCommand::View:
            return "view";
        case TextEditorCommand::Create:
            return "create";
        case TextEditorCommand::StrReplace:
            return "str_replace";
        case TextEditorCommand::Insert:
            return "insert";
        case TextEditorCommand::UndoEdit:
            return "undo_edit";
        case TextEditorCommand::Edit:
            return "edit";
        case TextEditorCommand::Unknown:
            break;
    }
    return "unknown";
}

TextEditorResult
patchy::text_editor_run(EditContext& context, const TextEditorRequest& request, const EngineOptions& options) {
    if (options.verbose) {
        fmt::print(stderr, "command: {}\nfile path: {}\n", request.command, request.path);
    }

    switch (text_editor_command_from_string(request.command)) {
        case TextEditorCommand::View:
            return run_view(request);
        case TextEditorCommand::Create:
            return run_create(request);
        case TextEditorCommand::StrReplace:
            return run_str_replace(context, request);
        case TextEditorCommand::Insert:
            return run_insert(context, request);
        case TextEditorCommand::UndoEdit:
            return run_undo(context, request);
        case TextEditorCommand::Edit:
            return run_edit(context, request, options);
        case TextEditorCommand::Unknown:
            break;
    }
    return failure(fmt::format("Unknown command: {}", request.command));
}

std::string
patchy::format_tool_response(const TextEditorResult& result) {
    if (!result.success) {
        return fmt::format("Tool execution failed: {}", result.message);
    }
    if (result.file_content) {
        return fmt::format("Tool execution successful: {}\n\nFile content:\n{}", result.message,
                           *result.file_content);
    }
    return fmt::format("Tool execution successful: {}", result.message);
}
