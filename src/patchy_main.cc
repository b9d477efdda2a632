#include "config/config.hpp"
#include "output/edit_report.hpp"
#include "processing/edit_apply.hpp"
#include "tools/backup_store.hpp"
#include "tools/text_editor.hpp"
#include "util/file_io.hpp"
#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace {

enum LongOnlyOption {
    kOptOld = 1000,
    kOptNew,
    kOptLine,
    kOptColor,
    kOptNoColor,
};

bool
read_stdin(std::string& content, std::string& error) {
    content.clear();
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), stdin)) > 0) {
        content.append(buffer, n);
    }
    if (ferror(stdin)) {
        error = fmt::format("Failed to read stdin: {}", strerror(errno));
        return false;
    }
    return true;
}

bool
parse_int(const char* text, int64_t& value) {
    if (!text || !*text) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = strtoll(text, &end, 10);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

bool
parse_double(const char* text, double& value) {
    if (!text || !*text) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double parsed = strtod(text, &end);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

}  // namespace

int
main(int argc, char* argv[]) {
    patchy::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] target_file [edit_file]

Apply a partial edit to a file. The edit is read from `edit_file`, or from
stdin when it is missing or '-'. Unchanged regions of the file can be left
out of the edit with comment lines like `// ... existing code ...`.

Options:
    -v, --version                show program version and exit
    -h, --help                   show this help and exit
    -m, --message [text]         describe the edit; shown with --verbose
    -c, --command [command]      what to do with target_file
                                     edit        (default) apply the edit
                                     view        print the file
                                     create      create the file with --new as its content
                                     str_replace replace --old with --new
                                     insert      insert --new as line --line
    --old [text]                 text to replace
    --new [text]                 replacement, inserted line or new file content
    --line [n]                   1-based line number for insert

    -C, --context-lines [n]      lines around the anchor an edit may replace
    -t, --threshold [f]          minimum similarity for a fuzzy anchor (0.0 - 1.0)

    --color, --no-color          force colored output on or off
    -q, --quiet                  don't print the resulting diff
    -V, --verbose                print where each part of the edit was placed
)",
                                       argv[0]);

        help += "\n";

        help += "Config directory:\n    " + patchy::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"message", required_argument, 0, 'm'},
                                               {"command", required_argument, 0, 'c'},
                                               {"context-lines", required_argument, 0, 'C'},
                                               {"threshold", required_argument, 0, 't'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {"verbose", no_argument, 0, 'V'},
                                               {"old", required_argument, 0, kOptOld},
                                               {"new", required_argument, 0, kOptNew},
                                               {"line", required_argument, 0, kOptLine},
                                               {"color", no_argument, 0, kOptColor},
                                               {"no-color", no_argument, 0, kOptNoColor},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvm:c:C:t:qV", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    opts.version = true;
                    return true;
                case 'h':
                    opts.help = true;
                    return true;
                case 'm':
                    opts.instructions = optarg;
                    break;
                case 'c':
                    opts.command = optarg;
                    break;
                case 'C': {
                    int64_t value = 0;
                    if (!parse_int(optarg, value) || value < 0) {
                        show_help(fmt::format("error: invalid value for -C ({})\n", optarg));
                        return false;
                    }
                    opts.context_lines = value;
                } break;
                case 't': {
                    double value = 0.0;
                    if (!parse_double(optarg, value) || value < 0.0 || value > 1.0) {
                        show_help(fmt::format("error: invalid value for -t ({})\n", optarg));
                        return false;
                    }
                    opts.similarity_threshold = value;
                } break;
                case 'q':
                    opts.quiet = true;
                    break;
                case 'V':
                    opts.verbose = true;
                    break;
                case kOptOld:
                    opts.old_str = optarg;
                    break;
                case kOptNew:
                    opts.new_str = optarg;
                    break;
                case kOptLine: {
                    if (!parse_int(optarg, opts.insert_line)) {
                        show_help(fmt::format("error: invalid value for --line ({})\n", optarg));
                        return false;
                    }
                } break;
                case kOptColor:
                    opts.color = true;
                    break;
                case kOptNoColor:
                    opts.color = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        // undo_edit needs a backup from earlier in the same process
        auto command = patchy::text_editor_command_from_string(opts.command);
        if (command == patchy::TextEditorCommand::Unknown || command == patchy::TextEditorCommand::UndoEdit) {
            show_help(fmt::format("error: unknown command '{}'", opts.command));
            return false;
        }

        int positional_count = in_argc - optind;
        bool takes_edit_file = opts.command == "edit";
        if (positional_count < 1 || positional_count > (takes_edit_file ? 2 : 1)) {
            show_help(positional_count < 1 ? "error: missing target file" : "error: too many arguments");
            return false;
        }

        opts.target_file = in_argv[optind];
        if (positional_count == 2) {
            opts.edit_file = in_argv[optind + 1];
        }

        auto status = patchy::check_file_status(opts.target_file);
        if (status == patchy::FileStatus::kNullPath || status == patchy::FileStatus::kFileNotReadable ||
            status == patchy::FileStatus::kNoPermission) {
            show_help(fmt::format("Target '{}': {}\n", opts.target_file, patchy::to_string(status)));
            return false;
        }
        return true;
    };

    if (!parse_args(argc, argv)) {
        return -1;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    if (opts.version) {
        fmt::print("version: {}\n", PATCHY_VERSION);
        fmt::print("vcs hash: {}\n", PATCHY_BUILD_HASH);
        return 0;
    }

    // Load the global defaults before we override them with command line args
    patchy::ConfigSettings settings;
    patchy::config_apply_options(settings);

    auto& engine = settings.engine;
    if (opts.context_lines) {
        engine.context_lines = *opts.context_lines;
    }
    if (opts.similarity_threshold) {
        engine.similarity_threshold = *opts.similarity_threshold;
    }
    engine.verbose = opts.verbose;

    auto& style = settings.style;
    style.color = opts.color ? *opts.color : settings.color && patchy::tty_supports_color();

    if (opts.command == "edit") {
        std::string edit_text, error;
        bool read_ok = opts.edit_file.empty() || opts.edit_file == "-"
                           ? read_stdin(edit_text, error)
                           : patchy::read_file(opts.edit_file, edit_text, error);
        if (!read_ok) {
            fmt::print(stderr, "error: {}\n", error);
            return 1;
        }

        patchy::EditOutcome outcome;
        patchy::edit_file(opts.target_file, opts.instructions, edit_text, engine, outcome);

        if (!opts.quiet || !outcome.success) {
            for (const auto& line : patchy::edit_report_render(outcome, style)) {
                fmt::print(outcome.success ? stdout : stderr, "{}\n", line);
            }
        }
        return outcome.success ? 0 : 1;
    }

    // The store lives as long as this process does
    patchy::BackupStore backups;
    patchy::EditContext context{backups};

    patchy::TextEditorRequest request;
    request.command = opts.command;
    request.path = opts.target_file;
    request.file_text = opts.new_str;
    request.old_str = opts.old_str;
    request.new_str = opts.new_str;
    request.insert_line = opts.insert_line;
    request.instructions = opts.instructions;

    auto result = patchy::text_editor_run(context, request, engine);
    if (!result.success) {
        fmt::print(stderr, "error: {}\n", result.message);
        return 1;
    }

    if (request.command == "view") {
        fmt::print("{}", result.file_content.value_or(""));
    } else if (!opts.quiet) {
        fmt::print("{}\n", result.message);
    }
    return 0;
}
