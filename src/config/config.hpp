#pragma once

#include "output/edit_report.hpp"
#include "processing/engine_options.hpp"
#include "util/config_parser/config_parser.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace patchy {

struct ProgramOptions {
    bool help = false;
    bool version = false;
    bool quiet = false;
    bool verbose = false;

    // edit, view, create, str_replace, insert
    std::string command = "edit";

    std::string target_file;

    // Empty or "-" reads the edit text from stdin
    std::string edit_file;

    std::string instructions;

    std::string old_str;
    std::string new_str;
    int64_t insert_line = 0;

    // Command line overrides; unset means "use the config file"
    std::optional<int64_t> context_lines;
    std::optional<double> similarity_threshold;
    std::optional<bool> color;
};

// Everything the config file can set.
struct ConfigSettings {
    EngineOptions engine;
    EditReportStyle style;

    // Colors are used when stdout is a terminal and this is set
    bool color = true;
};

std::string
config_get_directory();

// Read `patchy.conf` in `config_root` into `settings`. Keys missing from the
// file keep the values already in `settings`. A missing file is created
// with those values. Returns false if the file exists but could not be used.
bool
config_apply_options(const std::string& config_root, ConfigSettings& settings);

// Same, using the user's config directory.
bool
config_apply_options(ConfigSettings& settings);

}  // namespace patchy
