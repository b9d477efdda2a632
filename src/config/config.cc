#include "config.hpp"

#include "util/color.hpp"
#include "util/config_parser/config_parser.hpp"
#include "util/file_io.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

using namespace patchy;

static std::string config_doc_general = R"foo(# General configuration for `patchy`
#
# These are the defaults; command-line arguments override them.
#
#   context_lines         lines on each side of the anchor a fragment may replace
#   match_context_lines   non-blank fragment lines collected for anchoring
#   similarity_threshold  a fuzzy anchor must score above this (0.0 - 1.0)
#   comment_tokens        comment openers that can start an elision marker
#   color                 colorize the diff when writing to a terminal
)foo";

static std::string config_doc_style = R"foo(# Diff colors
#
# A style is a space separated list: a foreground color, an optional
# background color prefixed with `on_`, and attributes. I.e:
#   'bold light_red', 'black on_green', 'underline'
#
# Available color names (16 color palette SGR colors):
#   black, red, green, yellow, blue, magenta, cyan, light_gray,
#   dark_gray, light_red, light_green, light_yellow, light_blue,
#   light_magenta, light_cyan, white
#
# Available attributes:
#   'bold', 'dim', 'italic', 'underline',
#   'blink', 'inverse', 'hidden', 'strikethrough'
)foo";

namespace {

const char* config_file_name = "patchy.conf";

enum class ConfigVariableType {
    Bool,
    Int,
    Float,
    StringList,
    Style,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

ConfigLoadResult
config_load_file(const std::string& config_path, Value& config_table, ParseResult& load_result) {
    if (check_file_status(config_path) == FileStatus::kFileDoesNotExist) {
        return ConfigLoadResult::DoesNotExist;
    }
    if (!cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Invalid;
    }
    return ConfigLoadResult::Ok;
}

bool
config_save(const std::string& config_root, const std::string& config_path, const Value& config_value) {
    std::error_code ec;
    std::filesystem::create_directories(config_root, ec);
    if (ec) {
        fmt::print(stderr, "warning: failed to create '{}': {}\n", config_root, ec.message());
        return false;
    }

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        fmt::print(stderr, "warning: failed to open '{}' for writing.\n", config_path);
        fmt::print(stderr, "   errno ({}) = {}\n", errno, strerror(errno));
        return false;
    }

    std::string serialized = cfg_serialize(config_value);
    bool ok = fwrite(serialized.data(), 1, serialized.size(), f) == serialized.size();
    ok = fclose(f) == 0 && ok;
    if (!ok) {
        fmt::print(stderr, "warning: failed to write '{}'\n", config_path);
    }
    return ok;
}

Value
to_value(ConfigVariableType type, void* ptr) {
    switch (type) {
        case ConfigVariableType::Bool:
            return Value{Value::Bool{*(bool*) ptr}};
        case ConfigVariableType::Int:
            return Value{Value::Int{*(int64_t*) ptr}};
        case ConfigVariableType::Float:
            return Value{Value::Float{*(double*) ptr}};
        case ConfigVariableType::StringList: {
            Value list{Value::Array{}};
            for (const auto& s : *(std::vector<std::string>*) ptr) {
                list.as_array().push_back(Value{Value::String{s}});
            }
            return list;
        }
        case ConfigVariableType::Style:
            return Value{Value::String{((TermStyle*) ptr)->to_string()}};
    }
    return Value{};
}

// Write `stored` into the settings field. Returns false when the stored
// value has the wrong type or an unusable value.
bool
from_value(ConfigVariableType type, const Value& stored, void* ptr) {
    switch (type) {
        case ConfigVariableType::Bool: {
            if (!stored.is_bool()) {
                return false;
            }
            *(bool*) ptr = stored.as_bool();
        } break;
        case ConfigVariableType::Int: {
            if (!stored.is_int() || stored.as_int() < 0) {
                return false;
            }
            *(int64_t*) ptr = stored.as_int();
        } break;
        case ConfigVariableType::Float: {
            double value = 0.0;
            if (stored.is_float()) {
                value = stored.as_float();
            } else if (stored.is_int()) {
                value = (double) stored.as_int();
            } else {
                return false;
            }
            if (value < 0.0 || value > 1.0) {
                return false;
            }
            *(double*) ptr = value;
        } break;
        case ConfigVariableType::StringList: {
            if (!stored.is_array()) {
                return false;
            }
            std::vector<std::string> list;
            for (const auto& item : stored.as_array()) {
                if (!item.is_string() || item.as_string().empty()) {
                    return false;
                }
                list.push_back(item.as_string());
            }
            *(std::vector<std::string>*) ptr = list;
        } break;
        case ConfigVariableType::Style: {
            if (!stored.is_string()) {
                return false;
            }
            auto style = TermStyle::parse_string(stored.as_string());
            if (!style) {
                return false;
            }
            *(TermStyle*) ptr = *style;
        } break;
    }
    return true;
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

void
config_apply_options(Value& config, const OptionVector& options, const std::string& config_path) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            if (!from_value(type, stored_value->get(), ptr)) {
                fmt::print(stderr, "warning: ignoring invalid value for '{}' in {}\n", path, config_path);
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            config.set_value_at(path, to_value(type, ptr));
        }
    }
}

}  // namespace

std::string
patchy::config_get_directory() {
    return fmt::format("{}/patchy", sago::getConfigHome());
}

bool
patchy::config_apply_options(const std::string& config_root, ConfigSettings& settings) {
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value{Value::Table{}};
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            return false;
        } break;
        case ConfigLoadResult::DoesNotExist: {
            fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
            flush_config_to_disk = true;
        } break;
    };

    // clang-format off
    const OptionVector options = {
        { "general.context_lines",        ConfigVariableType::Int,        &settings.engine.context_lines },
        { "general.match_context_lines",  ConfigVariableType::Int,        &settings.engine.match_context_lines },
        { "general.similarity_threshold", ConfigVariableType::Float,      &settings.engine.similarity_threshold },
        { "general.comment_tokens",       ConfigVariableType::StringList, &settings.engine.comment_tokens },
        { "general.color",                ConfigVariableType::Bool,       &settings.color },

        { "style.header",                 ConfigVariableType::Style,      &settings.style.header },
        { "style.added",                  ConfigVariableType::Style,      &settings.style.added },
        { "style.removed",                ConfigVariableType::Style,      &settings.style.removed },
    };
    // clang-format on

    config_apply_options(config_file_table_value, options, config_path);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_file_table_value["general"].key_comments.push_back(config_doc_general);
        config_file_table_value["style"].key_comments.push_back(config_doc_style);
        config_save(config_root, config_path, config_file_table_value);
    }
    return true;
}

bool
patchy::config_apply_options(ConfigSettings& settings) {
    return config_apply_options(config_get_directory(), settings);
}
