#include "config_parser.hpp"

#include <fmt/format.h>

#include <string>

using namespace patchy;

namespace {

bool
is_bare_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return !(key[0] >= '0' && key[0] <= '9') && key[0] != '-';
}

std::string
quote(const std::string& s) {
    std::string output = "\"";
    for (char c : s) {
        switch (c) {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                output += c;
        }
    }
    output += "\"";
    return output;
}

void
write_comments(const std::vector<std::string>& comments, std::string& output) {
    for (const auto& comment : comments) {
        output += comment;
        if (comment.empty() || comment.back() != '\n') {
            output += "\n";
        }
    }
}

void
write_trailing_comment(const Value& value, std::string& output) {
    for (const auto& comment : value.value_comments) {
        output += " " + comment;
    }
    output += "\n";
}

// A table holding nothing but other tables is implied by their dotted
// headers.
bool
needs_header(const Value& value) {
    if (!value.key_comments.empty() || !value.value_comments.empty()) {
        return true;
    }
    const auto& table = value.as_table();
    if (table.size() == 0) {
        return true;
    }
    bool has_plain = false;
    table.for_each([&](const std::string&, const Value& v) { has_plain = has_plain || !v.is_table(); });
    return has_plain;
}

void
serialize_table(const Value& value, const std::string& prefix, std::string& output) {
    const auto& table = value.as_table();

    // Plain values first; once a [section] header is written every
    // following key would belong to it.
    table.for_each([&](const std::string& key, const Value& v) {
        if (v.is_table()) {
            return;
        }
        write_comments(v.key_comments, output);
        output += (is_bare_key(key) ? key : quote(key)) + " = " + cfg_serialize_obj(v);
        write_trailing_comment(v, output);
    });

    table.for_each([&](const std::string& key, const Value& v) {
        if (!v.is_table()) {
            return;
        }
        auto name = prefix.empty() ? key : prefix + "." + key;
        if (needs_header(v)) {
            if (!output.empty()) {
                output += "\n";
            }
            write_comments(v.key_comments, output);
            output += "[" + name + "]";
            write_trailing_comment(v, output);
        }
        serialize_table(v, name, output);
    });
}

}  // namespace

std::string
patchy::cfg_serialize_obj(const Value& value) {
    if (value.is_int()) {
        return fmt::format("{}", value.as_int());
    } else if (value.is_float()) {
        // Keep a decimal point so the value reads back as a float.
        auto s = fmt::format("{}", value.as_float());
        if (s.find_first_of(".eEn") == std::string::npos) {
            s += ".0";
        }
        return s;
    } else if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    } else if (value.is_string()) {
        return quote(value.as_string());
    } else if (value.is_array()) {
        std::string output = "[";
        const auto& array = value.as_array();
        for (std::size_t i = 0; i < array.size(); i++) {
            if (i > 0) {
                output += ", ";
            }
            output += cfg_serialize_obj(array[i]);
        }
        return output + "]";
    }
    // Tables are only written as sections
    return "";
}

std::string
patchy::cfg_serialize(const Value& value) {
    std::string output;
    if (!value.is_table()) {
        return output;
    }
    write_comments(value.key_comments, output);
    serialize_table(value, "", output);
    return output;
}
