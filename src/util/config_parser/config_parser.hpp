#pragma once

#include "ordered_map.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace patchy {

/**

 Configuration language parser

 It's basically "INI with arrays, strings, ints, floats and bools":

    # comment
    [section]
    key = 'value'
    list = [1, 2, 3]   // trailing comment

 Section names may be dotted ("[style.diff]") to open a nested table. Keys
 before the first section live in the root table.

 The input is first tokenized (see config_tokenizer.hpp), then the token
 stream is parsed into a tree of Values rooted in a table.
*/

struct Value {
    using Table = OrderedMap<std::string, Value>;
    using Array = std::vector<Value>;
    using Int = int64_t;
    using Float = double;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Array, Int, Float, Bool, String> v;

    // Comment lines above the key, and the comment trailing the value.
    std::vector<std::string> key_comments;
    std::vector<std::string> value_comments;

    Value&
    operator[](const std::string& key) {
        return as_table()[key];
    }

    bool
    contains(const std::string& key) const {
        return is_table() && as_table().contains(key);
    }

    // Find a nested value using e.g. "general.context_lines"
    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(std::string_view dotted_path);

    // Sets a nested value using e.g. set_value_at("general.context_lines", {Value::Int{3}}).
    // Missing tables along the path are created. Returns false if a
    // non-table value is in the way.
    bool
    set_value_at(std::string_view dotted_path, Value value);

    // clang-format off
    bool is_array() const { return std::holds_alternative<Value::Array>(v); }
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_float() const { return std::holds_alternative<Value::Float>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Array& as_array() { return std::get<Value::Array>(v); }
    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Float& as_float() { return std::get<Value::Float>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }

    const Array& as_array() const { return std::get<Value::Array>(v); }
    const Table& as_table() const { return std::get<Value::Table>(v); }
    const Int& as_int() const { return std::get<Value::Int>(v); }
    const Float& as_float() const { return std::get<Value::Float>(v); }
    const Bool& as_bool() const { return std::get<Value::Bool>(v); }
    const String& as_string() const { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(const Value& v);

// clang-format off
enum class ParseErrorKind {
    None         = 1 << 0,
    File         = 1 << 1,
    Tokenization = 1 << 2,
    Parsing      = 1 << 3,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }
};

bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj);

// Load a file and construct a value tree based on the contents
bool
cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj);

// Serialize all entries in the given table. Scalars and arrays of the root
// table come first, then one [section] per nested table.
std::string
cfg_serialize(const Value& value);

// Serialize a single scalar or array value.
std::string
cfg_serialize_obj(const Value& value);

}  // namespace patchy
