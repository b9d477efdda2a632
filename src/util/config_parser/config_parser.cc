#include "config_parser.hpp"

#include "config_tokenizer.hpp"
#include "util/file_io.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <string_view>
#include <vector>

#define TRACE_ENABLE 0
#define TRACE(...)                       \
    if (TRACE_ENABLE) {                  \
        fmt::print(stderr, __VA_ARGS__); \
    }

using namespace patchy;
using namespace patchy::config_tokenizer;

namespace {

std::vector<std::string_view>
split_path(std::string_view dotted_path) {
    std::vector<std::string_view> components;
    while (true) {
        auto pos = dotted_path.find('.');
        components.push_back(dotted_path.substr(0, pos));
        if (pos == std::string_view::npos) {
            break;
        }
        dotted_path.remove_prefix(pos + 1);
    }
    return components;
}

class Parser {
   public:
    Parser(const std::vector<Token>& tokens, ParseResult& result, Value& root)
        : tokens_(tokens), result_(result), root_(root), table_(&root) {
    }

    bool
    parse() {
        while (!at(TokenId_Terminator)) {
            const auto& token = current();
            if (at(TokenId_Newline)) {
                // A blank line separates a comment block from what follows.
                if (token.first_on_line) {
                    pending_comments_.clear();
                }
                advance();
            } else if (at(TokenId_Comment)) {
                pending_comments_.push_back(token.text);
                advance();
            } else if (at(TokenId_OpenBracket) && token.first_on_line) {
                if (!parse_section()) {
                    return false;
                }
            } else if (at(TokenId_Identifier | TokenId_String | TokenId_Integer | TokenId_Boolean)) {
                if (!parse_key_value()) {
                    return false;
                }
            } else {
                return fail(token, fmt::format("expected a key or a [section], got {}", repr(token.id)));
            }
        }
        return true;
    }

   private:
    const Token&
    current() const {
        return tokens_[pos_];
    }

    bool
    at(TokenId ids) const {
        return (current().id & ids) != 0;
    }

    void
    advance() {
        if (!at(TokenId_Terminator)) {
            pos_++;
        }
    }

    bool
    fail(const Token& token, const std::string& message) {
        result_.kind = ParseErrorKind::Parsing;
        result_.error = fmt::format("line {}, column {}: {}", token.line, token.column, message);
        return false;
    }

    bool
    expect(TokenId id, Token& out) {
        if (!at(id)) {
            return fail(current(), fmt::format("expected {}, got {}", repr(id), repr(current().id)));
        }
        out = current();
        advance();
        return true;
    }

    // A trailing comment and then the end of the line.
    bool
    parse_line_end(Value& value) {
        if (at(TokenId_Comment)) {
            value.value_comments.push_back(current().text);
            advance();
        }
        if (!at(TokenId_Newline | TokenId_Terminator)) {
            return fail(current(), fmt::format("expected end of line, got {}", repr(current().id)));
        }
        advance();
        return true;
    }

    bool
    parse_section() {
        Token open, name, close;
        if (!expect(TokenId_OpenBracket, open) || !expect(TokenId_Identifier, name) ||
            !expect(TokenId_CloseBracket, close)) {
            return false;
        }

        TRACE("section '{}'\n", name.text);

        auto existing = root_.lookup_value_by_path(name.text);
        if (existing && !existing->get().is_table()) {
            return fail(name, fmt::format("'{}' is already defined as a value", name.text));
        }
        if (!existing) {
            if (!root_.set_value_at(name.text, Value{Value::Table{}})) {
                return fail(name, fmt::format("'{}' is nested under a value", name.text));
            }
            existing = root_.lookup_value_by_path(name.text);
        }

        table_ = &existing->get();
        table_->key_comments.insert(table_->key_comments.end(), pending_comments_.begin(),
                                    pending_comments_.end());
        pending_comments_.clear();
        return parse_line_end(*table_);
    }

    bool
    parse_key_value() {
        Token key = current();
        advance();

        Token assign;
        if (!expect(TokenId_Assign, assign)) {
            return false;
        }

        if (table_->contains(key.text)) {
            return fail(key, fmt::format("duplicate key '{}'", key.text));
        }

        TRACE("key '{}'\n", key.text);

        Value value;
        if (!parse_value(value)) {
            return false;
        }
        value.key_comments = std::move(pending_comments_);
        pending_comments_.clear();

        if (!parse_line_end(value)) {
            return false;
        }
        table_->as_table().insert(key.text, std::move(value));
        return true;
    }

    void
    skip_newlines_and_comments() {
        while (at(TokenId_Newline | TokenId_Comment)) {
            advance();
        }
    }

    bool
    parse_value(Value& value) {
        const auto& token = current();
        switch (token.id) {
            case TokenId_Integer:
                value.v = Value::Int{token.token_int_arg};
                break;
            case TokenId_Float:
                value.v = Value::Float{token.token_float_arg};
                break;
            case TokenId_Boolean:
                value.v = Value::Bool{token.token_boolean_arg};
                break;
            case TokenId_String:
                value.v = Value::String{token.text};
                break;
            case TokenId_OpenBracket:
                return parse_array(value);
            case TokenId_Identifier:
                return fail(token, fmt::format("unquoted string '{}'", token.text));
            default:
                return fail(token, fmt::format("expected a value, got {}", repr(token.id)));
        }
        advance();
        return true;
    }

    bool
    parse_array(Value& value) {
        advance();  // [
        value.v = Value::Array{};
        auto& array = value.as_array();

        skip_newlines_and_comments();
        while (!at(TokenId_CloseBracket)) {
            Value element;
            if (!parse_value(element)) {
                return false;
            }
            array.push_back(std::move(element));

            skip_newlines_and_comments();
            if (at(TokenId_Comma)) {
                advance();
                skip_newlines_and_comments();
            } else if (!at(TokenId_CloseBracket)) {
                return fail(current(), fmt::format("expected ',' or ']', got {}", repr(current().id)));
            }
        }
        advance();  // ]
        return true;
    }

    const std::vector<Token>& tokens_;
    std::size_t pos_ = 0;
    ParseResult& result_;
    Value& root_;
    Value* table_;
    std::vector<std::string> pending_comments_;
};

}  // namespace

std::optional<std::reference_wrapper<Value>>
Value::lookup_value_by_path(std::string_view dotted_path) {
    Value* node = this;
    for (auto component : split_path(dotted_path)) {
        if (!node->is_table()) {
            return std::nullopt;
        }
        node = node->as_table().find(std::string(component));
        if (!node) {
            return std::nullopt;
        }
    }
    return std::ref(*node);
}

bool
Value::set_value_at(std::string_view dotted_path, Value value) {
    auto components = split_path(dotted_path);
    Value* node = this;
    for (std::size_t i = 0; i + 1 < components.size(); i++) {
        if (!node->is_table()) {
            return false;
        }
        auto& child = node->as_table()[std::string(components[i])];
        node = &child;
    }
    if (!node->is_table()) {
        return false;
    }

    auto& slot = node->as_table()[std::string(components.back())];
    // Keep comments of a value we overwrite unless the new one brings its own.
    if (value.key_comments.empty()) {
        value.key_comments = std::move(slot.key_comments);
    }
    slot = std::move(value);
    return true;
}

std::string
patchy::repr(const Value& v) {
    if (v.is_table()) {
        std::vector<std::string> entries;
        v.as_table().for_each([&](const std::string& key, const Value& value) {
            entries.push_back(fmt::format("{}: {}", key, repr(value)));
        });
        return fmt::format("{{{}}}", fmt::join(entries, ", "));
    } else if (v.is_array()) {
        std::vector<std::string> entries;
        for (const auto& value : v.as_array()) {
            entries.push_back(repr(value));
        }
        return fmt::format("[{}]", fmt::join(entries, ", "));
    }
    return cfg_serialize_obj(v);
}

bool
patchy::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj) {
    TokenizeResult tokenized;
    if (!tokenize(input_data, tokenized)) {
        result.kind = ParseErrorKind::Tokenization;
        result.error = tokenized.error;
        return false;
    }

    result.kind = ParseErrorKind::None;
    result.error.clear();
    result_obj = Value{Value::Table{}};

    Parser parser(tokenized.tokens, result, result_obj);
    return parser.parse();
}

bool
patchy::cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj) {
    std::string content, error;
    if (!read_file(file_path, content, error)) {
        result.kind = ParseErrorKind::File;
        result.error = error;
        return false;
    }
    return cfg_parse_value_tree(content, result, result_obj);
}
