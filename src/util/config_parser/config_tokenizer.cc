#include "config_tokenizer.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>

using namespace patchy;
using namespace patchy::config_tokenizer;

namespace {

struct TokenizerState {
    const std::string& text;
    std::size_t pos = 0;
    std::size_t line = 1;
    std::size_t line_start = 0;
    bool first_on_line = true;

    char
    peek(std::size_t offset = 0) const {
        return pos + offset < text.size() ? text[pos + offset] : '\0';
    }

    bool
    done() const {
        return pos >= text.size();
    }

    std::size_t
    column() const {
        return pos - line_start + 1;
    }
};

bool
is_identifier_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool
is_identifier_char(char c) {
    return is_identifier_start(c) || (c >= '0' && c <= '9') || c == '.' || c == '-';
}

bool
is_digit(char c) {
    return c >= '0' && c <= '9';
}

Token
make_token(TokenizerState& s, TokenId id) {
    Token token;
    token.id = id;
    token.line = s.line;
    token.column = s.column();
    token.first_on_line = s.first_on_line;
    s.first_on_line = false;
    return token;
}

std::string
error_at(const Token& token, const std::string& message) {
    return fmt::format("line {}, column {}: {}", token.line, token.column, message);
}

bool
read_string(TokenizerState& s, Token& token, std::string& error) {
    const char quote = s.peek();
    s.pos++;
    while (true) {
        if (s.done() || s.peek() == '\n') {
            error = error_at(token, "unterminated string");
            return false;
        }
        char c = s.peek();
        s.pos++;
        if (c == quote) {
            return true;
        }
        if (c == '\\' && quote == '"') {
            char escaped = s.peek();
            s.pos++;
            switch (escaped) {
                case 'n':
                    token.text += '\n';
                    break;
                case 't':
                    token.text += '\t';
                    break;
                case '\\':
                case '"':
                    token.text += escaped;
                    break;
                default:
                    error = error_at(token, fmt::format("unknown escape sequence '\\{}'", escaped));
                    return false;
            }
            continue;
        }
        token.text += c;
    }
}

bool
read_number(TokenizerState& s, Token& token, std::string& error) {
    auto start = s.pos;
    bool is_float = false;
    if (s.peek() == '-' || s.peek() == '+') {
        s.pos++;
    }
    while (!s.done()) {
        char c = s.peek();
        if (is_digit(c)) {
            s.pos++;
        } else if (c == '.') {
            is_float = true;
            s.pos++;
        } else if (c == 'e' || c == 'E') {
            is_float = true;
            s.pos++;
            if (s.peek() == '-' || s.peek() == '+') {
                s.pos++;
            }
        } else {
            break;
        }
    }
    token.text = s.text.substr(start, s.pos - start);

    if (is_identifier_char(s.peek())) {
        error = error_at(token, fmt::format("malformed number '{}{}'", token.text, s.peek()));
        return false;
    }

    errno = 0;
    char* end = nullptr;
    if (is_float) {
        token.id = TokenId_Float;
        token.token_float_arg = std::strtod(token.text.c_str(), &end);
    } else {
        token.id = TokenId_Integer;
        token.token_int_arg = std::strtoll(token.text.c_str(), &end, 10);
    }
    if (errno != 0 || end != token.text.c_str() + token.text.size()) {
        error = error_at(token, fmt::format("malformed number '{}'", token.text));
        return false;
    }
    return true;
}

}  // namespace

bool
config_tokenizer::tokenize(const std::string& text, TokenizeResult& result) {
    result.ok = false;
    result.tokens.clear();
    result.error.clear();

    TokenizerState s{text};
    while (!s.done()) {
        char c = s.peek();

        if (c == ' ' || c == '\t' || c == '\r') {
            s.pos++;
            continue;
        }

        if (c == '\n') {
            result.tokens.push_back(make_token(s, TokenId_Newline));
            s.pos++;
            s.line++;
            s.line_start = s.pos;
            s.first_on_line = true;
            continue;
        }

        if (c == '#' || (c == '/' && s.peek(1) == '/')) {
            auto token = make_token(s, TokenId_Comment);
            auto end = text.find('\n', s.pos);
            if (end == std::string::npos) {
                end = text.size();
            }
            token.text = text.substr(s.pos, end - s.pos);
            while (!token.text.empty() && (token.text.back() == '\r' || token.text.back() == ' ')) {
                token.text.pop_back();
            }
            s.pos = end;
            result.tokens.push_back(token);
            continue;
        }

        TokenId single = 0;
        switch (c) {
            case '[':
                single = TokenId_OpenBracket;
                break;
            case ']':
                single = TokenId_CloseBracket;
                break;
            case '=':
                single = TokenId_Assign;
                break;
            case ',':
                single = TokenId_Comma;
                break;
        }
        if (single) {
            auto token = make_token(s, single);
            token.text = std::string(1, c);
            s.pos++;
            result.tokens.push_back(token);
            continue;
        }

        if (c == '"' || c == '\'') {
            auto token = make_token(s, TokenId_String);
            if (!read_string(s, token, result.error)) {
                return false;
            }
            result.tokens.push_back(token);
            continue;
        }

        if (is_digit(c) || ((c == '-' || c == '+') && is_digit(s.peek(1)))) {
            auto token = make_token(s, TokenId_Integer);
            if (!read_number(s, token, result.error)) {
                return false;
            }
            result.tokens.push_back(token);
            continue;
        }

        if (is_identifier_start(c)) {
            auto token = make_token(s, TokenId_Identifier);
            auto start = s.pos;
            while (is_identifier_char(s.peek())) {
                s.pos++;
            }
            token.text = text.substr(start, s.pos - start);
            if (token.text == "true" || token.text == "false") {
                token.id = TokenId_Boolean;
                token.token_boolean_arg = token.text == "true";
            }
            result.tokens.push_back(token);
            continue;
        }

        auto token = make_token(s, 0);
        result.error = error_at(token, fmt::format("unexpected character '{}'", c));
        return false;
    }

    auto terminator = make_token(s, TokenId_Terminator);
    result.tokens.push_back(terminator);
    result.ok = true;
    return true;
}

std::string
config_tokenizer::repr(TokenId id) {
    switch (id) {
        case TokenId_Newline:
            return "Newline";
        case TokenId_OpenBracket:
            return "OpenBracket";
        case TokenId_CloseBracket:
            return "CloseBracket";
        case TokenId_Assign:
            return "Assign";
        case TokenId_Comma:
            return "Comma";
        case TokenId_Boolean:
            return "Boolean";
        case TokenId_Integer:
            return "Integer";
        case TokenId_Float:
            return "Float";
        case TokenId_String:
            return "String";
        case TokenId_Identifier:
            return "Identifier";
        case TokenId_Comment:
            return "Comment";
        case TokenId_Terminator:
            return "Terminator";
    }
    return fmt::format("TokenId({})", id);
}
