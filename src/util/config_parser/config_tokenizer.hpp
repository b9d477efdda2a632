#pragma once

/*
    Tokenizer for config files. Tags the in-between token data as strings,
    integers, floats, booleans and identifiers, so the parser only has to deal
    with structure.

    Comments keep their leading '#' or '//' so they can be written back out
    unchanged.
*/

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {
namespace config_tokenizer {

using TokenId = std::uint32_t;
// clang-format off
const TokenId TokenId_Newline      = 1 << 0;
const TokenId TokenId_OpenBracket  = 1 << 1;
const TokenId TokenId_CloseBracket = 1 << 2;
const TokenId TokenId_Assign       = 1 << 3;
const TokenId TokenId_Comma        = 1 << 4;
const TokenId TokenId_Boolean      = 1 << 5;
const TokenId TokenId_Integer      = 1 << 6;
const TokenId TokenId_Float        = 1 << 7;
const TokenId TokenId_String       = 1 << 8;
const TokenId TokenId_Identifier   = 1 << 9;
const TokenId TokenId_Comment      = 1 << 10;
const TokenId TokenId_Terminator   = 1 << 11;

const TokenId TokenId_MetaValue = TokenId_Boolean | TokenId_Integer | TokenId_Float | TokenId_String;
// clang-format on

struct Token {
    TokenId id = 0;

    // For strings this is the unquoted, unescaped text.
    std::string text;

    std::size_t line = 0;
    std::size_t column = 0;

    // Only whitespace before this token on its line
    bool first_on_line = false;

    bool token_boolean_arg = false;
    int64_t token_int_arg = 0;
    double token_float_arg = 0.0;
};

struct TokenizeResult {
    bool ok = false;
    std::vector<Token> tokens;
    std::string error;
};

// The token list always ends with a TokenId_Terminator.
bool
tokenize(const std::string& text, TokenizeResult& result);

std::string
repr(TokenId id);

}  // namespace config_tokenizer
}  // namespace patchy
