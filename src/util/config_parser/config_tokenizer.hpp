#pragma once

/*
    Tokenizer for the configuration language. It tags the in-between token
    data as strings, integers, booleans or identifiers so that the parser
    only has to look at token ids.

    TODO: Handle escape sequences in quoted strings.
*/

#include <cstdint>
#include <string>
#include <vector>

namespace checkfiles {
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
const TokenId TokenId_String       = 1 << 7;
const TokenId TokenId_Identifier   = 1 << 8;
const TokenId TokenId_Comment      = 1 << 9;
const TokenId TokenId_Terminator   = 1 << 10;

const TokenId TokenId_FirstOnLine  = 1 << 11; // Only whitespace before this token

const TokenId TokenId_MetaValue = TokenId_Boolean | TokenId_Integer | TokenId_String | TokenId_Identifier;
// clang-format on

struct Token {
    std::string::size_type start = 0;
    std::string::size_type length = 0;

    std::string::size_type line = 0;
    std::string::size_type column = 0;

    TokenId id = 0;

    bool token_boolean_arg = false;
    int token_int_arg = 0;

    const std::string
    str_from(const std::string& text) const {
        return text.substr(this->start, this->length);
    }
};

struct ParseOptions {
    bool strip_newlines = false;
    bool strip_comments = false;
    bool append_terminator = false;
};

struct ParseResult {
    bool ok = false;
    std::vector<Token> tokens;
    std::string error;
};

bool
tokenize(const std::string& text, const ParseOptions& options, ParseResult& result);

std::string
repr(TokenId id);

}  // namespace config_tokenizer
}  // namespace checkfiles
