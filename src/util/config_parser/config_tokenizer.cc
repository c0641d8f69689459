#include "config_tokenizer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string_view>
#include <tuple>

using namespace checkfiles;
using namespace checkfiles::config_tokenizer;

namespace {

// clang-format off
const std::array<std::tuple<TokenId, const char*>, 12> kTokenNames {{
    { TokenId_Newline,      "Newline"      },
    { TokenId_OpenBracket,  "OpenBracket"  },
    { TokenId_CloseBracket, "CloseBracket" },
    { TokenId_Assign,       "Assign"       },
    { TokenId_Comma,        "Comma"        },
    { TokenId_Boolean,      "Boolean"      },
    { TokenId_Integer,      "Integer"      },
    { TokenId_String,       "String"       },
    { TokenId_Identifier,   "Identifier"   },
    { TokenId_Comment,      "Comment"      },
    { TokenId_Terminator,   "Terminator"   },
    { TokenId_FirstOnLine,  "FirstOnLine"  },
}};

const std::array<std::tuple<bool, const char*>, 6> kBooleanicStrings {{
    { true,  "true" }, { false, "false" },
    { true,  "yes"  }, { false, "no"    },
    { true,  "on"   }, { false, "off"   },
}};
// clang-format on

bool
is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool
is_word_end(std::string_view text, std::size_t i) {
    char c = text[i];
    if (is_space(c) || c == '\n') {
        return true;
    }
    switch (c) {
        case '[':
        case ']':
        case '=':
        case ',':
        case '#':
        case '"':
        case '\'':
            return true;
        case '/':
            return i + 1 < text.size() && text[i + 1] == '/';
        default:
            return false;
    }
}

std::string
to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

}  // namespace

std::string
checkfiles::config_tokenizer::repr(TokenId id) {
    std::string s;
    for (const auto& [token_id, name] : kTokenNames) {
        if (id & token_id) {
            if (!s.empty()) {
                s += "|";
            }
            s += "TokenId_";
            s += name;
        }
    }
    return s.empty() ? "TokenId_None" : s;
}

bool
checkfiles::config_tokenizer::tokenize(const std::string& input_text,
                                       const ParseOptions& options,
                                       ParseResult& result) {
    result.ok = false;
    result.error.clear();
    result.tokens.clear();

    std::string_view text{input_text};
    std::size_t cursor = 0;
    std::size_t line = 0;
    std::size_t line_start = 0;
    bool first_on_line = true;

    auto push = [&](std::size_t start, std::size_t length, TokenId id) -> Token& {
        Token token;
        token.start = start;
        token.length = length;
        token.line = line;
        token.column = start - line_start;
        token.id = id;
        if (first_on_line) {
            token.id |= TokenId_FirstOnLine;
        }
        first_on_line = false;
        result.tokens.push_back(token);
        return result.tokens.back();
    };

    while (cursor < text.size()) {
        const char c = text[cursor];

        if (is_space(c)) {
            cursor++;
            continue;
        }

        if (c == '\n') {
            if (!options.strip_newlines) {
                push(cursor, 1, TokenId_Newline);
            }
            cursor++;
            line++;
            line_start = cursor;
            first_on_line = true;
            continue;
        }

        // '# comment' and '// comment' run until the end of the line
        if (c == '#' || (c == '/' && cursor + 1 < text.size() && text[cursor + 1] == '/')) {
            auto end = text.find('\n', cursor);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            if (!options.strip_comments) {
                push(cursor, end - cursor, TokenId_Comment);
            } else {
                first_on_line = false;
            }
            cursor = end;
            continue;
        }

        if (c == '"' || c == '\'') {
            auto start = cursor + 1;
            auto end = start;
            while (end < text.size() && text[end] != c) {
                if (text[end] == '\n') {
                    result.error = fmt::format("Unterminated string encountered newline (line {}, col {})",
                                               line + 1, cursor - line_start + 1);
                    return false;
                }
                end++;
            }
            if (end >= text.size()) {
                result.error = fmt::format("Unterminated string starting on (line {}, col {})", line + 1,
                                           cursor - line_start + 1);
                return false;
            }
            push(start, end - start, TokenId_String);
            cursor = end + 1;
            continue;
        }

        switch (c) {
            case '[':
                push(cursor++, 1, TokenId_OpenBracket);
                continue;
            case ']':
                push(cursor++, 1, TokenId_CloseBracket);
                continue;
            case '=':
                push(cursor++, 1, TokenId_Assign);
                continue;
            case ',':
                push(cursor++, 1, TokenId_Comma);
                continue;
            default:
                break;
        }

        // A bare word: identifier, boolean or integer.
        auto start = cursor;
        while (cursor < text.size() && !is_word_end(text, cursor)) {
            cursor++;
        }
        auto word = text.substr(start, cursor - start);
        auto& token = push(start, word.size(), TokenId_Identifier);

        auto lowered = to_lower(std::string{word});
        bool is_booleanic = false;
        for (const auto& [booleanic_value, booleanic_string] : kBooleanicStrings) {
            if (lowered == booleanic_string) {
                is_booleanic = true;
                token.token_boolean_arg = booleanic_value;
            }
        }

        int tmp_int = 0;
        auto parsed = std::from_chars(word.data(), word.data() + word.size(), tmp_int);
        bool is_integer = parsed.ec == std::errc() && parsed.ptr == word.data() + word.size();

        TokenId first = token.id & TokenId_FirstOnLine;
        if (is_booleanic) {
            token.id = TokenId_Boolean | first;
        } else if (is_integer) {
            token.id = TokenId_Integer | first;
            token.token_int_arg = tmp_int;
        }
    }

    if (options.append_terminator) {
        Token terminator;
        terminator.start = text.size();
        terminator.line = line;
        terminator.column = text.size() - line_start;
        terminator.id = TokenId_Terminator;
        result.tokens.push_back(terminator);
    }

    result.ok = true;
    return result.ok;
}
