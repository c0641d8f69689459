#include "config_parser.hpp"

#include "config_tokenizer.hpp"

#include <fmt/format.h>

#include <tuple>

#define TRACE_ENABLE 0
#define TRACE(...)               \
    if (TRACE_ENABLE) {          \
        fmt::print(__VA_ARGS__); \
    }

using namespace checkfiles;
using namespace checkfiles::config_tokenizer;

namespace internal {

std::tuple<std::string_view, std::string_view>
str_split2(const std::string_view s, char delimiter) {
    auto pos = s.find(delimiter);
    if (pos == std::string::npos) {
        return std::make_tuple(s, "");
    }

    return std::make_tuple(s.substr(0, pos), s.substr(pos + 1, std::string::npos));
}

bool
tokenize(const std::string& input_data, std::vector<Token>& tokens, checkfiles::ParseResult& result) {
    ParseOptions options;
    options.strip_newlines = true;
    options.strip_comments = true;
    options.append_terminator = true;  // Append termination token to avoid some bounds checking

    config_tokenizer::ParseResult tokenizer_result;
    if (!config_tokenizer::tokenize(input_data, options, tokenizer_result)) {
        result.kind = ParseErrorKind::Tokenization;
        result.error = tokenizer_result.error;
        return false;
    }

    tokens = std::move(tokenizer_result.tokens);
    result.kind = ParseErrorKind::None;
    return true;
}

}  // namespace internal

std::optional<std::reference_wrapper<Value>>
Value::lookup_value_by_path(std::string_view dotted_path) {
    Value* result_value = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (!result_value->contains(key)) {
            return std::nullopt;
        }
        result_value = &(*result_value)[key];
        remaining = rest;
    }
    return std::ref(*result_value);
}

void
checkfiles::ParseResult::set_error(const Token& token, const std::string& error_message) {
    this->kind = ParseErrorKind::Parsing;
    this->error = fmt::format("'{}' at line {} column {}", error_message, token.line + 1, token.column + 1);
}

// Our state machine states. A statement is either a section header or a
// key/value pair; values are scalars or flat arrays of scalars.
enum class State {
    ParseStatement,
    ParseSection,
    ParseKey,
    ParseValue,
    ParseArrayValues,
    Finish,
};

bool
checkfiles::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& root) {
    root = Value{Value::Table{}};

    std::vector<Token> tokens;
    if (!internal::tokenize(input_data, tokens, result)) {
        return false;
    }

    std::size_t cursor = 0;
    State state = State::ParseStatement;

    // Where keys are inserted; the root table until the first section header.
    Value* section = &root;
    std::string key;
    Value::Array array;

    auto scalar_value = [&](const Token& token) -> Value {
        if (token.id & TokenId_Boolean) {
            return Value{Value::Bool{token.token_boolean_arg}};
        }
        if (token.id & TokenId_Integer) {
            return Value{Value::Int{token.token_int_arg}};
        }
        return Value{Value::String{token.str_from(input_data)}};
    };

    auto expect = [&](const Token& token, TokenId expected_id) {
        if (token.id & expected_id) {
            return true;
        }
        result.set_error(token, fmt::format("Expected {}, found {}", config_tokenizer::repr(expected_id), config_tokenizer::repr(token.id)));
        return false;
    };

    while (state != State::Finish) {
        const Token& token = tokens[cursor];
        TRACE("state {} token {} '{}'\n", static_cast<int>(state), config_tokenizer::repr(token.id), token.str_from(input_data));

        switch (state) {
            case State::ParseStatement: {
                if (token.id & TokenId_Terminator) {
                    state = State::Finish;
                } else if (token.id & TokenId_OpenBracket) {
                    state = State::ParseSection;
                } else if (token.id & (TokenId_Identifier | TokenId_Boolean | TokenId_Integer)) {
                    state = State::ParseKey;
                } else {
                    result.set_error(token, "Expected section header or key");
                    return false;
                }
            } break;

            case State::ParseSection: {
                // [ name ]
                cursor++;
                if (!expect(tokens[cursor], TokenId_Identifier)) {
                    return false;
                }
                auto name = tokens[cursor].str_from(input_data);
                cursor++;
                if (!expect(tokens[cursor], TokenId_CloseBracket)) {
                    return false;
                }
                cursor++;

                Value& table = root[name];
                if (!table.is_table()) {
                    table = Value{Value::Table{}};
                }
                section = &table;
                state = State::ParseStatement;
            } break;

            case State::ParseKey: {
                // key =
                key = token.str_from(input_data);
                cursor++;
                if (!expect(tokens[cursor], TokenId_Assign)) {
                    return false;
                }
                cursor++;
                state = State::ParseValue;
            } break;

            case State::ParseValue: {
                if (token.id & TokenId_OpenBracket) {
                    array.clear();
                    cursor++;
                    state = State::ParseArrayValues;
                } else if (token.id & TokenId_MetaValue) {
                    (*section)[key] = scalar_value(token);
                    cursor++;
                    state = State::ParseStatement;
                } else {
                    result.set_error(token, fmt::format("Expected value for '{}'", key));
                    return false;
                }
            } break;

            case State::ParseArrayValues: {
                if (token.id & TokenId_CloseBracket) {
                    (*section)[key] = Value{array};
                    cursor++;
                    state = State::ParseStatement;
                } else if (token.id & TokenId_MetaValue) {
                    array.push_back(scalar_value(token));
                    cursor++;
                    // Values are separated by commas; a trailing comma is fine.
                    if (tokens[cursor].id & TokenId_Comma) {
                        cursor++;
                    } else if (!expect(tokens[cursor], TokenId_CloseBracket)) {
                        return false;
                    }
                } else {
                    result.set_error(token, fmt::format("Expected array value or ']' for '{}'", key));
                    return false;
                }
            } break;

            case State::Finish:
                break;
        }
    }

    result.kind = ParseErrorKind::None;
    return true;
}

std::string
checkfiles::repr(Value& v) {
    if (v.is_table()) {
        return "Table";
    } else if (v.is_array()) {
        return fmt::format("Array<{}>", v.as_array().size());
    } else if (v.is_int()) {
        return fmt::format("Integer<{}>", v.as_int());
    } else if (v.is_bool()) {
        return fmt::format("Boolean<{}>", v.as_bool());
    } else if (v.is_string()) {
        return fmt::format("String<'{}'>", v.as_string());
    }
    return "Unknown";
}
