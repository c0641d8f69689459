#pragma once

#include "config_tokenizer.hpp"

#include <cassert>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace checkfiles {

/**

 Configuration language parser

 It's basically "INI with arrays, strings, ints and bools". The syntax is
 similar to simple TOML:

    # comment
    [checkfiles]
        checked_exts = ['.c', '.h', '.cpp']
        ignored_files = 'vendor/zlib.c third_party/x.h'
        tab_size = 4
        indent = tabs
        diff_only = no

 Keys before the first section header end up in the root table. Bare words
 are accepted as string values.

 The parser works like this:

    The input text is tokenized into [, checkfiles, ], tab_size, =, 4, ...
    which removes all whitespace and comments and type-tags values. A small
    state machine then walks the tokens and builds a `Value` tree.
*/

struct Value {
    using Table = std::map<std::string, Value>;
    using Array = std::vector<Value>;
    using Int = int32_t;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Array, Int, Bool, String> v;

    Value&
    operator[](const std::string& key) {
        assert(is_table());
        return as_table()[key];
    }

    bool
    contains(const std::string& key) const {
        if (is_table()) {
            const auto& table = std::get<Value::Table>(v);
            return table.find(key) != table.end();
        }
        return false;
    }

    // Find a nested value using e.g. "checkfiles.tab_size"
    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(std::string_view dotted_path);

    // clang-format off
    bool is_array() const { return std::holds_alternative<Value::Array>(v); }
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Array& as_array() { return std::get<Value::Array>(v); }
    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(Value& v);

// clang-format off
enum class ParseErrorKind {
    None         = 1 << 0,
    File         = 1 << 1, // File related, could be made more granular
    Tokenization = 1 << 2,
    Parsing      = 1 << 3,
    Other        = 1 << 4,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(const config_tokenizer::Token& token, const std::string& error_message);
};

bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj);

}  // namespace checkfiles
