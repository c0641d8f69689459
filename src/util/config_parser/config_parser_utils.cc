#include "config_parser_utils.hpp"

#include "config_parser.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace checkfiles;

namespace internal {

void
dump_value_object(Value& v, std::string& s, int depth) {
    auto INDENT = [](int x) { return std::string((x) *2, ' '); };

    if (v.is_table()) {
        for (auto& [key, value] : v.as_table()) {
            if (value.is_table()) {
                s += fmt::format("{}[{}]\n", INDENT(depth), key);
                dump_value_object(value, s, depth + 1);
            } else {
                s += fmt::format("{}{} = ", INDENT(depth), key);
                dump_value_object(value, s, depth + 1);
                s += "\n";
            }
        }
    } else if (v.is_array()) {
        s += "[";
        bool first = true;
        for (auto& value : v.as_array()) {
            if (!first) {
                s += ", ";
            }
            dump_value_object(value, s, depth);
            first = false;
        }
        s += "]";
    } else if (v.is_int()) {
        s += fmt::format("{}", v.as_int());
    } else if (v.is_bool()) {
        s += fmt::format("{}", v.as_bool());
    } else if (v.is_string()) {
        s += fmt::format("'{}'", v.as_string());
    }
}

}  // namespace internal

bool
checkfiles::cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        result.kind = ParseErrorKind::File;
        result.error = "File does not exist";
        return false;
    }

    if (!std::filesystem::is_regular_file(file_path, ec)) {
        result.kind = ParseErrorKind::File;
        result.error = "File is not a regular file";
        return false;
    }

    std::ifstream ifs;
    try {
        ifs.open(file_path, std::ios::in | std::ios::binary);
        if (!ifs.is_open()) {
            result.kind = ParseErrorKind::File;
            result.error = "Failed to open file for reading";
            return false;
        }

        std::stringstream buffer;
        buffer << ifs.rdbuf();

        return cfg_parse_value_tree(buffer.str(), result, result_obj);
    } catch (std::exception& e) {
        result.kind = ParseErrorKind::File;
        result.error = "Failed to load file: " + std::string(e.what());
        return false;
    }
}

std::string
checkfiles::cfg_dump_value_object(Value& v, int depth) {
    std::string result;
    internal::dump_value_object(v, result, depth);
    return result;
}
