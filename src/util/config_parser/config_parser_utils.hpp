#pragma once

#include "config_parser.hpp"

#include <string>

namespace checkfiles {

// Load a file and construct a value tree based on the contents. A missing
// or unreadable file is reported with ParseErrorKind::File.
bool
cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj);

// Human readable dump of a value tree, for --debug output.
std::string
cfg_dump_value_object(Value& v, int depth = 0);

}  // namespace checkfiles
