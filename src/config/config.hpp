#pragma once

#include "processing/policy.hpp"
#include "util/config_parser/config_parser.hpp"
#include "util/log.hpp"

#include <optional>
#include <string>
#include <vector>

namespace checkfiles {

struct ProgramOptions {
    bool help = false;
    bool version = false;
    bool fixup = false;
    bool color = true;
    Verbosity verbosity = Verbosity::kNormal;

    // Diff restricted mode; "-" reads the diff from stdin.
    std::string diff_file;
    int parent_count = 1;
    std::string revision;

    std::string root = ".";
    std::string config_file;
    std::vector<std::string> paths;

    // Command line overrides, applied on top of every config file.
    std::optional<std::string> tab_size;
    std::optional<std::string> indent;
};

struct ConfigResult {
    bool ok = true;
    std::string error;
};

std::string
config_get_directory();

// <config home>/checkfiles/checkfiles.conf
std::string
config_user_file();

// <root>/.checkfiles.conf
std::string
config_project_file(const std::string& root);

// Applies the [checkfiles] section of a parsed config onto `settings`.
// Keys that are missing keep their current value.
ConfigResult
config_apply_value(Value& config, PolicySettings& settings);

// Loads and applies one config file. A missing file is only an error when
// `required` is set; so is a syntax error, which is otherwise logged and
// the file skipped.
ConfigResult
config_apply_file(const std::string& path, bool required, PolicySettings& settings, Log& log);

// Defaults, then the user config, the project config, the --config file and
// finally the command line overrides.
ConfigResult
config_load_settings(const ProgramOptions& options, PolicySettings& settings, Log& log);

}  // namespace checkfiles
