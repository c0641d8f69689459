#include "config.hpp"

#include "util/config_parser/config_parser_utils.hpp"
#include "util/whitespace.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <string>
#include <tuple>
#include <vector>

using namespace checkfiles;

enum class ConfigVariableType {
    Bool,
    // Integers are kept as text (std::string); the policy validates them.
    Int,
    String,
    // Array of strings, or a single string with a whitespace or comma separated list.
    StringList,
};

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

std::string
checkfiles::config_get_directory() {
    return fmt::format("{}/checkfiles", sago::getConfigHome());
}

std::string
checkfiles::config_user_file() {
    return fmt::format("{}/checkfiles.conf", config_get_directory());
}

std::string
checkfiles::config_project_file(const std::string& root) {
    return fmt::format("{}/.checkfiles.conf", root.empty() ? "." : root);
}

static ConfigResult
config_type_error(const std::string& path, const char* expected, Value& found) {
    ConfigResult result;
    result.ok = false;
    result.error = fmt::format("invalid value for '{}': expected {}, found {}", path, expected, repr(found));
    return result;
}

static ConfigResult
config_apply_options(Value& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        auto stored_value = config.lookup_value_by_path(path);
        if (!stored_value) {
            continue;
        }

        Value& value = stored_value->get();
        switch (type) {
            case ConfigVariableType::Bool: {
                if (!value.is_bool()) {
                    return config_type_error(path, "a boolean", value);
                }
                *((bool*) ptr) = value.as_bool();
            } break;
            case ConfigVariableType::Int: {
                if (value.is_int()) {
                    *((std::string*) ptr) = std::to_string(value.as_int());
                } else if (value.is_string()) {
                    *((std::string*) ptr) = value.as_string();
                } else {
                    return config_type_error(path, "an integer", value);
                }
            } break;
            case ConfigVariableType::String: {
                if (!value.is_string()) {
                    return config_type_error(path, "a string", value);
                }
                *((std::string*) ptr) = value.as_string();
            } break;
            case ConfigVariableType::StringList: {
                std::vector<std::string> items;
                if (value.is_string()) {
                    items = split_list(value.as_string());
                } else if (value.is_array()) {
                    for (auto& item : value.as_array()) {
                        if (!item.is_string()) {
                            return config_type_error(path, "a list of strings", item);
                        }
                        items.push_back(item.as_string());
                    }
                } else {
                    return config_type_error(path, "a list of strings", value);
                }
                *((std::vector<std::string>*) ptr) = std::move(items);
            } break;
        }
    }
    return {};
}

ConfigResult
checkfiles::config_apply_value(Value& config, PolicySettings& settings) {
    if (!config.is_table()) {
        return config_type_error("checkfiles", "a table", config);
    }

    // clang-format off
    const OptionVector options = {
        { "checkfiles.checked_exts",  ConfigVariableType::StringList, &settings.checked_exts },
        { "checkfiles.ignored_exts",  ConfigVariableType::StringList, &settings.ignored_exts },
        { "checkfiles.ignored_files", ConfigVariableType::StringList, &settings.ignored_files },
        { "checkfiles.tab_size",      ConfigVariableType::Int,        &settings.tab_size },
        { "checkfiles.indent",        ConfigVariableType::String,     &settings.indent },
        { "checkfiles.diff_only",     ConfigVariableType::Bool,       &settings.diff_only },
    };
    // clang-format on

    auto result = config_apply_options(config, options);
    if (!result.ok) {
        return result;
    }

    // Older spelling of `indent`.
    if (auto use_spaces = config.lookup_value_by_path("checkfiles.use_spaces"); use_spaces) {
        if (!use_spaces->get().is_bool()) {
            return config_type_error("checkfiles.use_spaces", "a boolean", use_spaces->get());
        }
        settings.indent = use_spaces->get().as_bool() ? "spaces" : "tabs";
    }

    return result;
}

ConfigResult
checkfiles::config_apply_file(const std::string& path, bool required, PolicySettings& settings, Log& log) {
    ParseResult parse_result;
    Value config;

    if (!cfg_load_file(path, parse_result, config)) {
        if (parse_result.kind == ParseErrorKind::File && !required) {
            log.debug("checkfiles: no config at {}", path);
            return {};
        }

        auto message = fmt::format("error: {}\n\twhile parsing: {}", parse_result.error, path);
        if (!required) {
            log.warn("{}", message);
            return {};
        }

        ConfigResult result;
        result.ok = false;
        result.error = message;
        return result;
    }

    log.debug("checkfiles: loading config {}\n{}", path, cfg_dump_value_object(config));
    auto result = config_apply_value(config, settings);
    if (!result.ok) {
        result.error = fmt::format("error: {}\n\twhile parsing: {}", result.error, path);
    }
    return result;
}

ConfigResult
checkfiles::config_load_settings(const ProgramOptions& options, PolicySettings& settings, Log& log) {
    auto result = config_apply_file(config_user_file(), false, settings, log);
    if (!result.ok) {
        return result;
    }

    result = config_apply_file(config_project_file(options.root), false, settings, log);
    if (!result.ok) {
        return result;
    }

    if (!options.config_file.empty()) {
        result = config_apply_file(options.config_file, true, settings, log);
        if (!result.ok) {
            return result;
        }
    }

    if (options.tab_size) {
        settings.tab_size = *options.tab_size;
    }
    if (options.indent) {
        settings.indent = *options.indent;
    }

    return result;
}
