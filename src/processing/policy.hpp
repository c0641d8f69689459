#pragma once

/*
    The whitespace policy of a run.

    A Policy is built once, validated, from the raw settings collected out
    of config files and the command line, and is only passed around as a
    const reference afterwards.
*/

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace checkfiles {

constexpr int64_t kMaxTabWidth = 256;

enum class IndentMode {
    kSpacesOnly,
    kTabsOnly,
};

struct Policy {
    // Empty means every suffix is checked.
    std::set<std::string> checked_suffixes;
    std::set<std::string> ignored_suffixes;
    std::set<std::string> ignored_paths;

    int64_t tab_width = 8;
    IndentMode indent_mode = IndentMode::kSpacesOnly;
    bool diff_only = false;
};

const std::vector<std::string>&
policy_default_checked_exts();

// Unvalidated policy settings, as written in config files or on the
// command line.
struct PolicySettings {
    std::vector<std::string> checked_exts = policy_default_checked_exts();
    std::vector<std::string> ignored_exts;
    std::vector<std::string> ignored_files;
    std::string tab_size = "8";
    std::string indent = "spaces";
    bool diff_only = false;
};

struct PolicyResult {
    bool ok = true;
    std::string error;
};

PolicyResult
policy_build(const PolicySettings& settings, Policy& policy);

bool
policy_is_ignored_path(const Policy& policy, const std::string& path);

bool
policy_is_ignored_suffix(const Policy& policy, const std::string& path);

bool
policy_is_checked_suffix(const Policy& policy, const std::string& path);

std::optional<IndentMode>
indent_mode_from_string(const std::string& s);

std::string
to_string(IndentMode mode);

// One line summary of the policy for debug output.
std::string
policy_describe(const Policy& policy);

}  // namespace checkfiles
