#include "policy.hpp"

#include "util/whitespace.hpp"

#include <fmt/format.h>

#include <charconv>

using namespace checkfiles;

namespace {

std::string
join(const std::set<std::string>& items) {
    std::string s;
    for (const auto& item : items) {
        if (!s.empty()) {
            s += " ";
        }
        s += item;
    }
    return s;
}

bool
matches_any_suffix(const std::set<std::string>& suffixes, const std::string& path) {
    for (const auto& suffix : suffixes) {
        if (ends_with(path, suffix)) {
            return true;
        }
    }
    return false;
}

}  // namespace

const std::vector<std::string>&
checkfiles::policy_default_checked_exts() {
    // clang-format off
    static const std::vector<std::string> kDefaults = {
        ".c", ".h", ".cpp", ".xml", ".cs", ".html", ".js", ".css", ".txt",
        ".py", ".nsi", ".java", ".aspx", ".asp", ".bat", ".cmd", ".glsl",
    };
    // clang-format on
    return kDefaults;
}

PolicyResult
checkfiles::policy_build(const PolicySettings& settings, Policy& policy) {
    PolicyResult result;
    Policy built;

    // '*' anywhere in the list means every suffix.
    bool check_all = false;
    for (const auto& ext : settings.checked_exts) {
        if (ext == "*") {
            check_all = true;
        }
    }
    if (!check_all) {
        built.checked_suffixes.insert(settings.checked_exts.begin(), settings.checked_exts.end());
    }
    built.ignored_suffixes.insert(settings.ignored_exts.begin(), settings.ignored_exts.end());
    built.ignored_paths.insert(settings.ignored_files.begin(), settings.ignored_files.end());

    const auto& tab_size = settings.tab_size;
    int64_t tab_width = 0;
    auto parsed = std::from_chars(tab_size.data(), tab_size.data() + tab_size.size(), tab_width);
    if (tab_size.empty() || parsed.ec != std::errc() || parsed.ptr != tab_size.data() + tab_size.size()) {
        result.ok = false;
        result.error = fmt::format("invalid tab_size '{}': not a number", tab_size);
        return result;
    }
    if (tab_width < 1) {
        result.ok = false;
        result.error = fmt::format("invalid tab_size '{}': must be at least 1", tab_size);
        return result;
    }
    if (tab_width > kMaxTabWidth) {
        result.ok = false;
        result.error = fmt::format("invalid tab_size '{}': too large (at most {})", tab_size, kMaxTabWidth);
        return result;
    }
    built.tab_width = tab_width;

    auto mode = indent_mode_from_string(settings.indent);
    if (!mode) {
        result.ok = false;
        result.error = fmt::format("invalid indent '{}': expected 'spaces' or 'tabs'", settings.indent);
        return result;
    }
    built.indent_mode = *mode;
    built.diff_only = settings.diff_only;

    policy = std::move(built);
    return result;
}

bool
checkfiles::policy_is_ignored_path(const Policy& policy, const std::string& path) {
    return policy.ignored_paths.count(path) > 0;
}

bool
checkfiles::policy_is_ignored_suffix(const Policy& policy, const std::string& path) {
    return matches_any_suffix(policy.ignored_suffixes, path);
}

bool
checkfiles::policy_is_checked_suffix(const Policy& policy, const std::string& path) {
    if (policy.checked_suffixes.empty()) {
        return true;
    }
    return matches_any_suffix(policy.checked_suffixes, path);
}

std::optional<IndentMode>
checkfiles::indent_mode_from_string(const std::string& s) {
    if (s == "spaces" || s == "space") {
        return IndentMode::kSpacesOnly;
    }
    if (s == "tabs" || s == "tab") {
        return IndentMode::kTabsOnly;
    }
    return std::nullopt;
}

std::string
checkfiles::to_string(IndentMode mode) {
    switch (mode) {
        case IndentMode::kSpacesOnly:
            return "spaces";
        case IndentMode::kTabsOnly:
            return "tabs";
        default:
            return "unknown";
    }
}

std::string
checkfiles::policy_describe(const Policy& policy) {
    return fmt::format("checked extensions: {}; ignored extensions: {}; ignored files: {}; "
                       "tab size: {}; indent: {}; diff only: {}",
                       policy.checked_suffixes.empty() ? "*" : join(policy.checked_suffixes),
                       join(policy.ignored_suffixes), join(policy.ignored_paths), policy.tab_width,
                       to_string(policy.indent_mode), policy.diff_only);
}
