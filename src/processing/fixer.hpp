#pragma once

/*
    Rewrites content so that it passes the checks of the line scanner.

        spaces: trailing whitespace is stripped, then tabs are expanded
        tabs:   the leading run is re-indented with tabs (left over columns
                stay spaces), trailing whitespace is stripped

    Every line keeps its own terminator, and content without a final line
    terminator stays that way. Fixing fixed content changes nothing.
*/

#include "policy.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace checkfiles {

enum class FixStatus {
    kOk,
    kUnchanged,
    kWriteFailed,
};

struct FixResult {
    FixStatus status = FixStatus::kOk;
    std::string error;
};

std::string
to_string(FixStatus status);

// `line` without its terminator.
std::string
fix_line(std::string_view line, const Policy& policy);

std::string
fix_content(std::string_view content, const Policy& policy);

// Writes the fixed content to `path` through a temporary file beside it,
// keeping the file's permissions. Nothing is written when fixing doesn't
// change the content.
FixResult
fix_file(const std::filesystem::path& path, std::string_view content, const Policy& policy);

}  // namespace checkfiles
