#pragma once

/*
    Whitespace checks for single lines and whole files.

    Lines are checked with their terminator stripped. The first matching
    check wins, so a line yields at most one violation:

        1. all whitespace       non-empty, spaces and tabs only
        2. trailing whitespace  ends with a space or a tab
        3. indentation          depends on the indent mode of the policy

    An empty line is clean.
*/

#include "policy.hpp"
#include "violation.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace checkfiles {

std::vector<LineViolation>
scan_line(std::string_view line, const Policy& policy);

// Indentation check alone. Also used on inserted lines of a diff.
//
//   spaces: any tab in the line is flagged
//   tabs:   a leading run with at least one space, followed by text, is flagged
std::optional<LineViolation>
detect_indentation(std::string_view line, const Policy& policy);

// The line with tabs expanded to columns, and carets under the trailing
// blanks. Both strings have the same length.
LinePointer
trailing_whitespace_pointer(std::string_view line, int64_t tab_width);

FileReport
scan_content(const std::string& path, std::string_view content, const Policy& policy);

bool
content_has_violations(std::string_view content, const Policy& policy);

}  // namespace checkfiles
