#pragma once

#include "policy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace checkfiles {

enum class ViolationKind {
    kAllWhitespace,
    kTrailingWhitespace,
    kWrongIndentChar,
};

// Two-line rendering of an offending line: the display text and a caret
// line underneath pointing at the offending span.
struct LinePointer {
    std::string text;
    std::string carets;
};

struct LineViolation {
    ViolationKind kind;
    std::optional<LinePointer> pointer;
};

struct Violation {
    std::string file;

    // Absent when the violation came from a diff hunk without line numbers;
    // `hunk` is used for attribution instead.
    std::optional<int64_t> line;
    ViolationKind kind;
    std::optional<LinePointer> pointer;
    std::string hunk;
};

struct FileReport {
    std::string path;
    std::vector<Violation> violations;

    // Unique kinds, in the order they were first seen.
    std::vector<ViolationKind> kinds;

    bool
    ok() const {
        return violations.empty();
    }

    void
    add(Violation violation);
};

// Description used on per-violation report lines, i.e "trailing whitespace".
std::string
to_string(ViolationKind kind, IndentMode mode);

// "all whitespace, tab character(s)"
std::string
summary_label(const FileReport& report, IndentMode mode);

}  // namespace checkfiles
