#include "violation.hpp"

#include <algorithm>

using namespace checkfiles;

void
FileReport::add(Violation violation) {
    if (std::find(kinds.begin(), kinds.end(), violation.kind) == kinds.end()) {
        kinds.push_back(violation.kind);
    }
    violations.push_back(std::move(violation));
}

std::string
checkfiles::to_string(ViolationKind kind, IndentMode mode) {
    switch (kind) {
        case ViolationKind::kAllWhitespace:
            return "all whitespace";
        case ViolationKind::kTrailingWhitespace:
            return "trailing whitespace";
        case ViolationKind::kWrongIndentChar:
            return mode == IndentMode::kTabsOnly ? "space indentation" : "tab character(s)";
        default:
            return "unknown";
    }
}

std::string
checkfiles::summary_label(const FileReport& report, IndentMode mode) {
    std::string label;
    for (auto kind : report.kinds) {
        if (!label.empty()) {
            label += ", ";
        }
        label += to_string(kind, mode);
    }
    return label;
}
