#include "line_scanner.hpp"

#include "util/readlines.hpp"
#include "util/whitespace.hpp"

using namespace checkfiles;

namespace {

LinePointer
tab_pointer(std::string_view line, int64_t tab_width) {
    LinePointer pointer;
    pointer.text = expand_tabs_fixed(line, tab_width);
    for (char c : line) {
        if (c == '\t') {
            pointer.carets.append(static_cast<std::size_t>(tab_width), '^');
        } else {
            pointer.carets += ' ';
        }
    }
    return pointer;
}

LinePointer
leading_space_pointer(std::string_view line, std::size_t lead, int64_t tab_width) {
    LinePointer pointer;
    pointer.text = expand_tabs_fixed(line, tab_width);
    for (std::size_t i = 0; i < lead; i++) {
        if (line[i] == '\t') {
            pointer.carets.append(static_cast<std::size_t>(tab_width), ' ');
        } else {
            pointer.carets += '^';
        }
    }
    return pointer;
}

}  // namespace

LinePointer
checkfiles::trailing_whitespace_pointer(std::string_view line, int64_t tab_width) {
    LinePointer pointer;
    pointer.text = expand_tabs(line, tab_width);
    auto trimmed = right_trim(pointer.text).size();
    pointer.carets = std::string(trimmed, ' ') + std::string(pointer.text.size() - trimmed, '^');
    return pointer;
}

std::optional<LineViolation>
checkfiles::detect_indentation(std::string_view line, const Policy& policy) {
    switch (policy.indent_mode) {
        case IndentMode::kSpacesOnly: {
            if (line.find('\t') == std::string_view::npos) {
                return std::nullopt;
            }
            return LineViolation{ViolationKind::kWrongIndentChar, tab_pointer(line, policy.tab_width)};
        }
        case IndentMode::kTabsOnly: {
            auto lead = leading_blank_length(line);
            if (lead == 0 || lead == line.size()) {
                return std::nullopt;
            }
            if (line.substr(0, lead).find(' ') == std::string_view::npos) {
                return std::nullopt;
            }
            return LineViolation{ViolationKind::kWrongIndentChar,
                                 leading_space_pointer(line, lead, policy.tab_width)};
        }
    }
    return std::nullopt;
}

std::vector<LineViolation>
checkfiles::scan_line(std::string_view line, const Policy& policy) {
    std::vector<LineViolation> result;

    if (is_all_blank(line)) {
        result.push_back({ViolationKind::kAllWhitespace, std::nullopt});
    } else if (ends_with_blank(line)) {
        result.push_back({ViolationKind::kTrailingWhitespace, trailing_whitespace_pointer(line, policy.tab_width)});
    } else if (auto indentation = detect_indentation(line, policy)) {
        result.push_back(std::move(*indentation));
    }

    return result;
}

FileReport
checkfiles::scan_content(const std::string& path, std::string_view content, const Policy& policy) {
    FileReport report;
    report.path = path;

    LineReader reader(content);
    Line line;
    while (reader.next(line)) {
        for (auto& found : scan_line(line.text, policy)) {
            Violation violation;
            violation.file = path;
            violation.line = line.line_number;
            violation.kind = found.kind;
            violation.pointer = std::move(found.pointer);
            report.add(std::move(violation));
        }
    }

    return report;
}

bool
checkfiles::content_has_violations(std::string_view content, const Policy& policy) {
    LineReader reader(content);
    Line line;
    while (reader.next(line)) {
        if (!scan_line(line.text, policy).empty()) {
            return true;
        }
    }
    return false;
}
