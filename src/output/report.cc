#include "report.hpp"

#include <fmt/format.h>

using namespace checkfiles;

bool
ReportAggregator::record_file(const std::string& path, bool had_violations, const std::string& summary_label) {
    if (!recorded_.insert(path).second) {
        return false;
    }
    if (had_violations) {
        report_.files_with_issues++;
        file_summaries_.push_back(fmt::format("{}: {}", path, summary_label));
    }
    return true;
}

void
ReportAggregator::record_violation_count(int64_t count) {
    report_.total_issues += count;
}

ReportStyle
checkfiles::report_style_default(bool color) {
    ReportStyle style;
    style.color = color;
    style.caret.fg = TermColor::kRed;
    style.caret.attr = TermStyle::Attribute::Bold;
    return style;
}

std::string
checkfiles::render_violation(const Violation& violation, IndentMode mode) {
    if (violation.line) {
        return fmt::format("{} ({}): {}", violation.file, *violation.line, to_string(violation.kind, mode));
    }
    return fmt::format("{} ({}): {}", violation.file, violation.hunk, to_string(violation.kind, mode));
}

std::string
checkfiles::render_run_summary(const RunReport& report, const std::string& source_name) {
    return fmt::format("{} issue(s) found in {} file(s) in {}.", report.total_issues, report.files_with_issues,
                       source_name);
}

void
checkfiles::report_file(Log& log, const FileReport& report, IndentMode mode, const ReportStyle& style) {
    if (report.ok()) {
        log.note("{}: ok", report.path);
        return;
    }

    for (const auto& violation : report.violations) {
        log.status("{}", render_violation(violation, mode));
        if (violation.pointer) {
            log.note("  {}", violation.pointer->text);
            log.note("  {}", style.color ? style.caret.apply(violation.pointer->carets) : violation.pointer->carets);
        }
    }
}
