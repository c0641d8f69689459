#pragma once

#include "processing/policy.hpp"
#include "processing/violation.hpp"
#include "util/color.hpp"
#include "util/log.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace checkfiles {

struct RunReport {
    int64_t files_with_issues = 0;
    int64_t total_issues = 0;

    bool
    had_issues() const {
        return files_with_issues > 0 || total_issues > 0;
    }
};

// Run level counters. Purely additive; a file is counted at most once.
class ReportAggregator {
   public:
    // False when `path` was already recorded.
    bool
    record_file(const std::string& path, bool had_violations, const std::string& summary_label);

    void
    record_violation_count(int64_t count);

    RunReport
    finalize() const {
        return report_;
    }

    // "src/main.c: trailing whitespace, tab character(s)" for every file with
    // violations, in the order the files were recorded.
    const std::vector<std::string>&
    file_summaries() const {
        return file_summaries_;
    }

   private:
    RunReport report_;
    std::unordered_set<std::string> recorded_;
    std::vector<std::string> file_summaries_;
};

struct ReportStyle {
    bool color = false;
    TermStyle caret;
};

ReportStyle
report_style_default(bool color);

// "src/main.c (12): trailing whitespace"
std::string
render_violation(const Violation& violation, IndentMode mode);

// "3 issue(s) found in 2 file(s) in working directory."
std::string
render_run_summary(const RunReport& report, const std::string& source_name);

// Writes the report of one file: a status line per violation, the pointer
// rendering at note level, and "<path>: ok" when the file is clean.
void
report_file(Log& log, const FileReport& report, IndentMode mode, const ReportStyle& style);

}  // namespace checkfiles
