#pragma once

/*
    Whole runs: relevance gates, scanning, reporting and fixing over a set
    of candidates, or over the inserted lines of one change.

    Expected exclusions (ignored paths and suffixes, deleted and binary
    files, merge changes) are only logged at debug level. An unreadable
    candidate or a failed write ends the run with RunStatus::kError;
    files fixed before the failure stay fixed.
*/

#include "candidate.hpp"
#include "diff_classifier.hpp"
#include "diff_labeler.hpp"
#include "output/report.hpp"
#include "policy.hpp"
#include "util/log.hpp"

#include <gsl/span>

#include <string>
#include <vector>

namespace checkfiles {

enum class RunStatus {
    kOk,
    kSkipped,
    kError,
};

struct RunResult {
    RunStatus status = RunStatus::kOk;
    bool had_issues = false;
    RunReport report;
    std::string error;
};

// Scans the full content of every relevant candidate.
RunResult
check_candidates(std::vector<Candidate>& candidates,
                 const std::string& source_name,
                 const Policy& policy,
                 Log& log,
                 const ReportStyle& style);

// Rewrites every relevant candidate with violations. Candidates are
// written below the root of `target`.
RunResult
fixup_candidates(std::vector<Candidate>& candidates, WorkingDirectorySource& target, const Policy& policy, Log& log);

// Check, then fix when `fixup` is set and the check found issues. A fixed
// run has no issues left unless some file could not be fixed.
RunResult
check_working_directory(const std::vector<std::string>& paths,
                        WorkingDirectorySource& source,
                        const Policy& policy,
                        bool fixup,
                        Log& log,
                        const ReportStyle& style);

// Checks the lines inserted by a change. `source` holds the new side of
// the change.
RunResult
check_diff(const ChangeInfo& change,
           gsl::span<const DiffToken> tokens,
           ContentSource& source,
           const Policy& policy,
           Log& log,
           const ReportStyle& style);

}  // namespace checkfiles
