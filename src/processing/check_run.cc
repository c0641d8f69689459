#include "check_run.hpp"

#include "fixer.hpp"
#include "line_scanner.hpp"

#include <fmt/format.h>

#include <map>
#include <set>

using namespace checkfiles;

namespace {

void
log_exclusion(Log& log, const std::string& path, Relevance relevance) {
    switch (relevance) {
        case Relevance::kIgnoredPath:
        case Relevance::kIgnoredSuffix:
        case Relevance::kUncheckedSuffix:
            log.debug("checkfiles: ignoring {} ({})", path, to_string(relevance));
            break;
        case Relevance::kAbsent:
        case Relevance::kBinary:
            log.debug("checkfiles: skipping {} ({})", path, to_string(relevance));
            break;
        case Relevance::kRelevant:
        case Relevance::kUnreadable:
            break;
    }
}

void
record_file_report(ReportAggregator& aggregator,
                   Log& log,
                   const FileReport& report,
                   const Policy& policy,
                   const ReportStyle& style) {
    if (!aggregator.record_file(report.path, !report.ok(), summary_label(report, policy.indent_mode))) {
        log.debug("checkfiles: skipping {} (already checked)", report.path);
        return;
    }
    report_file(log, report, policy.indent_mode, style);
    aggregator.record_violation_count(static_cast<int64_t>(report.violations.size()));
}

RunResult
finish_run(const ReportAggregator& aggregator, Log& log, const std::string& source_name) {
    RunResult result;
    result.report = aggregator.finalize();
    result.had_issues = result.report.had_issues();

    for (const auto& summary : aggregator.file_summaries()) {
        log.status("{}", summary);
    }

    if (result.had_issues) {
        log.warn("checkfiles: {}", render_run_summary(result.report, source_name));
    } else {
        log.note("checkfiles: {}", render_run_summary(result.report, source_name));
    }
    return result;
}

RunResult
run_error(std::string error) {
    RunResult result;
    result.status = RunStatus::kError;
    result.error = std::move(error);
    return result;
}

}  // namespace

RunResult
checkfiles::check_candidates(std::vector<Candidate>& candidates,
                             const std::string& source_name,
                             const Policy& policy,
                             Log& log,
                             const ReportStyle& style) {
    ReportAggregator aggregator;

    for (auto& candidate : candidates) {
        auto relevance = check_relevance(policy, candidate);
        if (relevance == Relevance::kUnreadable) {
            return run_error(fmt::format("{}: {}", candidate.path(), candidate.fetch().error));
        }
        if (relevance != Relevance::kRelevant) {
            log_exclusion(log, candidate.path(), relevance);
            continue;
        }

        log.debug("checkfiles: checking {} ...", candidate.path());
        auto report = scan_content(candidate.path(), candidate.content(), policy);
        record_file_report(aggregator, log, report, policy, style);
    }

    return finish_run(aggregator, log, source_name);
}

RunResult
checkfiles::fixup_candidates(std::vector<Candidate>& candidates,
                             WorkingDirectorySource& target,
                             const Policy& policy,
                             Log& log) {
    RunResult result;

    for (auto& candidate : candidates) {
        auto relevance = check_relevance(policy, candidate);
        if (relevance == Relevance::kUnreadable) {
            return run_error(fmt::format("{}: {}", candidate.path(), candidate.fetch().error));
        }
        if (relevance != Relevance::kRelevant || !content_has_violations(candidate.content(), policy)) {
            continue;
        }

        log.status("checkfiles: fixing {}", candidate.path());
        auto fixed = fix_file(target.full_path(candidate.path()), candidate.content(), policy);
        log.debug("checkfiles: {} {}", candidate.path(), to_string(fixed.status));
        switch (fixed.status) {
            case FixStatus::kOk:
                break;
            case FixStatus::kUnchanged:
                // Only happens in tabs mode, for indentation that isn't a whole number of tabs.
                log.status("checkfiles: {} left unchanged", candidate.path());
                result.had_issues = true;
                break;
            case FixStatus::kWriteFailed:
                return run_error(fixed.error);
        }
    }

    return result;
}

RunResult
checkfiles::check_working_directory(const std::vector<std::string>& paths,
                                    WorkingDirectorySource& source,
                                    const Policy& policy,
                                    bool fixup,
                                    Log& log,
                                    const ReportStyle& style) {
    std::vector<Candidate> candidates;
    candidates.reserve(paths.size());
    std::set<std::string> seen;
    for (const auto& path : paths) {
        if (seen.insert(path).second) {
            candidates.emplace_back(path, source);
        }
    }

    auto checked = check_candidates(candidates, source.name(), policy, log, style);
    if (checked.status != RunStatus::kOk || !checked.had_issues || !fixup) {
        return checked;
    }

    auto fixed = fixup_candidates(candidates, source, policy, log);
    fixed.report = checked.report;
    return fixed;
}

RunResult
checkfiles::check_diff(const ChangeInfo& change,
                       gsl::span<const DiffToken> tokens,
                       ContentSource& source,
                       const Policy& policy,
                       Log& log,
                       const ReportStyle& style) {
    if (!is_checkable_change(change)) {
        log.debug("checkfiles: skipping {} ({} parents)", change.revision.empty() ? source.name() : change.revision,
                  change.parent_count);
        RunResult result;
        result.status = RunStatus::kSkipped;
        return result;
    }

    std::map<std::string, std::string> unreadable;
    auto relevance = [&](const std::string& path) {
        Candidate candidate(path, source);
        auto found = check_relevance(policy, candidate);
        if (found == Relevance::kUnreadable) {
            unreadable.emplace(path, candidate.fetch().error);
        } else if (found != Relevance::kRelevant) {
            log_exclusion(log, path, found);
        } else {
            log.debug("checkfiles: checking {} ...", path);
        }
        return found;
    };

    auto state = diff_classify(tokens, policy, relevance);
    if (!state.errors.empty()) {
        const auto& path = state.errors.front();
        return run_error(fmt::format("{}: {}", path, unreadable[path]));
    }

    ReportAggregator aggregator;
    for (const auto& report : state.reports) {
        record_file_report(aggregator, log, report, policy, style);
    }
    return finish_run(aggregator, log, change.revision.empty() ? source.name() : change.revision);
}
