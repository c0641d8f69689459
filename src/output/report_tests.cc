#include "report.hpp"

#include <doctest.h>

#include <string>
#include <utility>
#include <vector>

using namespace checkfiles;

namespace {

Violation
make_violation(const std::string& file, std::optional<int64_t> line, ViolationKind kind) {
    Violation violation;
    violation.file = file;
    violation.line = line;
    violation.kind = kind;
    return violation;
}

}  // namespace

TEST_CASE("report aggregator") {
    ReportAggregator aggregator;

    SUBCASE("empty run") {
        auto report = aggregator.finalize();
        REQUIRE(report.files_with_issues == 0);
        REQUIRE(report.total_issues == 0);
        REQUIRE_FALSE(report.had_issues());
    }

    SUBCASE("files and occurrences") {
        aggregator.record_file("a.py", true, "trailing whitespace");
        aggregator.record_violation_count(3);
        aggregator.record_file("b.py", false, "");
        aggregator.record_file("c.py", true, "tab character(s)");
        aggregator.record_violation_count(1);

        auto report = aggregator.finalize();
        REQUIRE(report.files_with_issues == 2);
        REQUIRE(report.total_issues == 4);
        REQUIRE(report.had_issues());
        REQUIRE(aggregator.file_summaries().size() == 2);
        REQUIRE(aggregator.file_summaries()[0] == "a.py: trailing whitespace");
    }

    SUBCASE("a file is recorded once") {
        REQUIRE(aggregator.record_file("a.py", true, "trailing whitespace"));
        REQUIRE_FALSE(aggregator.record_file("a.py", true, "trailing whitespace"));
        REQUIRE(aggregator.record_file("b.py", false, ""));
        REQUIRE_FALSE(aggregator.record_file("b.py", true, "all whitespace"));
        REQUIRE(aggregator.finalize().files_with_issues == 1);
    }
}

TEST_CASE("report rendering") {
    SUBCASE("violation lines") {
        auto violation = make_violation("src/main.c", 12, ViolationKind::kTrailingWhitespace);
        REQUIRE(render_violation(violation, IndentMode::kSpacesOnly) == "src/main.c (12): trailing whitespace");

        violation.kind = ViolationKind::kWrongIndentChar;
        REQUIRE(render_violation(violation, IndentMode::kSpacesOnly) == "src/main.c (12): tab character(s)");
        REQUIRE(render_violation(violation, IndentMode::kTabsOnly) == "src/main.c (12): space indentation");
    }

    SUBCASE("hunk replaces a missing line number") {
        auto violation = make_violation("a.c", std::nullopt, ViolationKind::kAllWhitespace);
        violation.hunk = "@@ -1 +1 @@";
        REQUIRE(render_violation(violation, IndentMode::kSpacesOnly) == "a.c (@@ -1 +1 @@): all whitespace");
    }

    SUBCASE("summaries") {
        FileReport file;
        file.path = "a.c";
        file.add(make_violation("a.c", 1, ViolationKind::kAllWhitespace));
        file.add(make_violation("a.c", 2, ViolationKind::kAllWhitespace));
        file.add(make_violation("a.c", 3, ViolationKind::kTrailingWhitespace));
        REQUIRE(summary_label(file, IndentMode::kSpacesOnly) == "all whitespace, trailing whitespace");

        RunReport run;
        run.files_with_issues = 1;
        run.total_issues = 3;
        REQUIRE(render_run_summary(run, "working directory") == "3 issue(s) found in 1 file(s) in working directory.");
        REQUIRE(render_run_summary(run, "tip") == "3 issue(s) found in 1 file(s) in tip.");
    }

    SUBCASE("report_file") {
        std::vector<std::pair<LogLevel, std::string>> lines;
        Log log(Verbosity::kVerbose, [&](LogLevel level, const std::string& message) {
            lines.emplace_back(level, message);
        });

        FileReport clean;
        clean.path = "ok.c";
        report_file(log, clean, IndentMode::kSpacesOnly, report_style_default(false));
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].first == LogLevel::kNote);
        REQUIRE(lines[0].second == "ok.c: ok");

        lines.clear();
        FileReport dirty;
        dirty.path = "a.py";
        auto violation = make_violation("a.py", 2, ViolationKind::kTrailingWhitespace);
        violation.pointer = LinePointer{"    x = 1 ", "         ^"};
        dirty.add(violation);
        report_file(log, dirty, IndentMode::kSpacesOnly, report_style_default(false));
        REQUIRE(lines.size() == 3);
        REQUIRE(lines[0].first == LogLevel::kStatus);
        REQUIRE(lines[0].second == "a.py (2): trailing whitespace");
        REQUIRE(lines[1].second == "      x = 1 ");
        REQUIRE(lines[2].second == "           ^");

        lines.clear();
        report_file(log, dirty, IndentMode::kSpacesOnly, report_style_default(true));
        REQUIRE(lines[2].second == "  \x1b[1;31m         ^\x1b[0m");
    }
}
