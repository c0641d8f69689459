#include "diff_classifier.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace checkfiles;

namespace {

DiffToken
token(DiffLabel label, std::string text, std::optional<int64_t> line_number = std::nullopt) {
    return DiffToken{label, std::move(text), line_number};
}

Relevance
everything_relevant(const std::string&) {
    return Relevance::kRelevant;
}

}  // namespace

TEST_CASE("diff_header_path") {
    REQUIRE(diff_header_path("+++ b/src/main.c") == std::string("src/main.c"));
    REQUIRE(diff_header_path("+++ src/main.c\t2024-01-01 10:00:00") == std::string("src/main.c"));
    REQUIRE(diff_header_path("+++ b/with space.txt\t(revision 4)") == std::string("with space.txt"));
    REQUIRE_FALSE(diff_header_path("+++ /dev/null").has_value());
    REQUIRE_FALSE(diff_header_path("+++ ").has_value());
    REQUIRE_FALSE(diff_header_path("+++").has_value());
    REQUIRE_FALSE(diff_header_path("--- a/main.c").has_value());
}

TEST_CASE("diff_classify") {
    Policy policy;
    policy.tab_width = 4;

    SUBCASE("marker is attributed to its own file") {
        std::vector<DiffToken> tokens = {
            token(DiffLabel::kFileHeader, "+++ b/first.c"),
            token(DiffLabel::kOther, "\n"),
            token(DiffLabel::kHunkHeader, "@@ -1 +1,2 @@"),
            token(DiffLabel::kOther, "\n"),
            token(DiffLabel::kInsertedLine, "+int x;", 2),
            token(DiffLabel::kTrailingWhitespaceMarker, "  ", 2),
            token(DiffLabel::kOther, "\n"),
            token(DiffLabel::kFileHeader, "+++ b/second.c"),
            token(DiffLabel::kOther, "\n"),
            token(DiffLabel::kHunkHeader, "@@ -1 +1,2 @@"),
            token(DiffLabel::kOther, "\n"),
            token(DiffLabel::kInsertedLine, "+int y;", 2),
            token(DiffLabel::kOther, "\n"),
        };

        auto state = diff_classify(tokens, policy, everything_relevant);
        REQUIRE(state.reports.size() == 2);
        REQUIRE(state.reports[0].path == "first.c");
        REQUIRE(state.reports[0].violations.size() == 1);
        REQUIRE(state.reports[0].violations[0].file == "first.c");
        REQUIRE(state.reports[0].violations[0].kind == ViolationKind::kTrailingWhitespace);
        REQUIRE(state.reports[0].violations[0].line == 2);
        REQUIRE(state.reports[0].violations[0].hunk == "@@ -1 +1,2 @@");
        REQUIRE(state.reports[0].violations[0].pointer->carets == "      ^^");
        REQUIRE(state.reports[1].path == "second.c");
        REQUIRE(state.reports[1].ok());
    }

    SUBCASE("marker not after an inserted line is ignored") {
        std::vector<DiffToken> tokens = {
            token(DiffLabel::kFileHeader, "+++ b/a.c"),
            token(DiffLabel::kHunkHeader, "@@ -1 +1 @@"),
            token(DiffLabel::kOther, " context"),
            token(DiffLabel::kTrailingWhitespaceMarker, " "),
            token(DiffLabel::kInsertedLine, "+x", 1),
            token(DiffLabel::kOther, "\n"),
            token(DiffLabel::kTrailingWhitespaceMarker, " "),
        };
        auto state = diff_classify(tokens, policy, everything_relevant);
        REQUIRE(state.reports.size() == 1);
        REQUIRE(state.reports[0].ok());
    }

    SUBCASE("inserted lines get the indentation check") {
        std::vector<DiffToken> tokens = {
            token(DiffLabel::kFileHeader, "+++ b/b.txt"),
            token(DiffLabel::kHunkHeader, "@@ -0,0 +1,2 @@"),
            token(DiffLabel::kInsertedLine, "+\t\tok", 1),
            token(DiffLabel::kInsertedLine, "+    ok", 2),
        };

        auto spaces = diff_classify(tokens, policy, everything_relevant);
        REQUIRE(spaces.reports.size() == 1);
        REQUIRE(spaces.reports[0].violations.size() == 1);
        REQUIRE(spaces.reports[0].violations[0].kind == ViolationKind::kWrongIndentChar);
        REQUIRE(spaces.reports[0].violations[0].line == 1);

        policy.indent_mode = IndentMode::kTabsOnly;
        auto tabs = diff_classify(tokens, policy, everything_relevant);
        REQUIRE(tabs.reports[0].violations.size() == 1);
        REQUIRE(tabs.reports[0].violations[0].line == 2);
    }

    SUBCASE("irrelevant files are skipped until the next header") {
        std::vector<DiffToken> tokens = {
            token(DiffLabel::kFileHeader, "+++ b/image.png"),
            token(DiffLabel::kHunkHeader, "@@ -0,0 +1 @@"),
            token(DiffLabel::kInsertedLine, "+\tx", 1),
            token(DiffLabel::kFileHeader, "+++ b/locked.c"),
            token(DiffLabel::kInsertedLine, "+\tx", 1),
            token(DiffLabel::kFileHeader, "+++ b/main.c"),
            token(DiffLabel::kInsertedLine, "+\tx", 1),
        };
        auto relevance = [](const std::string& path) {
            if (path == "image.png") {
                return Relevance::kUncheckedSuffix;
            }
            if (path == "locked.c") {
                return Relevance::kUnreadable;
            }
            return Relevance::kRelevant;
        };

        auto state = diff_classify(tokens, policy, relevance);
        REQUIRE(state.reports.size() == 1);
        REQUIRE(state.reports[0].path == "main.c");
        REQUIRE(state.reports[0].violations.size() == 1);
        REQUIRE(state.errors.size() == 1);
        REQUIRE(state.errors[0] == "locked.c");
    }

    SUBCASE("deleted file header clears the current file") {
        std::vector<DiffToken> tokens = {
            token(DiffLabel::kFileHeader, "+++ /dev/null"),
            token(DiffLabel::kInsertedLine, "+\tx", 1),
        };
        auto state = diff_classify(tokens, policy, everything_relevant);
        REQUIRE(state.reports.empty());
    }

    SUBCASE("unnumbered violations keep the hunk") {
        std::vector<DiffToken> tokens = {
            token(DiffLabel::kFileHeader, "+++ b/a.c"),
            token(DiffLabel::kHunkHeader, "@@ somewhere @@"),
            token(DiffLabel::kInsertedLine, "+x"),
            token(DiffLabel::kTrailingWhitespaceMarker, "\t"),
        };
        auto state = diff_classify(tokens, policy, everything_relevant);
        REQUIRE(state.reports[0].violations.size() == 1);
        REQUIRE_FALSE(state.reports[0].violations[0].line.has_value());
        REQUIRE(state.reports[0].violations[0].hunk == "@@ somewhere @@");
    }

    SUBCASE("step by step") {
        DiffClassifierState state;
        state = diff_classify_step(std::move(state), token(DiffLabel::kFileHeader, "+++ b/a.c"), policy,
                                   everything_relevant);
        REQUIRE(state.current_file == std::string("a.c"));
        state = diff_classify_step(std::move(state), token(DiffLabel::kInsertedLine, "+y", 1), policy,
                                   everything_relevant);
        REQUIRE(state.last_label == DiffLabel::kInsertedLine);
        REQUIRE(state.reports.empty());
        state = diff_classify_finish(std::move(state));
        REQUIRE(state.reports.size() == 1);
        REQUIRE_FALSE(state.current_file.has_value());
    }

    SUBCASE("labeled diff text") {
        auto tokens = label_unified_diff(
            "--- a/a.py\n"
            "+++ b/a.py\n"
            "@@ -1,2 +1,2 @@\n"
            " def f():\n"
            "-    x = 0\n"
            "+    x = 1 \n");
        auto state = diff_classify(tokens, policy, everything_relevant);
        REQUIRE(state.reports.size() == 1);
        REQUIRE(state.reports[0].violations.size() == 1);
        REQUIRE(state.reports[0].violations[0].kind == ViolationKind::kTrailingWhitespace);
        REQUIRE(state.reports[0].violations[0].line == 2);
    }

    SUBCASE("change parents") {
        REQUIRE(is_checkable_change({"tip", 1}));
        REQUIRE_FALSE(is_checkable_change({"merge", 2}));
        REQUIRE_FALSE(is_checkable_change({"root", 0}));
    }
}
