#include "policy.hpp"

#include <doctest.h>

#include <string>

using namespace checkfiles;

TEST_CASE("policy") {
    PolicySettings settings;
    Policy policy;

    SUBCASE("defaults") {
        auto result = policy_build(settings, policy);
        REQUIRE(result.ok);
        REQUIRE(policy.tab_width == 8);
        REQUIRE(policy.indent_mode == IndentMode::kSpacesOnly);
        REQUIRE_FALSE(policy.diff_only);
        REQUIRE(policy.checked_suffixes.count(".py") == 1);
        REQUIRE(policy.checked_suffixes.count(".glsl") == 1);
        REQUIRE(policy.checked_suffixes.size() == 17);
    }

    SUBCASE("wildcard checks everything") {
        settings.checked_exts = {".c", "*"};
        REQUIRE(policy_build(settings, policy).ok);
        REQUIRE(policy.checked_suffixes.empty());
        REQUIRE(policy_is_checked_suffix(policy, "Makefile"));
    }

    SUBCASE("empty list checks everything") {
        settings.checked_exts.clear();
        REQUIRE(policy_build(settings, policy).ok);
        REQUIRE(policy_is_checked_suffix(policy, "notes.md"));
    }

    SUBCASE("suffix and path matching") {
        settings.ignored_exts = {".min.js"};
        settings.ignored_files = {"foo/contains_tabs.txt"};
        REQUIRE(policy_build(settings, policy).ok);

        REQUIRE(policy_is_checked_suffix(policy, "src/main.cpp"));
        REQUIRE_FALSE(policy_is_checked_suffix(policy, "README.md"));
        REQUIRE(policy_is_ignored_suffix(policy, "web/app.min.js"));
        REQUIRE_FALSE(policy_is_ignored_suffix(policy, "web/app.js"));
        REQUIRE(policy_is_ignored_path(policy, "foo/contains_tabs.txt"));
        REQUIRE_FALSE(policy_is_ignored_path(policy, "contains_tabs.txt"));
    }

    SUBCASE("tab size") {
        settings.tab_size = "4";
        REQUIRE(policy_build(settings, policy).ok);
        REQUIRE(policy.tab_width == 4);
    }

    SUBCASE("non numeric tab size is rejected") {
        policy.tab_width = 3;
        settings.tab_size = "four";
        auto result = policy_build(settings, policy);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "invalid tab_size 'four': not a number");
        REQUIRE(policy.tab_width == 3);

        settings.tab_size = "4x";
        REQUIRE_FALSE(policy_build(settings, policy).ok);
        settings.tab_size = "";
        REQUIRE_FALSE(policy_build(settings, policy).ok);
    }

    SUBCASE("zero tab size is rejected") {
        settings.tab_size = "0";
        auto result = policy_build(settings, policy);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "invalid tab_size '0': must be at least 1");
        settings.tab_size = "-2";
        REQUIRE_FALSE(policy_build(settings, policy).ok);
    }

    SUBCASE("huge tab size is rejected") {
        policy.tab_width = 3;
        settings.tab_size = "100000000000";
        auto result = policy_build(settings, policy);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "invalid tab_size '100000000000': too large (at most 256)");
        REQUIRE(policy.tab_width == 3);

        settings.tab_size = "256";
        REQUIRE(policy_build(settings, policy).ok);
        REQUIRE(policy.tab_width == 256);
        settings.tab_size = "257";
        REQUIRE_FALSE(policy_build(settings, policy).ok);
    }

    SUBCASE("indent mode") {
        settings.indent = "tabs";
        REQUIRE(policy_build(settings, policy).ok);
        REQUIRE(policy.indent_mode == IndentMode::kTabsOnly);

        settings.indent = "mixed";
        auto result = policy_build(settings, policy);
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "invalid indent 'mixed': expected 'spaces' or 'tabs'");
    }

    SUBCASE("describe") {
        settings.checked_exts = {".c", ".h"};
        settings.tab_size = "4";
        REQUIRE(policy_build(settings, policy).ok);
        REQUIRE(policy_describe(policy) ==
                "checked extensions: .c .h; ignored extensions: ; ignored files: ; tab size: 4; "
                "indent: spaces; diff only: false");
    }
}
