#include "config_parser.hpp"
#include "config_parser_utils.hpp"
#include "config_tokenizer.hpp"

#include <doctest.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace checkfiles;

TEST_CASE("config_tokenizer") {
    using namespace checkfiles::config_tokenizer;

    SUBCASE("section and key") {
        std::string cfg_text = "[checkfiles]\n  tab_size = 4 # comment\n";

        config_tokenizer::ParseOptions options;
        config_tokenizer::ParseResult result;
        REQUIRE(tokenize(cfg_text, options, result));
        REQUIRE(result.ok);

        // clang-format off
        REQUIRE(result.tokens.size() == 9);
        REQUIRE((result.tokens[0].id & TokenId_OpenBracket));
        REQUIRE((result.tokens[0].id & TokenId_FirstOnLine));
        REQUIRE((result.tokens[1].id & TokenId_Identifier));
        REQUIRE(result.tokens[1].str_from(cfg_text) == "checkfiles");
        REQUIRE((result.tokens[2].id & TokenId_CloseBracket));
        REQUIRE((result.tokens[3].id & TokenId_Newline));
        REQUIRE((result.tokens[4].id & TokenId_Identifier));
        REQUIRE((result.tokens[4].id & TokenId_FirstOnLine));
        REQUIRE(result.tokens[4].line == 1);
        REQUIRE(result.tokens[4].column == 2);
        REQUIRE((result.tokens[5].id & TokenId_Assign));
        REQUIRE((result.tokens[6].id & TokenId_Integer));
        REQUIRE(result.tokens[6].token_int_arg == 4);
        REQUIRE((result.tokens[7].id & TokenId_Comment));
        REQUIRE(result.tokens[7].str_from(cfg_text) == "# comment");
        REQUIRE((result.tokens[8].id & TokenId_Newline));
        // clang-format on
    }

    SUBCASE("booleans and strings") {
        std::string cfg_text = "a = Yes\nb = off\nc = 'quoted text'\nd = \"x\"";

        config_tokenizer::ParseOptions options;
        options.strip_newlines = true;
        config_tokenizer::ParseResult result;
        REQUIRE(tokenize(cfg_text, options, result));

        REQUIRE(result.tokens.size() == 12);
        REQUIRE((result.tokens[2].id & TokenId_Boolean));
        REQUIRE(result.tokens[2].token_boolean_arg == true);
        REQUIRE((result.tokens[5].id & TokenId_Boolean));
        REQUIRE(result.tokens[5].token_boolean_arg == false);
        REQUIRE((result.tokens[8].id & TokenId_String));
        REQUIRE(result.tokens[8].str_from(cfg_text) == "quoted text");
        REQUIRE(result.tokens[11].str_from(cfg_text) == "x");
    }

    SUBCASE("integer must be the whole word") {
        std::string cfg_text = "4x";
        config_tokenizer::ParseOptions options;
        config_tokenizer::ParseResult result;
        REQUIRE(tokenize(cfg_text, options, result));
        REQUIRE(result.tokens.size() == 1);
        REQUIRE((result.tokens[0].id & TokenId_Identifier));
        REQUIRE_FALSE((result.tokens[0].id & TokenId_Integer));
    }

    SUBCASE("unterminated string") {
        std::string cfg_text = "a = 'oops\nb = 1";
        config_tokenizer::ParseOptions options;
        config_tokenizer::ParseResult result;
        REQUIRE_FALSE(tokenize(cfg_text, options, result));
        REQUIRE(result.error.find("Unterminated string") != std::string::npos);
    }

    SUBCASE("slash comments and paths") {
        std::string cfg_text = "p = src/x.c // trailing";
        config_tokenizer::ParseOptions options;
        options.strip_comments = true;
        config_tokenizer::ParseResult result;
        REQUIRE(tokenize(cfg_text, options, result));
        REQUIRE(result.tokens.size() == 3);
        REQUIRE(result.tokens[2].str_from(cfg_text) == "src/x.c");
    }
}

TEST_CASE("config_parser") {
    SUBCASE("empty input") {
        Value root;
        ParseResult result;
        REQUIRE(cfg_parse_value_tree("", result, root));
        REQUIRE(result.is_ok());
        REQUIRE(root.is_table());
        REQUIRE(root.as_table().empty());
    }

    SUBCASE("single section") {
        std::string cfg_text = R"foo(
            # Whitespace policy
            [checkfiles]
                checked_exts = ['.c', '.h', '.cpp',]
                ignored_files = 'vendor/zlib.c'
                tab_size = 4
                indent = tabs
                diff_only = no
        )foo";

        Value root;
        ParseResult result;
        if (!cfg_parse_value_tree(cfg_text, result, root)) {
            printf("%s\n", result.error.c_str());
        }
        REQUIRE(result.is_ok());

        auto exts = root.lookup_value_by_path("checkfiles.checked_exts");
        REQUIRE(exts);
        REQUIRE(exts->get().is_array());
        REQUIRE(exts->get().as_array().size() == 3);
        REQUIRE(exts->get().as_array()[2].as_string() == ".cpp");

        REQUIRE(root.lookup_value_by_path("checkfiles.ignored_files")->get().as_string() == "vendor/zlib.c");
        REQUIRE(root.lookup_value_by_path("checkfiles.tab_size")->get().as_int() == 4);
        REQUIRE(root.lookup_value_by_path("checkfiles.indent")->get().as_string() == "tabs");
        REQUIRE(root.lookup_value_by_path("checkfiles.diff_only")->get().as_bool() == false);
        REQUIRE_FALSE(root.lookup_value_by_path("checkfiles.missing"));
        REQUIRE_FALSE(root.lookup_value_by_path("other.tab_size"));
    }

    SUBCASE("root keys and repeated sections") {
        std::string cfg_text = R"foo(
            version = 2
            [a]
                x = 1
            [b]
                y = []
            [a]
                z = true
        )foo";

        Value root;
        ParseResult result;
        REQUIRE(cfg_parse_value_tree(cfg_text, result, root));
        REQUIRE(root.lookup_value_by_path("version")->get().as_int() == 2);
        REQUIRE(root.lookup_value_by_path("a.x")->get().as_int() == 1);
        REQUIRE(root.lookup_value_by_path("a.z")->get().as_bool() == true);
        REQUIRE(root.lookup_value_by_path("b.y")->get().as_array().empty());
    }

    SUBCASE("missing value") {
        Value root;
        ParseResult result;
        REQUIRE_FALSE(cfg_parse_value_tree("[checkfiles]\ntab_size =\n", result, root));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.error.find("tab_size") != std::string::npos);
    }

    SUBCASE("unquoted list is rejected") {
        Value root;
        ParseResult result;
        REQUIRE_FALSE(cfg_parse_value_tree("[checkfiles]\nchecked_exts = .c .h", result, root));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.error.find("line 2") != std::string::npos);
    }

    SUBCASE("unclosed section header") {
        Value root;
        ParseResult result;
        REQUIRE_FALSE(cfg_parse_value_tree("[checkfiles\n", result, root));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
    }

    SUBCASE("missing file") {
        Value root;
        ParseResult result;
        REQUIRE_FALSE(cfg_load_file("/nonexistent/checkfiles/test.conf", result, root));
        REQUIRE(result.kind == ParseErrorKind::File);
    }

    SUBCASE("dump") {
        Value root;
        ParseResult result;
        REQUIRE(cfg_parse_value_tree("[s]\nk = ['a', 1]\n", result, root));
        REQUIRE(cfg_dump_value_object(root) == "[s]\n  k = ['a', 1]\n");
    }
}
