#include "test_common.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser boolean flags do not swallow positionals") {
    const char* argv[] = {"prog", "--dry-run", "config.yaml"};
    ArgParser parser(3, const_cast<char**>(argv), {"--dry-run"});
    REQUIRE(parser.has_flag("--dry-run"));
    REQUIRE(parser.get_option("--dry-run").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"config.yaml"});
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"}, {}, {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-o42", "-n", "7"};
    ArgParser parser(5, const_cast<char**>(argv), {"--help", "--opt", "--num"},
                     {{'h', "--help"}, {'o', "--opt"}, {'n', "--num"}}, {"--opt", "--num"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.get_option("--num") == "7");
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser unknown flag detection") {
    const char* argv[] = {"prog", "--foo", "-x"};
    ArgParser parser(3, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE_FALSE(parser.has_flag("--foo"));
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"--foo", "-x"});
}

TEST_CASE("ArgParser reports value options without a value") {
    const char* argv[] = {"prog", "--log-file"};
    ArgParser parser(2, const_cast<char**>(argv), {"--log-file"}, {}, {"--log-file"});
    REQUIRE_FALSE(parser.has_flag("--log-file"));
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--log-file"});
}

TEST_CASE("ArgParser treats everything after -- as positional") {
    const char* argv[] = {"prog", "--", "--not-a-flag", "-h"};
    ArgParser parser(4, const_cast<char**>(argv), {"--help"}, {{'h', "--help"}});
    REQUIRE_FALSE(parser.has_flag("--help"));
    REQUIRE(parser.positional() == std::vector<std::string>{"--not-a-flag", "-h"});
}

TEST_CASE("ArgParser accepts any flag without a known list") {
    const char* argv[] = {"prog", "--anything", "--else=1"};
    ArgParser parser(3, const_cast<char**>(argv));
    REQUIRE(parser.has_flag("--anything"));
    REQUIRE(parser.get_option("--else") == "1");
    REQUIRE(parser.unknown_flags().empty());
}
