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

TEST_CASE("ArgParser plain flags do not take the next argument") {
    const char* argv[] = {"prog", "--no-push", "name"};
    ArgParser parser(3, const_cast<char**>(argv), {"--no-push"});
    REQUIRE(parser.has_flag("--no-push"));
    REQUIRE(parser.get_option("--no-push").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"name"});
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val", "--flag=false"};
    ArgParser parser(3, const_cast<char**>(argv), {"--opt", "--flag"}, {}, {"--opt"});
    REQUIRE(parser.get_option("--opt") == "val");
    REQUIRE(parser.has_flag("--flag"));
    REQUIRE(parser.get_option("--flag") == "false");
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-o42", "-d=x", "-w", "dir"};
    ArgParser parser(6, const_cast<char**>(argv), {"--help", "--opt", "--dest", "--work"},
                     {{'h', "--help"}, {'o', "--opt"}, {'d', "--dest"}, {'w', "--work"}},
                     {"--opt", "--dest", "--work"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.get_option("--dest") == "x");
    REQUIRE(parser.get_option("--work") == "dir");
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser stacked short flags") {
    const char* argv[] = {"prog", "-nkf"};
    ArgParser parser(2, const_cast<char**>(argv), {"--no-push", "--keep", "--force"},
                     {{'n', "--no-push"}, {'k', "--keep"}, {'f', "--force"}});
    REQUIRE(parser.has_flag("--no-push"));
    REQUIRE(parser.has_flag("--keep"));
    REQUIRE(parser.has_flag("--force"));
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"-x"});
}

TEST_CASE("ArgParser list option consumes values up to the next flag") {
    const char* argv[] = {"prog", "--repos", "a", "b", "c", "--no-push", "-r", "d", "--repos=e"};
    ArgParser parser(9, const_cast<char**>(argv), {"--repos", "--no-push"}, {{'r', "--repos"}},
                     {}, {"--repos"});
    REQUIRE(parser.get_all_options("--repos") ==
            std::vector<std::string>{"a", "b", "c", "d", "e"});
    REQUIRE(parser.has_flag("--no-push"));
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.missing_values().empty());
}

TEST_CASE("ArgParser reports value options without a value") {
    const char* argv[] = {"prog", "--repos", "--log-file"};
    ArgParser parser(3, const_cast<char**>(argv), {"--repos", "--log-file"}, {},
                     {"--log-file"}, {"--repos"});
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--repos", "--log-file"});
}

TEST_CASE("ArgParser double dash ends option parsing") {
    const char* argv[] = {"prog", "--flag", "--", "--not-a-flag"};
    ArgParser parser(4, const_cast<char**>(argv), {"--flag"});
    REQUIRE(parser.has_flag("--flag"));
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"--not-a-flag"});
}

TEST_CASE("ArgParser keeps repeated option values in order") {
    const char* argv[] = {"prog", "--config-yaml", "a.yaml", "--config-yaml", "b.yaml"};
    ArgParser parser(5, const_cast<char**>(argv), {"--config-yaml"}, {}, {"--config-yaml"});
    REQUIRE(parser.get_option("--config-yaml") == "b.yaml");
    REQUIRE(parser.get_all_options("--config-yaml") ==
            std::vector<std::string>{"a.yaml", "b.yaml"});
}
