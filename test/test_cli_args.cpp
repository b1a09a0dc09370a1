#include <catch2/catch_test_macros.hpp>
#include <sp/cli_args.h>
#include <sp/cli_utils.h>
#include <stdexcept>
#include <string>

using namespace sp;

TEST_CASE("No arguments reads stdin and prints", "[cli][cli_args][unit]") {
    const char* argv[] = {"sysctl-parser"};
    CliArgs args(1, argv);
    REQUIRE(args.getAction() == CliArgs::Action::PRINT);
    REQUIRE(args.readsStdin());
    REQUIRE(args.getLayout() == JsonLayout::Flat);
    REQUIRE(args.parseOptions().duplicates == DuplicateKeyPolicy::Reject);
}

TEST_CASE("Config path only", "[cli][cli_args][unit]") {
    const char* argv[] = {"sysctl-parser", "/etc/sysctl.conf"};
    CliArgs args(2, argv);
    REQUIRE(args.getAction() == CliArgs::Action::PRINT);
    REQUIRE(args.getConfigPath() == "/etc/sysctl.conf");
    REQUIRE_FALSE(args.readsStdin());
}

TEST_CASE("Dash means stdin", "[cli][cli_args][unit]") {
    const char* argv[] = {"sysctl-parser", "-"};
    CliArgs args(2, argv);
    REQUIRE(args.readsStdin());
}

TEST_CASE("Schema switches to validate", "[cli][cli_args][unit]") {
    const char* argv[] = {"sysctl-parser", "--schema", "kernel.schema", "99-custom.conf"};
    CliArgs args(4, argv);
    REQUIRE(args.getAction() == CliArgs::Action::VALIDATE);
    REQUIRE(args.getSchemaPath() == "kernel.schema");
    REQUIRE(args.getConfigPath() == "99-custom.conf");
    REQUIRE_FALSE(args.validateOptions().strict);
}

TEST_CASE("Validation and parse options", "[cli][cli_args][unit]") {
    const char* argv[] = {"sysctl-parser", "-s", "k.schema", "--strict", "--require", "--bool-style",
                          "01", "--allow-duplicates", "-f", "nested", "-v", "in.conf"};
    CliArgs args(12, argv);
    REQUIRE(args.validateOptions().strict);
    REQUIRE(args.validateOptions().require_exact);
    REQUIRE(args.validateOptions().boolean_style == BooleanStyle::ZeroOne);
    REQUIRE(args.parseOptions().duplicates == DuplicateKeyPolicy::LastWins);
    REQUIRE(args.getLayout() == JsonLayout::Nested);
    REQUIRE(args.verbose());
    REQUIRE(args.getConfigPath() == "in.conf");
}

TEST_CASE("Help wins over other arguments", "[cli][cli_args][unit]") {
    const char* argv[] = {"sysctl-parser", "in.conf", "--help", "--bogus"};
    CliArgs args(4, argv);
    REQUIRE(args.getAction() == CliArgs::Action::HELP);
}

TEST_CASE("Missing flag values throw", "[cli][cli_args][errors]") {
    const char* schema[] = {"sysctl-parser", "--schema"};
    REQUIRE_THROWS_AS(CliArgs(2, schema), std::invalid_argument);
    const char* format[] = {"sysctl-parser", "--format"};
    REQUIRE_THROWS_AS(CliArgs(2, format), std::invalid_argument);
}

TEST_CASE("Bad flag values throw", "[cli][cli_args][errors]") {
    const char* format[] = {"sysctl-parser", "--format", "yaml"};
    REQUIRE_THROWS_AS(CliArgs(3, format), std::invalid_argument);
    const char* style[] = {"sysctl-parser", "--bool-style", "yesno"};
    REQUIRE_THROWS_AS(CliArgs(3, style), std::invalid_argument);
}

TEST_CASE("Second positional argument throws", "[cli][cli_args][errors]") {
    const char* argv[] = {"sysctl-parser", "a.conf", "b.conf"};
    REQUIRE_THROWS_AS(CliArgs(3, argv), std::invalid_argument);
}

TEST_CASE("Unknown flag suggests the closest option", "[cli][cli_args][errors]") {
    const char* argv[] = {"sysctl-parser", "--strcit"};
    try {
        CliArgs args(2, argv);
        FAIL("expected invalid_argument");
    } catch (const std::invalid_argument& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("Unknown argument: --strcit") != std::string::npos);
        REQUIRE(msg.find("Did you mean '--strict'?") != std::string::npos);
    }
}

TEST_CASE("Edit distance and suggestions", "[cli][cli_utils][unit]") {
    REQUIRE(cli_utils::edit_distance("kitten", "sitting") == 3);
    REQUIRE(cli_utils::edit_distance("", "abc") == 3);
    REQUIRE(cli_utils::edit_distance("same", "same") == 0);
    REQUIRE(cli_utils::closest_option("--shema", {"--schema", "--strict"}) == "--schema");
    REQUIRE(cli_utils::closest_option("--completely-unrelated", {"-h"}).empty());
    REQUIRE(cli_utils::closest_option("--x", {}).empty());
}
