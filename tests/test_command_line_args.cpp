// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{hpp,cpp}.
//
// Goals:
//   - Options are case-insensitive, values are not
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and bad values are reported in order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] townsim::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    return townsim::app::ParseCommandLineArgs(std::vector<std::string_view>(argv));
}

} // namespace

TEST_CASE("CommandLineArgs parses flags and values")
{
    const auto args = Parse({
        "townsim_server",
        "--CONFIG", "/etc/Townsim.json",
        "--data-dir=/var/lib/Town",
        "--Log-Level", "debug",
        "--steps=60",
        "--no-stdin",
    });

    REQUIRE(args.configPath.has_value());
    CHECK(*args.configPath == "/etc/Townsim.json");
    REQUIRE(args.dataDir.has_value());
    CHECK(*args.dataDir == "/var/lib/Town");
    CHECK(args.logLevel == std::optional<std::string>("debug"));
    CHECK(args.steps == std::optional<int>(60));
    CHECK(args.noStdin);
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs recognizes help aliases")
{
    CHECK(Parse({ "townsim_server", "--help" }).showHelp);
    CHECK(Parse({ "townsim_server", "-h" }).showHelp);
    CHECK(Parse({ "townsim_server", "-?" }).showHelp);
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "townsim_server",
        "--bogus",
        "--steps", "many",
        "--data-dir=",
        "--config",
    });

    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--bogus");
    CHECK(args.unknown[1] == "--steps");
    CHECK(args.unknown[2] == "--data-dir=");
    CHECK(args.unknown[3] == "--config");
    CHECK_FALSE(args.steps.has_value());
    CHECK_FALSE(args.configPath.has_value());
}

TEST_CASE("CommandLineArgs help text lists every option")
{
    const std::string help = townsim::app::BuildCommandLineHelpText();
    for (const char* opt : { "--config", "--data-dir", "--log-level", "--steps", "--no-stdin", "--help" })
        CHECK(help.find(opt) != std::string::npos);
}
