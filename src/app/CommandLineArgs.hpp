#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace townsim::app {

// Parsed command-line arguments for the townsim_server executable.
//
// Notes:
//   - Option names are case-insensitive; values are taken verbatim.
//   - Both "--opt value" and "--opt=value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;                  // --help / -h
    bool noStdin = false;                   // --no-stdin

    std::optional<std::string> configPath;  // --config <path>
    std::optional<std::string> dataDir;     // --data-dir <path>
    std::optional<std::string> logLevel;    // --log-level <lvl>
    std::optional<int>         steps;       // --steps <n>

    // Unknown options and options with missing or bad values, in order.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(const std::vector<std::string_view>& argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace townsim::app
