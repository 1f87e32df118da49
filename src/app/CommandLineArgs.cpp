#include "app/CommandLineArgs.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace townsim::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// "--opt=value" -> value
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view prefix, std::string_view& outValue)
{
    if (arg.size() <= prefix.size() || arg.substr(0, prefix.size()) != prefix || arg[prefix.size()] != '=')
        return false;
    outValue = arg.substr(prefix.size() + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    long long v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + (c - '0');
        if (v > std::numeric_limits<int>::max())
            return std::nullopt;
    }
    return static_cast<int>(v);
}

} // namespace

CommandLineArgs ParseCommandLineArgs(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const std::size_t argc = argv.size();

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        // Lower-case only the option name so "--Config=/Data/X" keeps its value.
        std::string lowered;
        const auto eq = raw.find('=');
        if (eq == std::string_view::npos)
            lowered = ToLower(raw);
        else
            lowered = ToLower(raw.substr(0, eq)) + std::string(raw.substr(eq));
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }
        if (arg == "--no-stdin") { out.noStdin = true; continue; }

        const auto takeNext = [&](std::optional<std::string>& dst) {
            if (i + 1 >= argc || argv[i + 1].empty()) {
                out.unknown.emplace_back(raw);
                return;
            }
            dst = std::string(argv[++i]);
        };

        std::string_view value;
        const auto stringOption = [&](std::string_view name, std::optional<std::string>& dst) -> bool {
            if (arg == name) {
                takeNext(dst);
                return true;
            }
            if (ConsumeValue(arg, name, value)) {
                if (value.empty())
                    out.unknown.emplace_back(raw);
                else
                    dst = std::string(value);
                return true;
            }
            return false;
        };

        if (stringOption("--config", out.configPath)) continue;
        if (stringOption("--data-dir", out.dataDir)) continue;
        if (stringOption("--log-level", out.logLevel)) continue;

        std::optional<std::string> stepsText;
        if (stringOption("--steps", stepsText))
        {
            if (stepsText)
            {
                if (const auto n = ParseInt(*stepsText))
                    out.steps = *n;
                else
                    out.unknown.emplace_back(raw);
            }
            continue;
        }

        out.unknown.emplace_back(raw);
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "townsim_server - deterministic town simulation server\n\n";
    oss << "Reads one JSON request per line on stdin and answers on stdout.\n\n";
    oss << "Options\n";
    oss << "  --config <path>       JSON configuration file\n";
    oss << "  --data-dir <path>     Directory for snapshots, input logs and channels\n";
    oss << "  --log-level <lvl>     trace|debug|info|warn|error|critical|off\n";
    oss << "  --steps <n>           Run n server ticks and exit\n";
    oss << "  --no-stdin            Don't read requests; run until interrupted\n";
    oss << "  --help, -h            Show this help\n\n";
    oss << "Examples\n";
    oss << "  townsim_server --config townsim.json\n";
    oss << "  townsim_server --data-dir /tmp/town --steps 60 --log-level debug\n";
    return oss.str();
}

} // namespace townsim::app
