#include "app/CommandLineArgs.hpp"

#include "townsim/core/Clock.hpp"
#include "townsim/core/Config.hpp"
#include "townsim/core/Log.hpp"
#include "townsim/server/RequestRouter.hpp"
#include "townsim/server/Server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_interrupted{ false };

extern "C" void OnSignal(int)
{
    g_interrupted.store(true);
}

int RunSteps(townsim::server::Server& server, const townsim::core::IClock& clock, int steps, townsim::core::TimeMs stepMs)
{
    for (int i = 0; i < steps && !g_interrupted.load(); ++i)
    {
        const auto summary = server.tick(clock.now());
        spdlog::debug("Tick {}: {} world(s), {} applied, {} failed, {} driver input(s)",
                      i + 1, summary.worlds, summary.applied, summary.failed, summary.driverSubmitted);
        if (i + 1 < steps)
            std::this_thread::sleep_for(std::chrono::milliseconds(stepMs));
    }
    return 0;
}

void ServeStdin(townsim::server::Server& server)
{
    townsim::server::RequestRouter router(server);
    std::string line;
    while (!g_interrupted.load() && std::getline(std::cin, line))
    {
        if (line.empty() || line[0] == '#')
            continue;
        std::cout << router.HandleLine(line) << '\n' << std::flush;
    }
}

} // namespace

int main(int argc, char** argv)
{
    using namespace townsim;

    std::vector<std::string_view> argvv(argv, argv + argc);
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argvv);

    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }
    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::cerr << "Unknown or incomplete option: " << u << '\n';
        std::cerr << "Run with --help for usage.\n";
        return 2;
    }

    core::ServerConfig cfg;
    std::string err;
    if (args.configPath && !core::LoadConfig(cfg, *args.configPath, &err))
    {
        std::cerr << "Failed to load config: " << err << '\n';
        return 1;
    }
    if (args.dataDir)
        cfg.data.directory = *args.dataDir;
    if (args.logLevel)
        cfg.log.level = *args.logLevel;

    core::InitLogging(cfg.log);
    spdlog::info("townsim starting (config: {})", args.configPath.value_or("<defaults>"));

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    core::SystemClock clock;
    int rc = 0;
    {
        server::Server server(cfg, clock);
        if (!server.start(&err))
        {
            spdlog::critical("Startup failed: {}", err);
            core::ShutdownLogging();
            return 1;
        }

        if (args.steps)
        {
            rc = RunSteps(server, clock, *args.steps, cfg.engine.stepMs);
        }
        else
        {
            server.startLoop();
            if (!args.noStdin)
                ServeStdin(server);
            else
                while (!g_interrupted.load())
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        server.stop();
    }

    core::ShutdownLogging();
    return rc;
}
