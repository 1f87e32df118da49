#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "townsim/core/Config.hpp"
#include "townsim/world/World.hpp"
#include "townsim/world/WorldMap.hpp"

namespace townsim::test {

// Fresh directory under the system temp dir, unique per call.
inline std::filesystem::path make_unique_temp_dir(const std::string& tag)
{
    namespace fs = std::filesystem;
    static std::atomic<int> s_counter{ 0 };

    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("townsim_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(s_counter++));
    fs::create_directories(dir, ec);
    return dir;
}

// Open w x h map with a "market" zone in the top-left quarter.
inline std::shared_ptr<const world::WorldMap> open_map(int w = 16, int h = 16)
{
    auto map = std::make_shared<world::WorldMap>(w, h);
    map->addZone(world::Zone{ "market", 0, 0, w / 2, h / 2 });
    return map;
}

inline world::World make_world(int w = 16, int h = 16)
{
    return world::World(open_map(w, h));
}

// Fast, small engine settings for tests.
inline core::EngineConfig test_engine_config()
{
    core::EngineConfig cfg;
    cfg.tickMs = 100;
    cfg.stepMs = 1000;
    cfg.maxTicksPerStep = 50;
    cfg.maxInputsPerStep = 32;
    cfg.maxPendingInputs = 64;
    cfg.movementSpeed = 2.0;
    return cfg;
}

inline world::Vec2 tile(int x, int y)
{
    return world::Vec2{ static_cast<double>(x), static_cast<double>(y) };
}

} // namespace townsim::test
