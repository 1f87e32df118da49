#pragma once

#include <filesystem>
#include <string>

#include "townsim/engine/Engine.hpp"
#include "townsim/world/World.hpp"

namespace townsim::persist {

struct LoadedWorld {
    std::string         worldId;
    engine::EngineState state;
    world::World        world;
};

// Versioned snapshot of one world and its engine counters, written atomically.
[[nodiscard]] bool SaveWorld(const std::filesystem::path& path,
                             const std::string& worldId,
                             const engine::Checkpoint& cp,
                             std::string* outError = nullptr) noexcept;

// Rejects unknown formats/versions and worlds that fail their invariants.
[[nodiscard]] bool LoadWorld(const std::filesystem::path& path,
                             LoadedWorld& out,
                             std::string* outError = nullptr) noexcept;

} // namespace townsim::persist
