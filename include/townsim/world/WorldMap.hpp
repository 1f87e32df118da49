#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "townsim/pathfinding/GridMap.hpp"
#include "townsim/world/Geometry.hpp"

namespace townsim::world {

// Named rectangle of tiles ("market", "plaza").
struct Zone {
    std::string name;
    int x = 0, y = 0, w = 0, h = 0;

    [[nodiscard]] bool contains(pf::IVec2 t) const noexcept
    {
        return t.x >= x && t.y >= y && t.x < x + w && t.y < y + h;
    }
};

// Static part of a world: size, walls and zones. Shared read-only between
// a world and all of its copies.
class WorldMap {
public:
    WorldMap() = default;
    WorldMap(int width, int height);

    [[nodiscard]] int width()  const noexcept { return m_grid.width(); }
    [[nodiscard]] int height() const noexcept { return m_grid.height(); }
    [[nodiscard]] const pf::GridMap& grid() const noexcept { return m_grid; }

    void setBlocked(int x, int y, bool blocked);
    [[nodiscard]] bool walkable(pf::IVec2 t) const { return m_grid.passable(t.x, t.y); }

    void addZone(Zone z) { m_zones.push_back(std::move(z)); }
    [[nodiscard]] const std::vector<Zone>& zones() const noexcept { return m_zones; }
    [[nodiscard]] const Zone* findZone(const std::string& name) const noexcept;

    // First zone containing the tile, or empty.
    [[nodiscard]] std::string zoneAt(Vec2 p) const;

    [[nodiscard]] nlohmann::json toJson() const;
    // Throws nlohmann::json::exception or core::ValidationError on malformed input.
    [[nodiscard]] static WorldMap fromJson(const nlohmann::json& j);

private:
    pf::GridMap       m_grid;
    std::vector<Zone> m_zones;
};

// Loads a map document (`{"width","height","blocked":[[x,y]...],"zones":[...]}`).
[[nodiscard]] bool LoadWorldMap(const std::filesystem::path& path,
                                WorldMap& out,
                                std::string* outError = nullptr) noexcept;

} // namespace townsim::world
