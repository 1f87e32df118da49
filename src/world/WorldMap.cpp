#include "townsim/world/WorldMap.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"

namespace townsim::world {

using json = nlohmann::json;

WorldMap::WorldMap(int width, int height)
    : m_grid(width, height)
{
}

void WorldMap::setBlocked(int x, int y, bool blocked)
{
    if (!m_grid.bounds().contains(x, y))
        return;
    m_grid.set_walkable(x, y, blocked ? 0 : 1);
}

const Zone* WorldMap::findZone(const std::string& name) const noexcept
{
    for (const Zone& z : m_zones)
        if (z.name == name)
            return &z;
    return nullptr;
}

std::string WorldMap::zoneAt(Vec2 p) const
{
    const pf::IVec2 t = ToTile(p);
    for (const Zone& z : m_zones)
        if (z.contains(t))
            return z.name;
    return {};
}

json WorldMap::toJson() const
{
    json blocked = json::array();
    for (int y = 0; y < height(); ++y)
        for (int x = 0; x < width(); ++x)
            if (!m_grid.passable(x, y))
                blocked.push_back(json::array({ x, y }));

    json zones = json::array();
    for (const Zone& z : m_zones)
        zones.push_back({ {"name", z.name}, {"x", z.x}, {"y", z.y}, {"w", z.w}, {"h", z.h} });

    return {
        {"width", width()},
        {"height", height()},
        {"blocked", std::move(blocked)},
        {"zones", std::move(zones)},
    };
}

WorldMap WorldMap::fromJson(const json& j)
{
    const int w = j.at("width").get<int>();
    const int h = j.at("height").get<int>();
    if (w <= 0 || h <= 0 || w > 4096 || h > 4096)
        throw core::ValidationError("map dimensions out of range");

    WorldMap map(w, h);

    if (auto it = j.find("blocked"); it != j.end() && it->is_array())
    {
        for (const auto& cell : *it)
        {
            if (!cell.is_array() || cell.size() != 2)
                continue;
            map.setBlocked(cell[0].get<int>(), cell[1].get<int>(), true);
        }
    }

    if (auto it = j.find("zones"); it != j.end() && it->is_array())
    {
        using namespace core::json_util;
        for (const auto& zj : *it)
        {
            Zone z;
            z.name = ObjString(zj, "name", "");
            z.x = ObjInt(zj, "x", 0);
            z.y = ObjInt(zj, "y", 0);
            z.w = ObjInt(zj, "w", 0);
            z.h = ObjInt(zj, "h", 0);
            if (!z.name.empty() && z.w > 0 && z.h > 0)
                map.addZone(std::move(z));
        }
    }

    return map;
}

bool LoadWorldMap(const std::filesystem::path& path, WorldMap& out, std::string* outError) noexcept
{
    json j;
    if (!core::json_util::ParseJsonFile(path, j, outError))
        return false;

    try
    {
        out = WorldMap::fromJson(j);
        return true;
    }
    catch (const json::exception& e)
    {
        if (outError)
            *outError = "Invalid map '" + path.string() + "': " + e.what();
        return false;
    }
    catch (const core::ValidationError& e)
    {
        if (outError)
            *outError = "Invalid map '" + path.string() + "': " + e.what();
        return false;
    }
}

} // namespace townsim::world
