#pragma once

#include <cmath>

#include <nlohmann/json.hpp>

#include "townsim/pathfinding/GridTypes.hpp"

namespace townsim::world {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr bool operator==(const Vec2&) const = default;
};

[[nodiscard]] inline double Distance(Vec2 a, Vec2 b) noexcept
{
    return std::hypot(b.x - a.x, b.y - a.y);
}

[[nodiscard]] inline Vec2 ToVec(pf::IVec2 t) noexcept
{
    return { static_cast<double>(t.x), static_cast<double>(t.y) };
}

// Tile containing `p`; positions are tile-centred so rounding is exact at rest.
[[nodiscard]] inline pf::IVec2 ToTile(Vec2 p) noexcept
{
    return { static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)) };
}

inline void to_json(nlohmann::json& j, const Vec2& v)
{
    j = nlohmann::json{ {"x", v.x}, {"y", v.y} };
}

inline void from_json(const nlohmann::json& j, Vec2& v)
{
    v.x = j.at("x").get<double>();
    v.y = j.at("y").get<double>();
}

} // namespace townsim::world
