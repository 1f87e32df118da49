#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "townsim/core/Clock.hpp"
#include "townsim/pathfinding/GridTypes.hpp"
#include "townsim/world/Geometry.hpp"
#include "townsim/world/Ids.hpp"

namespace townsim::world {

using core::TimeMs;

// Pathfinding phases of a player that has a destination.
struct NeedsPath {
    constexpr bool operator==(const NeedsPath&) const = default;
};

struct WaitingAfterCollision {
    TimeMs until = 0;
    constexpr bool operator==(const WaitingAfterCollision&) const = default;
};

struct Moving {
    std::vector<pf::IVec2> waypoints; // includes the start tile
    std::size_t            next = 1;  // index of the waypoint being approached

    bool operator==(const Moving&) const = default;
};

using PathState = std::variant<NeedsPath, WaitingAfterCollision, Moving>;

struct Pathfinding {
    pf::IVec2 destination{};
    TimeMs    started = 0;
    PathState state = NeedsPath{};
};

struct Activity {
    std::string description;
    std::string emoji;
    TimeMs      until = 0;
};

struct Player {
    PlayerId                   id;
    std::string                name;
    std::optional<std::string> humanToken;   // set when an external user controls it

    Vec2   position;
    Vec2   facing{ 0.0, 1.0 };
    double speed = 0.0;                      // tiles per second, 0 at rest

    std::optional<Pathfinding> pathfinding;
    std::optional<Activity>    activity;
    std::string                zone;
    TimeMs                     lastInput = 0;

    [[nodiscard]] bool isMoving() const noexcept { return pathfinding.has_value(); }
};

} // namespace townsim::world
