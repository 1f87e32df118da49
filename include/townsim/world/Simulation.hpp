#pragma once

#include "townsim/core/Clock.hpp"
#include "townsim/core/Config.hpp"
#include "townsim/world/World.hpp"

namespace townsim::world {

// Work limits shared by every tick of one engine step.
struct TickBudget {
    int pathfindsLeft = 0;
};

struct TickStats {
    int pathfinds     = 0;
    int arrivals      = 0;
    int collisions    = 0;
    int routeFailures = 0;
    int flaggedStuck  = 0;
};

// Advances continuous state by one tick of `dt` ending at `now`:
// activities and typing markers expire, players route and move, and agents
// whose operation outlived the stuck threshold are flagged (never retried).
void TickWorld(World& world, TimeMs now, TimeMs dt,
               const core::EngineConfig& cfg, TickBudget& budget,
               TickStats* stats = nullptr);

} // namespace townsim::world
