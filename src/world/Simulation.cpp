#include "townsim/world/Simulation.hpp"

#include "townsim/pathfinding/AStar.hpp"

#include <spdlog/spdlog.h>

namespace townsim::world {

namespace {

void StopMoving(Player& p)
{
    p.pathfinding.reset();
    p.speed = 0.0;
}

void TickActivities(World& world, TimeMs now)
{
    for (auto& [id, p] : world.players())
        if (p.activity && p.activity->until <= now)
            p.activity.reset();
}

void TickTyping(World& world, TimeMs now, TimeMs timeout)
{
    for (auto& [id, c] : world.conversations())
        if (!c.finished())
            c.expireTyping(now, timeout);
}

void TickPathfinding(World& world, Player& p, TimeMs now,
                     const core::EngineConfig& cfg, TickBudget& budget, TickStats& stats)
{
    if (!p.pathfinding)
        return;

    Pathfinding& path = *p.pathfinding;
    if (now - path.started > cfg.pathfindingTimeoutMs)
    {
        spdlog::debug("Player {} gave up moving to ({}, {}) after {} ms",
                      p.id.str(), path.destination.x, path.destination.y, now - path.started);
        StopMoving(p);
        return;
    }

    if (auto* w = std::get_if<WaitingAfterCollision>(&path.state); w && w->until <= now)
        path.state = NeedsPath{};

    if (!std::holds_alternative<NeedsPath>(path.state) || budget.pathfindsLeft <= 0)
        return;

    --budget.pathfindsLeft;
    ++stats.pathfinds;

    pf::AStarConfig acfg;
    acfg.allow_diagonals = cfg.diagonals;
    auto route = pf::FindPath(world.map().grid(), world.occupiedTiles(p.id),
                              ToTile(p.position), path.destination, acfg);
    if (!route)
    {
        ++stats.routeFailures;
        spdlog::debug("Player {} has no route to ({}, {})",
                      p.id.str(), path.destination.x, path.destination.y);
        StopMoving(p);
        return;
    }
    if (route->points.size() < 2)
    {
        ++stats.arrivals;
        p.position = ToVec(path.destination);
        StopMoving(p);
        return;
    }
    path.state = Moving{ std::move(route->points), 1 };
}

void TickPosition(World& world, Player& p, TimeMs now, TimeMs dt,
                  const core::EngineConfig& cfg, TickStats& stats)
{
    if (!p.pathfinding)
        return;
    auto* moving = std::get_if<Moving>(&p.pathfinding->state);
    if (!moving)
        return;

    double budget = cfg.movementSpeed * static_cast<double>(dt) / 1000.0;
    Vec2 pos = p.position;
    Vec2 facing = p.facing;
    std::size_t next = moving->next;

    while (budget > 0.0 && next < moving->waypoints.size())
    {
        const Vec2 target = ToVec(moving->waypoints[next]);
        const double d = Distance(pos, target);
        if (d > 0.0)
            facing = { (target.x - pos.x) / d, (target.y - pos.y) / d };
        if (d <= budget)
        {
            pos = target;
            budget -= d;
            ++next;
        }
        else
        {
            pos = { pos.x + facing.x * budget, pos.y + facing.y * budget };
            budget = 0.0;
        }
    }

    for (const auto& [otherId, other] : world.players())
    {
        if (otherId == p.id)
            continue;
        if (Distance(pos, other.position) < cfg.collisionThreshold)
        {
            ++stats.collisions;
            p.pathfinding->state = WaitingAfterCollision{ now + cfg.pathfindingBackoffMs };
            p.speed = 0.0;
            return;
        }
    }

    p.position = pos;
    p.facing = facing;
    if (std::string z = world.map().zoneAt(pos); !z.empty())
        p.zone = std::move(z);

    if (next >= moving->waypoints.size())
    {
        ++stats.arrivals;
        StopMoving(p);
        return;
    }
    moving->next = next;
    p.speed = cfg.movementSpeed;
}

void TickOperations(World& world, TimeMs now, TimeMs threshold, TickStats& stats)
{
    for (auto& [id, a] : world.agents())
    {
        if (!a.operation || a.operation->flaggedStuck)
            continue;
        if (now - a.operation->started <= threshold)
            continue;

        a.operation->flaggedStuck = true;
        ++stats.flaggedStuck;
        spdlog::warn("Agent {} operation {} ({}) running for {} ms, flagged as stuck",
                     id.str(), a.operation->name, a.operation->id.str(), now - a.operation->started);
        world.outbox().stuck.push_back({ {}, id, a.operation->id, a.operation->name,
                                         a.operation->started, now });
    }
}

} // namespace

void TickWorld(World& world, TimeMs now, TimeMs dt,
               const core::EngineConfig& cfg, TickBudget& budget, TickStats* stats)
{
    TickStats local;
    TickStats& s = stats ? *stats : local;

    TickActivities(world, now);
    TickTyping(world, now, cfg.typingTimeoutMs);

    for (auto& [id, p] : world.players())
        TickPathfinding(world, p, now, cfg, budget, s);
    for (auto& [id, p] : world.players())
        TickPosition(world, p, now, dt, cfg, s);

    TickOperations(world, now, cfg.stuckOperationThresholdMs, s);
}

} // namespace townsim::world
