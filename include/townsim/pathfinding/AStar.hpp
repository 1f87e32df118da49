#pragma once
#include "GridMap.hpp"
#include "Heuristic.hpp"
#include "Path.hpp"
#include <array>
#include <optional>
#include <queue>
#include <vector>

namespace townsim::pf {

struct AStarConfig {
    bool allow_diagonals = false; // 8-dir forbids corner cutting
};

class AStar {
public:
    explicit AStar(const BlockedView& view, AStarConfig cfg = {}) : _v(view), _cfg(cfg) {}

    // nullopt when start or goal is blocked or out of bounds, or the goal is
    // unreachable. Never a partial route.
    std::optional<Path> find_path(IVec2 start, IVec2 goal) {
        if (!_v.passable(start) || !_v.passable(goal)) return std::nullopt;

        const Bounds& b = _v.bounds();
        const NodeId sid = b.index(start);
        const NodeId gid = b.index(goal);

        _nodes.assign(b.area(), SearchNode{});

        // Equal f is broken by insertion order so the route is reproducible.
        struct Entry {
            float f; u32 seq; NodeId id;
            bool operator<(const Entry& o) const { return f != o.f ? f > o.f : seq > o.seq; }
        };
        std::priority_queue<Entry> open;
        u32 seq = 0;

        _nodes[sid].f = heuristic(start, goal, _cfg.allow_diagonals);
        _nodes[sid].state = NodeState::Open;
        open.push({ _nodes[sid].f, seq++, sid });

        static constexpr std::array<IVec2, 8> kSteps{ {
            {1,0}, {-1,0}, {0,1}, {0,-1}, {1,1}, {1,-1}, {-1,1}, {-1,-1}
        } };
        const int steps = _cfg.allow_diagonals ? 8 : 4;

        while (!open.empty()) {
            const NodeId cur = open.top().id;
            open.pop();
            SearchNode& node = _nodes[cur];
            if (node.state == NodeState::Closed) continue; // stale entry
            node.state = NodeState::Closed;
            if (cur == gid) return reconstruct(_nodes, b, gid);

            const IVec2 at = b.tile(cur);
            for (int i = 0; i < steps; ++i) {
                const IVec2 d = kSteps[static_cast<std::size_t>(i)];
                if (!_v.can_step(at, d.x, d.y)) continue;

                const IVec2 next{ at.x + d.x, at.y + d.y };
                SearchNode& n = _nodes[b.index(next)];
                if (n.state == NodeState::Closed) continue;

                const float g = node.g + BlockedView::step_cost(d.x, d.y);
                if (n.state == NodeState::Open && g >= n.g) continue;

                n.g = g;
                n.f = g + heuristic(next, goal, _cfg.allow_diagonals);
                n.parent = cur;
                n.state = NodeState::Open;
                open.push({ n.f, seq++, b.index(next) });
            }
        }
        return std::nullopt;
    }

private:
    const BlockedView& _v;
    AStarConfig _cfg;
    std::vector<SearchNode> _nodes;
};

// Pure entry point: grid + per-query blocked tiles + endpoints -> route or NO_PATH.
inline std::optional<Path> FindPath(const GridMap& grid,
                                    const std::vector<IVec2>& blocked,
                                    IVec2 start, IVec2 goal,
                                    AStarConfig cfg = {})
{
    if (grid.width() <= 0 || grid.height() <= 0) return std::nullopt;
    BlockedView view(grid, blocked);
    AStar astar(view, cfg);
    return astar.find_path(start, goal);
}

} // namespace townsim::pf
