#pragma once
#include "GridTypes.hpp"
#include <algorithm>
#include <cstddef>
#include <vector>

namespace townsim::pf {

// Tiles from start to goal, both included.
struct Path {
    std::vector<IVec2> points;
    float cost = 0.0f;

    [[nodiscard]] bool empty() const noexcept { return points.empty(); }
    [[nodiscard]] std::size_t length() const noexcept { return points.size(); }

    [[nodiscard]] bool contiguous(bool diagonals) const noexcept {
        for (std::size_t i = 1; i < points.size(); ++i)
            if (!adjacent(points[i - 1], points[i], diagonals))
                return false;
        return true;
    }
};

enum class NodeState : u8 { Unseen, Open, Closed };

// Per-tile bookkeeping for one search.
struct SearchNode {
    float g = 0.0f;
    float f = 0.0f;
    NodeId parent = kInvalid;
    NodeState state = NodeState::Unseen;
};

// Walks parent links back from goal.
inline Path reconstruct(const std::vector<SearchNode>& nodes, const Bounds& b, NodeId goal) {
    Path out;
    out.cost = nodes[goal].g;
    for (NodeId cur = goal; cur != kInvalid; cur = nodes[cur].parent)
        out.points.push_back(b.tile(cur));
    std::reverse(out.points.begin(), out.points.end());
    return out;
}

} // namespace townsim::pf
