#pragma once
#include "GridTypes.hpp"
#include <vector>

namespace townsim::pf {

// Static walkability grid. 0 = blocked, 1 = free.
// Dynamic obstacles (other players) are passed to the search separately.
class GridMap {
public:
    GridMap() = default;
    GridMap(int w, int h) : _b{w, h}, _walkable(_b.area(), 1) {}

    [[nodiscard]] const Bounds& bounds() const noexcept { return _b; }
    [[nodiscard]] int width()  const noexcept { return _b.w; }
    [[nodiscard]] int height() const noexcept { return _b.h; }

    void set_walkable(int x, int y, u8 v) { _walkable[_b.index(x, y)] = v; }

    [[nodiscard]] bool passable(int x, int y) const {
        return _b.contains(x, y) && _walkable[_b.index(x, y)] != 0;
    }

    [[nodiscard]] const std::vector<u8>& cells() const noexcept { return _walkable; }

private:
    Bounds _b{};
    std::vector<u8> _walkable;
};

// Static grid with some extra tiles closed for a single query.
class BlockedView {
public:
    BlockedView(const GridMap& map, const std::vector<IVec2>& blocked)
        : _b(map.bounds()), _open(map.cells())
    {
        for (const IVec2& t : blocked)
            if (_b.contains(t))
                _open[_b.index(t)] = 0;
    }

    [[nodiscard]] const Bounds& bounds() const noexcept { return _b; }

    [[nodiscard]] bool passable(IVec2 t) const {
        return _b.contains(t) && _open[_b.index(t)] != 0;
    }

    // A diagonal move needs both orthogonal neighbours open.
    [[nodiscard]] bool can_step(IVec2 from, int dx, int dy) const {
        if (!passable({from.x + dx, from.y + dy}))
            return false;
        if (dx != 0 && dy != 0)
            return passable({from.x + dx, from.y}) && passable({from.x, from.y + dy});
        return true;
    }

    [[nodiscard]] static float step_cost(int dx, int dy) noexcept {
        return (dx == 0 || dy == 0) ? 1.0f : 1.41421356237f;
    }

private:
    Bounds _b;
    std::vector<u8> _open;
};

} // namespace townsim::pf
