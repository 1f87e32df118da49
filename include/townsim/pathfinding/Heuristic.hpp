#pragma once
#include "GridTypes.hpp"
#include <algorithm>
#include <cstdlib>

namespace townsim::pf {

// Admissible for unit-cost 4-connected moves.
[[nodiscard]] inline float manhattan(IVec2 a, IVec2 b) noexcept {
    return static_cast<float>(std::abs(b.x - a.x) + std::abs(b.y - a.y));
}

// Admissible for 8-connected moves costing 1 and sqrt(2).
[[nodiscard]] inline float octile(IVec2 a, IVec2 b) noexcept {
    const int dx = std::abs(b.x - a.x);
    const int dy = std::abs(b.y - a.y);
    const int lo = std::min(dx, dy);
    const int hi = std::max(dx, dy);
    return static_cast<float>(hi - lo) + 1.41421356237f * static_cast<float>(lo);
}

[[nodiscard]] inline float heuristic(IVec2 a, IVec2 b, bool diagonals) noexcept {
    return diagonals ? octile(a, b) : manhattan(a, b);
}

} // namespace townsim::pf
