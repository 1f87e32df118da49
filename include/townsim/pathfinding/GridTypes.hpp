#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

namespace townsim::pf {

using u8  = std::uint8_t;
using u32 = std::uint32_t;

// Integer tile coordinate.
struct IVec2 {
    int x{}, y{};
    constexpr bool operator==(const IVec2&) const = default;
};

using NodeId = u32; // row-major tile index
constexpr NodeId kInvalid = std::numeric_limits<NodeId>::max();

struct Bounds {
    int w{}, h{};

    [[nodiscard]] constexpr bool contains(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < w && y < h;
    }
    [[nodiscard]] constexpr bool contains(IVec2 p) const noexcept { return contains(p.x, p.y); }

    [[nodiscard]] constexpr std::size_t area() const noexcept {
        return static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
    }

    [[nodiscard]] constexpr NodeId index(int x, int y) const noexcept {
        return static_cast<NodeId>(y * w + x);
    }
    [[nodiscard]] constexpr NodeId index(IVec2 p) const noexcept { return index(p.x, p.y); }

    [[nodiscard]] constexpr IVec2 tile(NodeId id) const noexcept {
        return { static_cast<int>(id % static_cast<u32>(w)), static_cast<int>(id / static_cast<u32>(w)) };
    }
};

// One step apart on a 4-connected grid, or on an 8-connected one when diagonals is set.
[[nodiscard]] constexpr bool adjacent(IVec2 a, IVec2 b, bool diagonals) noexcept {
    const int dx = a.x > b.x ? a.x - b.x : b.x - a.x;
    const int dy = a.y > b.y ? a.y - b.y : b.y - a.y;
    if (dx > 1 || dy > 1 || dx + dy == 0)
        return false;
    return diagonals || dx + dy == 1;
}

} // namespace townsim::pf
