#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"

namespace townsim::channels {

using core::TimeMs;

enum class ChannelType : std::uint8_t {
    General,
    Regional,
    Event,
    Restricted,
    Test,
};

enum class ChannelStatus : std::uint8_t {
    Active,      // accepting, below capacity
    Full,        // at capacity
    Draining,    // being retired: refuses new occupants
    Maintenance, // operator hold: refuses new occupants
};

[[nodiscard]] const char* ChannelTypeName(ChannelType t) noexcept;
[[nodiscard]] std::optional<ChannelType> ChannelTypeFromName(const std::string& s) noexcept;
[[nodiscard]] const char* ChannelStatusName(ChannelStatus s) noexcept;
[[nodiscard]] std::optional<ChannelStatus> ChannelStatusFromName(const std::string& s) noexcept;

// A capacity-bounded shard of one zone, bound to one world.
struct Channel {
    std::string   id;
    std::string   name;
    std::string   zone;
    ChannelType   type = ChannelType::General;
    ChannelStatus status = ChannelStatus::Active;
    int           currentBots = 0;
    int           maxBots = 30;
    std::string   worldId;

    std::string           region;
    bool                  isDefault = false;
    std::optional<TimeMs> overCapacityUntil;   // grace window for currentBots > maxBots
    bool                  needsWorldReassignment = false;
    std::optional<TimeMs> emptySince;
    TimeMs                createdAt = 0;
    std::int64_t          seq = 0;             // creation order

    [[nodiscard]] double loadPercent() const noexcept
    {
        return maxBots > 0 ? 100.0 * currentBots / maxBots : 100.0;
    }
    [[nodiscard]] bool acceptsNew() const noexcept
    {
        return status == ChannelStatus::Active && !needsWorldReassignment && currentBots < maxBots;
    }
};

[[nodiscard]] nlohmann::json ChannelToJson(const Channel& c);
// Throws nlohmann::json::exception on missing required fields.
[[nodiscard]] Channel ChannelFromJson(const nlohmann::json& j);

} // namespace townsim::channels
