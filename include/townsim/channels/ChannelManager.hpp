#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "townsim/channels/Channel.hpp"
#include "townsim/channels/WorldProvider.hpp"
#include "townsim/core/Clock.hpp"
#include "townsim/core/Config.hpp"

namespace townsim::channels {

struct Allocation {
    std::string instanceId;
    std::string worldId;
    bool        created = false;
};

struct ChannelHealth {
    std::string              id;
    std::string              name;
    std::string              zone;
    ChannelStatus            status = ChannelStatus::Active;
    int                      currentBots = 0;
    int                      maxBots = 0;
    double                   loadPercent = 0.0;
    bool                     worldAlive = true;
    std::vector<std::string> recommendations;
};

struct HealthReport {
    std::vector<ChannelHealth> channels;
    int                        totalBots = 0;
    int                        totalCapacity = 0;
    double                     overallLoadPercent = 0.0;
    std::vector<std::string>   recommendations;   // system-wide
};

[[nodiscard]] nlohmann::json HealthReportToJson(const HealthReport& r);

struct BalanceSuggestion {
    std::string fromId;
    std::string toId;
    int         count = 0;
};

// Places occupants into capacity-bounded channels and keeps their status in
// step with their load. All methods are thread-safe.
class ChannelManager {
public:
    ChannelManager(const core::ChannelConfig& cfg, WorldProvider& worlds, const core::IClock& clock);

    // Least-loaded accepting channel of `zone`, or a new one when all are
    // full. Throws core::AllocationError if a new channel can't get a world.
    Allocation findOrCreateInstance(const std::string& zone);

    // Throws core::ValidationError for unknown ids.
    void releaseSlot(const std::string& instanceId);

    Channel createChannel(const std::string& zone,
                          ChannelType type = ChannelType::General,
                          std::optional<int> maxBots = std::nullopt,
                          std::optional<std::string> name = std::nullopt,
                          std::string region = {});

    // Active/Draining/Maintenance; Full is derived from load and can't be set.
    void setStatus(const std::string& instanceId, ChannelStatus status);

    // Explicit placement. Throws core::CapacityExceeded when the channel is at
    // capacity outside its grace window.
    Allocation assignToChannel(const std::string& instanceId);
    void grantOverCapacity(const std::string& instanceId, TimeMs until);

    void markNeedsWorldReassignment(const std::string& instanceId, const std::string& reason);
    // Binds a new world (from the provider when `worldId` is empty).
    void reassignWorld(const std::string& instanceId, const std::string& worldId = {});

    // Flags channels whose world fails the liveness check. Returns newly flagged ids.
    std::vector<std::string> flagDeadWorlds();

    [[nodiscard]] std::vector<BalanceSuggestion> balanceSuggestions() const;
    [[nodiscard]] HealthReport healthReport(TimeMs now) const;

    [[nodiscard]] std::vector<Channel> channels() const;
    [[nodiscard]] std::optional<Channel> find(const std::string& instanceId) const;

    [[nodiscard]] nlohmann::json toJson() const;
    // Replaces the current table. Throws on malformed input.
    void loadJson(const nlohmann::json& j);

    [[nodiscard]] bool save(const std::filesystem::path& path, std::string* outError = nullptr) const noexcept;
    [[nodiscard]] bool load(const std::filesystem::path& path, std::string* outError = nullptr) noexcept;

private:
    Channel& getLocked(const std::string& instanceId);
    Channel& createLocked(const std::string& zone, ChannelType type, std::optional<int> maxBots,
                          std::optional<std::string> name, std::string region);
    void refreshStatus(Channel& c, TimeMs now);
    [[nodiscard]] std::string nextShardName(const std::string& zone) const;
    [[nodiscard]] int capacityFor(const std::string& zone) const;

    core::ChannelConfig  m_cfg;
    WorldProvider&       m_worlds;
    const core::IClock&  m_clock;

    mutable std::mutex              m_mutex;
    std::map<std::string, Channel>  m_channels;
    std::int64_t                    m_nextSeq = 1;
};

} // namespace townsim::channels
