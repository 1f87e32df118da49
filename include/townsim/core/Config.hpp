#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"
#include "townsim/core/Log.hpp"

namespace townsim::core {

struct EngineConfig {
    TimeMs tickMs            = 16;
    TimeMs stepMs            = 1000;
    int    maxTicksPerStep   = 600;
    int    maxInputsPerStep  = 32;
    int    maxPendingInputs  = 1000;
    int    retainCompletedInputs = 10'000;

    double movementSpeed       = 0.75;  // tiles per second
    double collisionThreshold  = 0.75;  // tiles
    int    maxPathfindsPerStep = 16;
    bool   diagonals           = false; // 4-connected like the town maps

    TimeMs pathfindingTimeoutMs = 60'000;
    TimeMs pathfindingBackoffMs = 1'000;
    TimeMs typingTimeoutMs      = 15'000;

    // Agents holding an operation longer than this are flagged for recovery.
    TimeMs stuckOperationThresholdMs = 120'000;
};

struct RecoveryConfig {
    TimeMs stuckInputThresholdMs = 10 * 60'000;
    // Per-command thresholds for commands that are expected to wait longer.
    std::map<std::string, TimeMs> stuckInputOverrides;
    // Human-controlled players with no input for this long are made to leave.
    TimeMs humanIdleTimeoutMs = 5 * 60'000;

    TimeMs inputSweepIntervalMs     = 60 * 60'000;
    TimeMs operationSweepIntervalMs = 60'000;
    TimeMs orphanSweepIntervalMs    = 24 * 60 * 60'000;
    TimeMs healthIntervalMs         = 5 * 60'000;
};

struct ChannelConfig {
    int    defaultMaxBots       = 30;
    std::map<std::string, int> perZoneMaxBots;
    double nearCapacityPercent  = 90.0;
    TimeMs chronicEmptyAfterMs  = 60 * 60'000;
};

struct DataConfig {
    std::string directory      = "data";
    TimeMs      snapshotIntervalMs = 60'000;
};

struct DriverConfig {
    bool          enabled                 = false;
    std::uint64_t seed                    = 1;
    int           maxConversationMessages = 8;
    double        inviteProbability       = 0.3;
    double        acceptProbability       = 0.8;
    TimeMs        activityDurationMs      = 60'000;
    TimeMs        messageCooldownMs       = 2'000;

    // Conversation pacing.
    TimeMs inviteTimeoutMs              = 60'000;      // unanswered invite is withdrawn
    TimeMs awkwardTimeoutMs             = 60'000;      // silence before speaking or leaving
    TimeMs maxConversationDurationMs    = 10 * 60'000;
    TimeMs conversationCooldownMs       = 15'000;      // after any conversation or invite
    TimeMs playerConversationCooldownMs = 60'000;      // before re-inviting the same partner
};

struct ServerConfig {
    EngineConfig   engine;
    RecoveryConfig recovery;
    ChannelConfig  channels;
    DataConfig     data;
    DriverConfig   driver;
    LogConfig      log;

    std::vector<std::string> worlds{ "default" };
    std::string              mapFile;         // empty = built-in open map
    int                      mapWidth  = 48;
    int                      mapHeight = 32;
};

// Loads `path` over the defaults already in `cfg`. Unknown keys are ignored,
// mistyped values keep their previous value. Returns false if the file is
// missing or not valid JSON.
[[nodiscard]] bool LoadConfig(ServerConfig& cfg,
                              const std::filesystem::path& path,
                              std::string* outError = nullptr) noexcept;

[[nodiscard]] bool SaveConfig(const ServerConfig& cfg,
                              const std::filesystem::path& path,
                              std::string* outError = nullptr) noexcept;

// Same as LoadConfig but from an in-memory document.
void ApplyConfigJson(ServerConfig& cfg, const nlohmann::json& j) noexcept;
[[nodiscard]] nlohmann::json ConfigToJson(const ServerConfig& cfg);

} // namespace townsim::core
