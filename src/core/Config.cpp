#include "townsim/core/Config.hpp"

#include "townsim/core/JsonUtil.hpp"

#include <algorithm>

namespace townsim::core {

namespace {

using json = nlohmann::json;
using namespace json_util;

constexpr int kConfigSchemaVersion = 1;

template <class T>
T ClampVal(T v, T lo, T hi) noexcept
{
    return std::max(lo, std::min(v, hi));
}

void ReadEngine(EngineConfig& e, const json& j) noexcept
{
    e.tickMs            = ClampVal<TimeMs>(ObjInt64(j, "tickMs", e.tickMs), 1, 10'000);
    e.stepMs            = ClampVal<TimeMs>(ObjInt64(j, "stepMs", e.stepMs), e.tickMs, 60'000);
    e.maxTicksPerStep   = ClampVal(ObjInt(j, "maxTicksPerStep", e.maxTicksPerStep), 1, 100'000);
    e.maxInputsPerStep  = ClampVal(ObjInt(j, "maxInputsPerStep", e.maxInputsPerStep), 1, 100'000);
    e.maxPendingInputs  = ClampVal(ObjInt(j, "maxPendingInputs", e.maxPendingInputs), 1, 1'000'000);
    e.retainCompletedInputs = ClampVal(ObjInt(j, "retainCompletedInputs", e.retainCompletedInputs), 0, 10'000'000);

    e.movementSpeed       = ClampVal(ObjDouble(j, "movementSpeed", e.movementSpeed), 0.01, 100.0);
    e.collisionThreshold  = ClampVal(ObjDouble(j, "collisionThreshold", e.collisionThreshold), 0.0, 10.0);
    e.maxPathfindsPerStep = ClampVal(ObjInt(j, "maxPathfindsPerStep", e.maxPathfindsPerStep), 1, 10'000);
    e.diagonals           = ObjBool(j, "diagonals", e.diagonals);

    e.pathfindingTimeoutMs      = std::max<TimeMs>(0, ObjInt64(j, "pathfindingTimeoutMs", e.pathfindingTimeoutMs));
    e.pathfindingBackoffMs      = std::max<TimeMs>(0, ObjInt64(j, "pathfindingBackoffMs", e.pathfindingBackoffMs));
    e.typingTimeoutMs           = std::max<TimeMs>(0, ObjInt64(j, "typingTimeoutMs", e.typingTimeoutMs));
    e.stuckOperationThresholdMs = std::max<TimeMs>(1, ObjInt64(j, "stuckOperationThresholdMs", e.stuckOperationThresholdMs));
}

void ReadRecovery(RecoveryConfig& r, const json& j) noexcept
{
    r.stuckInputThresholdMs    = std::max<TimeMs>(1, ObjInt64(j, "stuckInputThresholdMs", r.stuckInputThresholdMs));
    r.humanIdleTimeoutMs       = std::max<TimeMs>(1, ObjInt64(j, "humanIdleTimeoutMs", r.humanIdleTimeoutMs));
    r.inputSweepIntervalMs     = std::max<TimeMs>(1, ObjInt64(j, "inputSweepIntervalMs", r.inputSweepIntervalMs));
    r.operationSweepIntervalMs = std::max<TimeMs>(1, ObjInt64(j, "operationSweepIntervalMs", r.operationSweepIntervalMs));
    r.orphanSweepIntervalMs    = std::max<TimeMs>(1, ObjInt64(j, "orphanSweepIntervalMs", r.orphanSweepIntervalMs));
    r.healthIntervalMs         = std::max<TimeMs>(1, ObjInt64(j, "healthIntervalMs", r.healthIntervalMs));

    if (const json* o = ObjFind(j, "stuckInputOverrides"); o && o->is_object())
    {
        for (auto it = o->begin(); it != o->end(); ++it)
        {
            const TimeMs v = SafeInt64(it.value(), -1);
            if (v > 0)
                r.stuckInputOverrides[it.key()] = v;
        }
    }
}

void ReadChannels(ChannelConfig& c, const json& j) noexcept
{
    c.defaultMaxBots      = ClampVal(ObjInt(j, "defaultMaxBots", c.defaultMaxBots), 1, 100'000);
    c.nearCapacityPercent = ClampVal(ObjDouble(j, "nearCapacityPercent", c.nearCapacityPercent), 1.0, 100.0);
    c.chronicEmptyAfterMs = std::max<TimeMs>(0, ObjInt64(j, "chronicEmptyAfterMs", c.chronicEmptyAfterMs));

    if (const json* o = ObjFind(j, "perZoneMaxBots"); o && o->is_object())
    {
        for (auto it = o->begin(); it != o->end(); ++it)
        {
            const int v = static_cast<int>(SafeInt64(it.value(), 0));
            if (v > 0)
                c.perZoneMaxBots[it.key()] = v;
        }
    }
}

void ReadDriver(DriverConfig& d, const json& j) noexcept
{
    d.enabled                 = ObjBool(j, "enabled", d.enabled);
    d.seed                    = static_cast<std::uint64_t>(ObjInt64(j, "seed", static_cast<std::int64_t>(d.seed)));
    d.maxConversationMessages = ClampVal(ObjInt(j, "maxConversationMessages", d.maxConversationMessages), 1, 1000);
    d.inviteProbability       = ClampVal(ObjDouble(j, "inviteProbability", d.inviteProbability), 0.0, 1.0);
    d.acceptProbability       = ClampVal(ObjDouble(j, "acceptProbability", d.acceptProbability), 0.0, 1.0);
    d.activityDurationMs      = ClampVal<TimeMs>(ObjInt64(j, "activityDurationMs", d.activityDurationMs), 0, kMaxActivityMs);
    d.messageCooldownMs       = std::max<TimeMs>(0, ObjInt64(j, "messageCooldownMs", d.messageCooldownMs));

    d.inviteTimeoutMs              = std::max<TimeMs>(1, ObjInt64(j, "inviteTimeoutMs", d.inviteTimeoutMs));
    d.awkwardTimeoutMs             = std::max<TimeMs>(0, ObjInt64(j, "awkwardTimeoutMs", d.awkwardTimeoutMs));
    d.maxConversationDurationMs    = std::max<TimeMs>(1, ObjInt64(j, "maxConversationDurationMs", d.maxConversationDurationMs));
    d.conversationCooldownMs       = std::max<TimeMs>(0, ObjInt64(j, "conversationCooldownMs", d.conversationCooldownMs));
    d.playerConversationCooldownMs = std::max<TimeMs>(0, ObjInt64(j, "playerConversationCooldownMs", d.playerConversationCooldownMs));
}

void ReadLog(LogConfig& l, const json& j) noexcept
{
    l.level    = ObjString(j, "level", l.level);
    l.file     = ObjString(j, "file", l.file);
    l.maxBytes = static_cast<std::size_t>(std::max<std::int64_t>(1024, ObjInt64(j, "maxBytes", static_cast<std::int64_t>(l.maxBytes))));
    l.maxFiles = static_cast<std::size_t>(ClampVal<std::int64_t>(ObjInt64(j, "maxFiles", static_cast<std::int64_t>(l.maxFiles)), 1, 100));
    l.async    = ObjBool(j, "async", l.async);
    l.console  = ObjBool(j, "console", l.console);
}

} // namespace

void ApplyConfigJson(ServerConfig& cfg, const json& j) noexcept
{
    if (!j.is_object())
        return;

    if (const json* s = ObjFind(j, "engine"))   ReadEngine(cfg.engine, *s);
    if (const json* s = ObjFind(j, "recovery")) ReadRecovery(cfg.recovery, *s);
    if (const json* s = ObjFind(j, "channels")) ReadChannels(cfg.channels, *s);
    if (const json* s = ObjFind(j, "driver"))   ReadDriver(cfg.driver, *s);
    if (const json* s = ObjFind(j, "log"))      ReadLog(cfg.log, *s);

    if (const json* s = ObjFind(j, "data"))
    {
        cfg.data.directory          = ObjString(*s, "directory", cfg.data.directory);
        cfg.data.snapshotIntervalMs = std::max<TimeMs>(0, ObjInt64(*s, "snapshotIntervalMs", cfg.data.snapshotIntervalMs));
    }

    if (const json* s = ObjFind(j, "worlds"); s && s->is_array())
    {
        std::vector<std::string> worlds;
        for (const auto& w : *s)
            if (w.is_string() && !w.get<std::string>().empty())
                worlds.push_back(w.get<std::string>());
        if (!worlds.empty())
            cfg.worlds = std::move(worlds);
    }

    if (const json* s = ObjFind(j, "map"))
    {
        cfg.mapFile   = ObjString(*s, "file", cfg.mapFile);
        cfg.mapWidth  = ClampVal(ObjInt(*s, "width", cfg.mapWidth), 1, 4096);
        cfg.mapHeight = ClampVal(ObjInt(*s, "height", cfg.mapHeight), 1, 4096);
    }
}

json ConfigToJson(const ServerConfig& cfg)
{
    json j;
    j["version"] = kConfigSchemaVersion;

    const auto& e = cfg.engine;
    j["engine"] = {
        {"tickMs", e.tickMs},
        {"stepMs", e.stepMs},
        {"maxTicksPerStep", e.maxTicksPerStep},
        {"maxInputsPerStep", e.maxInputsPerStep},
        {"maxPendingInputs", e.maxPendingInputs},
        {"retainCompletedInputs", e.retainCompletedInputs},
        {"movementSpeed", e.movementSpeed},
        {"collisionThreshold", e.collisionThreshold},
        {"maxPathfindsPerStep", e.maxPathfindsPerStep},
        {"diagonals", e.diagonals},
        {"pathfindingTimeoutMs", e.pathfindingTimeoutMs},
        {"pathfindingBackoffMs", e.pathfindingBackoffMs},
        {"typingTimeoutMs", e.typingTimeoutMs},
        {"stuckOperationThresholdMs", e.stuckOperationThresholdMs},
    };

    const auto& r = cfg.recovery;
    j["recovery"] = {
        {"stuckInputThresholdMs", r.stuckInputThresholdMs},
        {"stuckInputOverrides", r.stuckInputOverrides},
        {"humanIdleTimeoutMs", r.humanIdleTimeoutMs},
        {"inputSweepIntervalMs", r.inputSweepIntervalMs},
        {"operationSweepIntervalMs", r.operationSweepIntervalMs},
        {"orphanSweepIntervalMs", r.orphanSweepIntervalMs},
        {"healthIntervalMs", r.healthIntervalMs},
    };

    j["channels"] = {
        {"defaultMaxBots", cfg.channels.defaultMaxBots},
        {"perZoneMaxBots", cfg.channels.perZoneMaxBots},
        {"nearCapacityPercent", cfg.channels.nearCapacityPercent},
        {"chronicEmptyAfterMs", cfg.channels.chronicEmptyAfterMs},
    };

    j["data"] = {
        {"directory", cfg.data.directory},
        {"snapshotIntervalMs", cfg.data.snapshotIntervalMs},
    };

    const auto& d = cfg.driver;
    j["driver"] = {
        {"enabled", d.enabled},
        {"seed", d.seed},
        {"maxConversationMessages", d.maxConversationMessages},
        {"inviteProbability", d.inviteProbability},
        {"acceptProbability", d.acceptProbability},
        {"activityDurationMs", d.activityDurationMs},
        {"messageCooldownMs", d.messageCooldownMs},
        {"inviteTimeoutMs", d.inviteTimeoutMs},
        {"awkwardTimeoutMs", d.awkwardTimeoutMs},
        {"maxConversationDurationMs", d.maxConversationDurationMs},
        {"conversationCooldownMs", d.conversationCooldownMs},
        {"playerConversationCooldownMs", d.playerConversationCooldownMs},
    };

    j["log"] = {
        {"level", cfg.log.level},
        {"file", cfg.log.file},
        {"maxBytes", cfg.log.maxBytes},
        {"maxFiles", cfg.log.maxFiles},
        {"async", cfg.log.async},
        {"console", cfg.log.console},
    };

    j["worlds"] = cfg.worlds;
    j["map"] = { {"file", cfg.mapFile}, {"width", cfg.mapWidth}, {"height", cfg.mapHeight} };
    return j;
}

bool LoadConfig(ServerConfig& cfg, const std::filesystem::path& path, std::string* outError) noexcept
{
    json j;
    if (!ParseJsonFile(path, j, outError))
        return false;

    if (!j.is_object())
    {
        if (outError)
            *outError = "Config root must be an object";
        return false;
    }

    ApplyConfigJson(cfg, j);
    return true;
}

bool SaveConfig(const ServerConfig& cfg, const std::filesystem::path& path, std::string* outError) noexcept
{
    try
    {
        return WriteFileAtomic(path, ConfigToJson(cfg).dump(2), outError);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }
}

} // namespace townsim::core
