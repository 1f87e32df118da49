#include "townsim/channels/ChannelManager.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace townsim::channels {

using json = nlohmann::json;
using core::TimeMs;

namespace {

constexpr double kOverloadedPercent  = 80.0;
constexpr double kUnderloadedPercent = 50.0;
constexpr double kTargetPercent      = 70.0;
constexpr double kImbalancePoints    = 40.0;

} // namespace

json HealthReportToJson(const HealthReport& r)
{
    json channels = json::array();
    for (const ChannelHealth& h : r.channels)
        channels.push_back({
            {"id", h.id},
            {"name", h.name},
            {"zone", h.zone},
            {"status", ChannelStatusName(h.status)},
            {"currentBots", h.currentBots},
            {"maxBots", h.maxBots},
            {"loadPercent", h.loadPercent},
            {"worldAlive", h.worldAlive},
            {"recommendations", h.recommendations},
        });

    return {
        {"channels", std::move(channels)},
        {"totalBots", r.totalBots},
        {"totalCapacity", r.totalCapacity},
        {"overallLoadPercent", r.overallLoadPercent},
        {"recommendations", r.recommendations},
    };
}

ChannelManager::ChannelManager(const core::ChannelConfig& cfg, WorldProvider& worlds, const core::IClock& clock)
    : m_cfg(cfg)
    , m_worlds(worlds)
    , m_clock(clock)
{
}

int ChannelManager::capacityFor(const std::string& zone) const
{
    auto it = m_cfg.perZoneMaxBots.find(zone);
    return it != m_cfg.perZoneMaxBots.end() ? it->second : m_cfg.defaultMaxBots;
}

std::string ChannelManager::nextShardName(const std::string& zone) const
{
    std::set<std::string> taken;
    for (const auto& [id, c] : m_channels)
        taken.insert(c.name);

    if (!taken.count(zone))
        return zone;
    for (int n = 2;; ++n)
    {
        std::string name = zone + "-shard-" + std::to_string(n);
        if (!taken.count(name))
            return name;
    }
}

Channel& ChannelManager::getLocked(const std::string& instanceId)
{
    auto it = m_channels.find(instanceId);
    if (it == m_channels.end())
        throw core::ValidationError("Unknown instance '" + instanceId + "'");
    return it->second;
}

// Keeps Active/Full in line with the load; operator states are left alone.
void ChannelManager::refreshStatus(Channel& c, TimeMs now)
{
    if (c.status == ChannelStatus::Active || c.status == ChannelStatus::Full)
        c.status = c.currentBots >= c.maxBots ? ChannelStatus::Full : ChannelStatus::Active;

    if (c.currentBots == 0)
    {
        if (!c.emptySince)
            c.emptySince = now;
    }
    else
    {
        c.emptySince.reset();
    }
}

Channel& ChannelManager::createLocked(const std::string& zone, ChannelType type, std::optional<int> maxBots,
                                      std::optional<std::string> name, std::string region)
{
    if (zone.empty())
        throw core::ValidationError("Zone must not be empty");
    if (maxBots && *maxBots <= 0)
        throw core::ValidationError("maxBots must be positive");

    const std::string channelName = name ? *name : nextShardName(zone);
    for (const auto& [id, c] : m_channels)
        if (c.name == channelName)
            throw core::ValidationError("Channel name '" + channelName + "' is taken");

    std::string worldId;
    try
    {
        worldId = m_worlds.provideWorld(zone, channelName);
    }
    catch (const core::AllocationError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw core::AllocationError("No world for channel '" + channelName + "': " + e.what());
    }
    if (worldId.empty())
        throw core::AllocationError("No world for channel '" + channelName + "'");

    const TimeMs now = m_clock.now();
    Channel c;
    c.seq       = m_nextSeq++;
    c.id        = "ch:" + std::to_string(c.seq);
    c.name      = channelName;
    c.zone      = zone;
    c.type      = type;
    c.maxBots   = maxBots ? *maxBots : capacityFor(zone);
    c.worldId   = std::move(worldId);
    c.region    = std::move(region);
    c.createdAt = now;
    c.isDefault = std::none_of(m_channels.begin(), m_channels.end(),
                               [&](const auto& kv) { return kv.second.zone == zone; });
    refreshStatus(c, now);

    spdlog::info("Created channel {} '{}' for zone '{}' (max {}) on world {}",
                 c.id, c.name, c.zone, c.maxBots, c.worldId);
    auto it = m_channels.emplace(c.id, std::move(c)).first;
    return it->second;
}

Channel ChannelManager::createChannel(const std::string& zone, ChannelType type, std::optional<int> maxBots,
                                      std::optional<std::string> name, std::string region)
{
    std::lock_guard lock(m_mutex);
    return createLocked(zone, type, maxBots, std::move(name), std::move(region));
}

Allocation ChannelManager::findOrCreateInstance(const std::string& zone)
{
    std::lock_guard lock(m_mutex);
    const TimeMs now = m_clock.now();

    Channel* best = nullptr;
    for (auto& [id, c] : m_channels)
    {
        if (c.zone != zone || !c.acceptsNew())
            continue;
        if (!best)
        {
            best = &c;
            continue;
        }
        const double lc = double(c.currentBots) / c.maxBots;
        const double lb = double(best->currentBots) / best->maxBots;
        if (lc < lb ||
            (lc == lb && c.currentBots < best->currentBots) ||
            (lc == lb && c.currentBots == best->currentBots && c.seq < best->seq))
            best = &c;
    }

    bool created = false;
    if (!best)
    {
        best = &createLocked(zone, ChannelType::General, std::nullopt, std::nullopt, {});
        created = true;
    }

    ++best->currentBots;
    refreshStatus(*best, now);
    if (best->status == ChannelStatus::Full)
        spdlog::info("Channel {} '{}' is now full ({}/{})", best->id, best->name, best->currentBots, best->maxBots);

    return { best->id, best->worldId, created };
}

void ChannelManager::releaseSlot(const std::string& instanceId)
{
    std::lock_guard lock(m_mutex);
    Channel& c = getLocked(instanceId);
    if (c.currentBots > 0)
        --c.currentBots;
    else
        spdlog::warn("Release on empty channel {}", instanceId);
    refreshStatus(c, m_clock.now());
}

void ChannelManager::setStatus(const std::string& instanceId, ChannelStatus status)
{
    if (status == ChannelStatus::Full)
        throw core::ValidationError("FULL is derived from load and can't be set");

    std::lock_guard lock(m_mutex);
    Channel& c = getLocked(instanceId);
    const ChannelStatus before = c.status;
    c.status = status;
    refreshStatus(c, m_clock.now());
    if (before != c.status)
        spdlog::info("Channel {} status {} -> {}", instanceId, ChannelStatusName(before), ChannelStatusName(c.status));
}

Allocation ChannelManager::assignToChannel(const std::string& instanceId)
{
    std::lock_guard lock(m_mutex);
    const TimeMs now = m_clock.now();
    Channel& c = getLocked(instanceId);

    if (c.status == ChannelStatus::Draining || c.status == ChannelStatus::Maintenance)
        throw core::ValidationError("Channel " + instanceId + " is " + ChannelStatusName(c.status));
    if (c.needsWorldReassignment)
        throw core::ValidationError("Channel " + instanceId + " has no live world");

    if (c.currentBots >= c.maxBots)
    {
        const bool inGrace = c.overCapacityUntil && now < *c.overCapacityUntil;
        if (!inGrace)
            throw core::CapacityExceeded("Channel " + c.name + " is at capacity (" +
                                         std::to_string(c.currentBots) + "/" + std::to_string(c.maxBots) + ")");
    }

    ++c.currentBots;
    refreshStatus(c, now);
    return { c.id, c.worldId, false };
}

void ChannelManager::grantOverCapacity(const std::string& instanceId, TimeMs until)
{
    std::lock_guard lock(m_mutex);
    Channel& c = getLocked(instanceId);
    c.overCapacityUntil = until;
    spdlog::info("Channel {} may exceed capacity until {}", instanceId, until);
}

void ChannelManager::markNeedsWorldReassignment(const std::string& instanceId, const std::string& reason)
{
    std::lock_guard lock(m_mutex);
    Channel& c = getLocked(instanceId);
    if (c.needsWorldReassignment)
        return;
    c.needsWorldReassignment = true;
    spdlog::warn("Channel {} '{}' needs world reassignment: {}", c.id, c.name, reason);
}

void ChannelManager::reassignWorld(const std::string& instanceId, const std::string& worldId)
{
    std::lock_guard lock(m_mutex);
    Channel& c = getLocked(instanceId);

    std::string target = worldId;
    if (target.empty())
    {
        try
        {
            target = m_worlds.provideWorld(c.zone, c.name);
        }
        catch (const core::AllocationError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw core::AllocationError("No world for channel '" + c.name + "': " + e.what());
        }
    }
    else if (!m_worlds.isAlive(target))
    {
        throw core::ValidationError("World '" + target + "' is not alive");
    }

    spdlog::info("Channel {} rebound from world {} to {}", c.id, c.worldId, target);
    c.worldId = std::move(target);
    c.needsWorldReassignment = false;
}

std::vector<std::string> ChannelManager::flagDeadWorlds()
{
    std::lock_guard lock(m_mutex);
    std::vector<std::string> flagged;
    for (auto& [id, c] : m_channels)
    {
        if (c.needsWorldReassignment || m_worlds.isAlive(c.worldId))
            continue;
        c.needsWorldReassignment = true;
        spdlog::warn("Channel {} '{}' references dead world '{}', needs reassignment", c.id, c.name, c.worldId);
        flagged.push_back(id);
    }
    return flagged;
}

std::vector<BalanceSuggestion> ChannelManager::balanceSuggestions() const
{
    std::lock_guard lock(m_mutex);

    std::map<std::string, std::vector<const Channel*>> byZone;
    for (const auto& [id, c] : m_channels)
        if (c.status == ChannelStatus::Active || c.status == ChannelStatus::Full)
            byZone[c.zone].push_back(&c);

    std::vector<BalanceSuggestion> out;
    for (auto& [zone, list] : byZone)
    {
        std::vector<const Channel*> over, under;
        for (const Channel* c : list)
        {
            if (c->loadPercent() > kOverloadedPercent)
                over.push_back(c);
            else if (c->loadPercent() < kUnderloadedPercent && !c->needsWorldReassignment)
                under.push_back(c);
        }

        std::map<std::string, int> room;
        for (const Channel* u : under)
            room[u->id] = int(std::floor(u->maxBots * kTargetPercent / 100.0)) - u->currentBots;

        for (const Channel* o : over)
        {
            int excess = o->currentBots - int(std::floor(o->maxBots * kTargetPercent / 100.0));
            for (const Channel* u : under)
            {
                if (excess <= 0)
                    break;
                const int n = std::min(excess, room[u->id]);
                if (n <= 0)
                    continue;
                out.push_back({ o->id, u->id, n });
                room[u->id] -= n;
                excess -= n;
            }
        }
    }
    return out;
}

HealthReport ChannelManager::healthReport(TimeMs now) const
{
    std::lock_guard lock(m_mutex);

    HealthReport r;
    std::map<std::string, std::pair<double, double>> zoneRange; // min, max load

    for (const auto& [id, c] : m_channels)
    {
        ChannelHealth h;
        h.id          = c.id;
        h.name        = c.name;
        h.zone        = c.zone;
        h.status      = c.status;
        h.currentBots = c.currentBots;
        h.maxBots     = c.maxBots;
        h.loadPercent = c.loadPercent();
        h.worldAlive  = !c.worldId.empty() && m_worlds.isAlive(c.worldId);

        if (h.loadPercent > m_cfg.nearCapacityPercent)
            h.recommendations.push_back(fmt::format("near capacity ({:.1f}%): create a new shard", h.loadPercent));
        if (!c.isDefault && c.currentBots == 0 && c.emptySince &&
            now - *c.emptySince > m_cfg.chronicEmptyAfterMs)
            h.recommendations.push_back("empty for " + std::to_string((now - *c.emptySince) / 60'000) +
                                        " min: drain and retire");
        if (!h.worldAlive || c.needsWorldReassignment)
            h.recommendations.push_back("world '" + c.worldId + "' unavailable: reassign world");
        if (c.status == ChannelStatus::Draining && c.currentBots > 0)
            h.recommendations.push_back("draining: migrate " + std::to_string(c.currentBots) + " occupants");
        if (c.currentBots > c.maxBots && !(c.overCapacityUntil && now < *c.overCapacityUntil))
            h.recommendations.push_back("over capacity outside grace window: migrate occupants");

        r.totalBots += c.currentBots;
        r.totalCapacity += c.maxBots;

        if (c.status == ChannelStatus::Active || c.status == ChannelStatus::Full)
        {
            auto it = zoneRange.try_emplace(c.zone, h.loadPercent, h.loadPercent).first;
            it->second.first  = std::min(it->second.first, h.loadPercent);
            it->second.second = std::max(it->second.second, h.loadPercent);
        }

        r.channels.push_back(std::move(h));
    }

    r.overallLoadPercent = r.totalCapacity > 0 ? 100.0 * r.totalBots / r.totalCapacity : 0.0;
    if (r.overallLoadPercent > kOverloadedPercent)
        r.recommendations.push_back("overall load above 80%: add capacity");
    for (const auto& [zone, range] : zoneRange)
        if (range.second - range.first > kImbalancePoints)
            r.recommendations.push_back("zone '" + zone + "' is imbalanced: rebalance occupants");

    return r;
}

std::vector<Channel> ChannelManager::channels() const
{
    std::lock_guard lock(m_mutex);
    std::vector<Channel> out;
    out.reserve(m_channels.size());
    for (const auto& [id, c] : m_channels)
        out.push_back(c);
    std::sort(out.begin(), out.end(), [](const Channel& a, const Channel& b) { return a.seq < b.seq; });
    return out;
}

std::optional<Channel> ChannelManager::find(const std::string& instanceId) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_channels.find(instanceId);
    if (it == m_channels.end())
        return std::nullopt;
    return it->second;
}

json ChannelManager::toJson() const
{
    std::lock_guard lock(m_mutex);
    json list = json::array();
    for (const auto& [id, c] : m_channels)
        list.push_back(ChannelToJson(c));
    return { {"version", 1}, {"nextSeq", m_nextSeq}, {"channels", std::move(list)} };
}

void ChannelManager::loadJson(const json& j)
{
    std::map<std::string, Channel> loaded;
    std::int64_t nextSeq = core::json_util::ObjInt64(j, "nextSeq", 1);
    for (const auto& cj : j.at("channels"))
    {
        Channel c = ChannelFromJson(cj);
        nextSeq = std::max(nextSeq, c.seq + 1);
        loaded[c.id] = std::move(c);
    }

    std::lock_guard lock(m_mutex);
    m_channels = std::move(loaded);
    m_nextSeq = nextSeq;
}

bool ChannelManager::save(const std::filesystem::path& path, std::string* outError) const noexcept
{
    try
    {
        return core::json_util::WriteFileAtomic(path, toJson().dump(2), outError);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }
}

bool ChannelManager::load(const std::filesystem::path& path, std::string* outError) noexcept
{
    json j;
    if (!core::json_util::ParseJsonFile(path, j, outError))
        return false;
    try
    {
        loadJson(j);
        return true;
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = "Invalid channel table '" + path.string() + "': " + e.what();
        return false;
    }
}

} // namespace townsim::channels
