#include "townsim/recovery/RecoverySweeper.hpp"

#include "townsim/core/Errors.hpp"

#include <spdlog/spdlog.h>

namespace townsim::recovery {

using json = nlohmann::json;

json SweepReportToJson(const SweepReport& r)
{
    return {
        {"pass", r.pass},
        {"examined", r.examined},
        {"repaired", r.repaired},
        {"details", r.details},
    };
}

RecoverySweeper::RecoverySweeper(const core::RecoveryConfig& cfg,
                                 const core::EngineConfig& engineCfg,
                                 const core::IClock& clock,
                                 const OwnerDirectory* owners,
                                 channels::ChannelManager* channels)
    : m_cfg(cfg)
    , m_engineCfg(engineCfg)
    , m_clock(clock)
    , m_owners(owners)
    , m_channels(channels)
{
}

bool RecoverySweeper::claim(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    return m_submitted.insert(key).second;
}

void RecoverySweeper::release(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    m_submitted.erase(key);
}

void RecoverySweeper::forgetResolved(const std::set<std::string>& stillOutstanding, const std::string& prefix)
{
    std::lock_guard lock(m_mutex);
    for (auto it = m_submitted.lower_bound(prefix); it != m_submitted.end() && it->compare(0, prefix.size(), prefix) == 0;)
    {
        if (!stillOutstanding.count(*it))
            it = m_submitted.erase(it);
        else
            ++it;
    }
}

bool RecoverySweeper::trySubmit(engine::Engine& e, const std::string& key, const std::string& name,
                                const json& args, SweepReport& report, const std::string& detail)
{
    try
    {
        const auto r = e.submit(name, args);
        ++report.repaired;
        report.details.push_back(detail);
        spdlog::warn("[{}] {} sweep: {} (input {})", e.worldId(), report.pass, detail, r.number);
        return true;
    }
    catch (const core::RateLimited& ex)
    {
        spdlog::warn("[{}] {} sweep deferred: {}", e.worldId(), report.pass, ex.what());
    }
    catch (const core::ValidationError& ex)
    {
        spdlog::error("[{}] {} sweep built a bad {}: {}", e.worldId(), report.pass, name, ex.what());
    }
    release(key);
    return false;
}

SweepReport RecoverySweeper::sweepStuckInputs(const std::vector<engine::Engine*>& engines,
                                              std::optional<TimeMs> olderThan)
{
    SweepReport report;
    report.pass = "stuckInputs";
    const TimeMs now = m_clock.now();
    const TimeMs threshold = olderThan.value_or(m_cfg.stuckInputThresholdMs);

    for (engine::Engine* e : engines)
    {
        report.examined += static_cast<int>(e->pendingCount());
        // An explicit threshold from an operator applies to every command.
        const auto cleared = olderThan
            ? e->clearStuckInputs(now, threshold)
            : e->clearStuckInputs(now, threshold, m_cfg.stuckInputOverrides);
        for (std::int64_t n : cleared)
            report.details.push_back(e->worldId() + "/input " + std::to_string(n));
        report.repaired += static_cast<int>(cleared.size());
    }

    if (report.repaired > 0)
        spdlog::warn("Stuck-input sweep cleared {} input(s)", report.repaired);
    return report;
}

SweepReport RecoverySweeper::sweepStuckOperations(const std::vector<engine::Engine*>& engines)
{
    SweepReport report;
    report.pass = "stuckOperations";
    const TimeMs now = m_clock.now();

    for (engine::Engine* e : engines)
    {
        const auto snap = e->snapshot();
        const std::string prefix = "op/" + e->worldId() + "/";
        std::set<std::string> outstanding;

        for (const auto& [id, agent] : snap->agents())
        {
            if (!agent.operation)
                continue;
            ++report.examined;

            const TimeMs age = now - agent.operation->started;
            if (age <= m_engineCfg.stuckOperationThresholdMs && !agent.operation->flaggedStuck)
                continue;

            const std::string key = prefix + agent.operation->id.str();
            outstanding.insert(key);
            if (!claim(key))
                continue;

            const std::string reason = "operation " + agent.operation->name + " stuck for " +
                                       std::to_string(age) + " ms";
            trySubmit(*e, key, "clearOperation",
                      { {"agentId", id.str()},
                        {"operationId", agent.operation->id.str()},
                        {"reason", reason} },
                      report, id.str() + ": " + reason);
        }
        forgetResolved(outstanding, prefix);
    }
    return report;
}

SweepReport RecoverySweeper::sweepOrphans(const std::vector<engine::Engine*>& engines)
{
    SweepReport report;
    report.pass = "orphans";
    const TimeMs now = m_clock.now();

    for (engine::Engine* e : engines)
    {
        const auto snap = e->snapshot();
        const std::string prefix = "orphan/" + e->worldId() + "/";
        std::set<std::string> outstanding;

        if (m_owners)
        {
            for (const auto& [id, agent] : snap->agents())
            {
                if (!agent.ownerId)
                    continue;
                ++report.examined;
                if (m_owners->ownerExists(*agent.ownerId))
                    continue;

                const std::string key = prefix + id.str();
                outstanding.insert(key);
                if (!claim(key))
                    continue;

                const std::string reason = "owner '" + *agent.ownerId + "' no longer exists";
                trySubmit(*e, key, "archiveAgent", { {"agentId", id.str()}, {"reason", reason} },
                          report, id.str() + ": " + reason);
            }
        }

        for (const auto& [id, player] : snap->players())
        {
            if (!player.humanToken)
                continue;
            ++report.examined;
            const TimeMs idle = now - player.lastInput;
            if (idle <= m_cfg.humanIdleTimeoutMs)
                continue;

            const std::string key = prefix + id.str();
            outstanding.insert(key);
            if (!claim(key))
                continue;

            const std::string reason = "idle for " + std::to_string(idle / 1000) + " s";
            trySubmit(*e, key, "leave", { {"playerId", id.str()}, {"reason", reason} },
                      report, id.str() + ": " + reason);
        }

        forgetResolved(outstanding, prefix);
    }

    if (m_channels)
    {
        for (const std::string& id : m_channels->flagDeadWorlds())
        {
            ++report.repaired;
            report.details.push_back(id + ": world unavailable, needs reassignment");
        }
    }
    return report;
}

} // namespace townsim::recovery
