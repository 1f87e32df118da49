#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "townsim/channels/ChannelManager.hpp"
#include "townsim/core/Clock.hpp"
#include "townsim/core/Config.hpp"
#include "townsim/engine/Engine.hpp"
#include "townsim/recovery/OwnerDirectory.hpp"

namespace townsim::recovery {

using core::TimeMs;

struct SweepReport {
    std::string              pass;
    int                      examined = 0;
    int                      repaired = 0;
    std::vector<std::string> details;
};

[[nodiscard]] nlohmann::json SweepReportToJson(const SweepReport& r);

// Idempotent repair passes. Repairs to world state are submitted as ordinary
// commands so they are ordered and logged like any other input; the only
// direct edit is marking stuck inputs, which happens under the engine lock.
class RecoverySweeper {
public:
    RecoverySweeper(const core::RecoveryConfig& cfg,
                    const core::EngineConfig& engineCfg,
                    const core::IClock& clock,
                    const OwnerDirectory* owners = nullptr,
                    channels::ChannelManager* channels = nullptr);

    SweepReport sweepStuckInputs(const std::vector<engine::Engine*>& engines,
                                 std::optional<TimeMs> olderThan = std::nullopt);
    SweepReport sweepStuckOperations(const std::vector<engine::Engine*>& engines);
    SweepReport sweepOrphans(const std::vector<engine::Engine*>& engines);

private:
    // True if this repair was not already submitted and is still outstanding.
    bool claim(const std::string& key);
    void forgetResolved(const std::set<std::string>& stillOutstanding, const std::string& prefix);
    void release(const std::string& key);
    bool trySubmit(engine::Engine& e, const std::string& key, const std::string& name,
                   const nlohmann::json& args, SweepReport& report, const std::string& detail);

    core::RecoveryConfig      m_cfg;
    core::EngineConfig        m_engineCfg;
    const core::IClock&       m_clock;
    const OwnerDirectory*     m_owners;
    channels::ChannelManager* m_channels;

    std::mutex            m_mutex;
    std::set<std::string> m_submitted;   // "<pass>/<world>/<entity>"
};

} // namespace townsim::recovery
