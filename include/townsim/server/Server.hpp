#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <taskflow/taskflow.hpp>

#include "townsim/channels/ChannelManager.hpp"
#include "townsim/channels/WorldProvider.hpp"
#include "townsim/core/Clock.hpp"
#include "townsim/core/Config.hpp"
#include "townsim/engine/Engine.hpp"
#include "townsim/persist/InputLog.hpp"
#include "townsim/recovery/OwnerDirectory.hpp"
#include "townsim/recovery/RecoverySweeper.hpp"
#include "townsim/server/AgentDriver.hpp"
#include "townsim/server/DialoguePolicy.hpp"
#include "townsim/world/Events.hpp"
#include "townsim/world/WorldMap.hpp"

namespace townsim::server {

using core::TimeMs;

struct TickSummary {
    int worlds = 0;
    int ticks = 0;
    int applied = 0;
    int failed = 0;
    int driverSubmitted = 0;
    std::map<std::string, engine::StepResult> perWorld;
};

// Totals fed by the engines' event dispatchers.
struct ServerCounters {
    std::atomic<std::int64_t> inputsApplied{ 0 };
    std::atomic<std::int64_t> inputsFailed{ 0 };
    std::atomic<std::int64_t> conversationsFinished{ 0 };
    std::atomic<std::int64_t> entitiesArchived{ 0 };
    std::atomic<std::int64_t> operationsStuck{ 0 };
};

[[nodiscard]] nlohmann::json CountersToJson(const ServerCounters& c);

// Hosts every world engine of the process together with the channel table,
// the recovery sweeper and the agent driver. Also the channel manager's
// source of new worlds.
class Server final : public channels::WorldProvider {
public:
    Server(const core::ServerConfig& cfg,
           const core::IClock& clock,
           const recovery::OwnerDirectory* owners = nullptr);
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Loads the map and channel table, then restores or creates every world.
    [[nodiscard]] bool start(std::string* outError = nullptr);

    // Background loop calling tick() every engine.stepMs.
    void startLoop();
    // Stops the loop and writes a final snapshot.
    void stop();

    // One pass: step every world, run the driver, then any due periodic work.
    TickSummary tick(TimeMs now);
    // Steps worlds in parallel. `only` restricts the pass to one world.
    TickSummary stepAll(TimeMs now, const std::optional<std::string>& only = std::nullopt);

    [[nodiscard]] bool saveAll(std::string* outError = nullptr);

    [[nodiscard]] engine::Engine* engine(const std::string& worldId) const;
    // Throws core::ValidationError for unknown worlds.
    [[nodiscard]] engine::Engine& requireEngine(const std::string& worldId) const;
    [[nodiscard]] std::vector<engine::Engine*> engines() const;
    [[nodiscard]] std::vector<std::string> worldIds() const;

    [[nodiscard]] channels::ChannelManager& channels() noexcept { return m_channels; }
    [[nodiscard]] recovery::RecoverySweeper& sweeper() noexcept { return m_sweeper; }
    [[nodiscard]] const ServerCounters& counters() const noexcept { return m_counters; }
    [[nodiscard]] const core::ServerConfig& config() const noexcept { return m_cfg; }
    [[nodiscard]] const core::IClock& clock() const noexcept { return m_clock; }

    // channels::WorldProvider
    std::string provideWorld(const std::string& zone, const std::string& channelName) override;
    [[nodiscard]] bool isAlive(const std::string& worldId) const override;

private:
    struct WorldSlot {
        std::unique_ptr<persist::InputLog> log;
        std::unique_ptr<engine::Engine>    engine;
    };

    // Restores from disk when a snapshot or log exists. Throws core::AllocationError.
    engine::Engine& openWorld(const std::string& worldId, TimeMs now);
    void connectListeners(engine::Engine& e);
    void runPeriodic(TimeMs now);
    void logHealth(TimeMs now);
    void loop();

    void onInputCompleted(const evt::InputCompleted& e);
    void onConversationFinished(const evt::ConversationFinished& e);
    void onEntityArchived(const evt::EntityArchived& e);
    void onOperationStuck(const evt::AgentOperationStuck& e);

    [[nodiscard]] std::filesystem::path worldPath(const std::string& worldId) const;
    [[nodiscard]] std::filesystem::path logPath(const std::string& worldId) const;
    [[nodiscard]] std::filesystem::path channelsPath() const;

    core::ServerConfig  m_cfg;
    const core::IClock& m_clock;

    std::shared_ptr<const world::WorldMap> m_map;
    TemplateDialoguePolicy    m_dialogue;
    AgentDriver               m_driver;
    channels::ChannelManager  m_channels;
    recovery::RecoverySweeper m_sweeper;
    ServerCounters            m_counters;
    tf::Executor              m_executor;

    mutable std::mutex               m_mutex;   // guards m_worlds only
    std::map<std::string, WorldSlot> m_worlds;
    bool                             m_started = false;

    std::mutex            m_tickMutex;
    std::optional<TimeMs> m_lastInputSweep;
    std::optional<TimeMs> m_lastOperationSweep;
    std::optional<TimeMs> m_lastOrphanSweep;
    std::optional<TimeMs> m_lastHealth;
    std::optional<TimeMs> m_lastSnapshot;

    std::mutex              m_loopMutex;
    std::condition_variable m_loopCv;
    bool                    m_stopping = false;
    std::thread             m_thread;
};

} // namespace townsim::server
