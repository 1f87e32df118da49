#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <entt/entt.hpp>
#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"
#include "townsim/core/Config.hpp"
#include "townsim/engine/Input.hpp"
#include "townsim/engine/InputQueue.hpp"
#include "townsim/world/Simulation.hpp"
#include "townsim/world/World.hpp"

namespace townsim::engine {

struct EngineState {
    std::optional<TimeMs> currentTime;          // simulated time of the last tick
    std::optional<TimeMs> lastStepTs;
    std::int64_t          processedInputNumber = -1;
    std::int64_t          generationNumber = 0;
};

[[nodiscard]] nlohmann::json EngineStateToJson(const EngineState& s);
[[nodiscard]] EngineState EngineStateFromJson(const nlohmann::json& j);

struct SubmitResult {
    std::int64_t number = -1;
    TimeMs       received = 0;
};

struct StepResult {
    int    ticks = 0;
    int    applied = 0;
    int    failed = 0;
    TimeMs startTs = 0;
    TimeMs endTs = 0;
    world::TickStats tick;
};

// World state and its engine state, published together after every step.
struct Checkpoint {
    EngineState                         state;
    std::shared_ptr<const world::World> world;
};

// Single-writer simulation of one world.
//
// Any number of threads may submit(); runStep() applies queued inputs in
// number order, one at a time, each against a scratch copy of the world that
// replaces the live world only if the handler succeeds. Readers get immutable
// snapshots that never reflect a partially applied input.
class Engine {
public:
    Engine(std::string worldId,
           world::World initial,
           const core::EngineConfig& cfg,
           const core::IClock& clock,
           InputJournal* journal = nullptr);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] const std::string& worldId() const noexcept { return m_worldId; }
    [[nodiscard]] const core::EngineConfig& config() const noexcept { return m_cfg; }

    // Listeners must be connected before stepping starts. Events are queued
    // during a step and delivered in order on a stepping thread once the step
    // has released the engine, so listeners may submit() or step again.
    [[nodiscard]] entt::dispatcher& dispatcher() noexcept { return m_dispatcher; }

    // Throws core::ValidationError (unknown name, bad args) or core::RateLimited.
    SubmitResult submit(const std::string& name, const nlohmann::json& args);

    StepResult runStep(TimeMs now);

    [[nodiscard]] std::shared_ptr<const world::World> snapshot() const;
    [[nodiscard]] Checkpoint checkpoint() const;

    [[nodiscard]] std::optional<InputRecord> input(std::int64_t number) const { return m_queue.get(number); }
    [[nodiscard]] std::vector<InputRecord> pendingInputs() const { return m_queue.unresolved(); }
    [[nodiscard]] std::size_t pendingCount() const { return m_queue.pendingCount(); }

    // Marks unresolved inputs older than their threshold as failed ("stuck").
    // Returns the numbers cleared by this call; a second call with the same
    // arguments clears nothing.
    std::vector<std::int64_t> clearStuckInputs(TimeMs now,
                                               TimeMs threshold,
                                               const std::map<std::string, TimeMs>& overrides = {});

    [[nodiscard]] EngineState state() const;

    // ---- restart ---------------------------------------------------------------
    void restore(const EngineState& s, world::World w);
    void restoreInput(InputRecord r) { m_queue.restore(std::move(r)); }
    // Skips simulated time the process was not running for, so the first
    // steps after a restart don't spend minutes catching up.
    void resume(TimeMs now);

private:
    void applyInput(const InputRecord& in, TimeMs now, StepResult& res);
    void completeInput(const InputRecord& in, const InputOutcome& outcome);
    StepResult stepLocked(TimeMs now);
    void dispatchOutbox();
    void publishLocked();
    void deliverEvents();

    using QueuedEvent = std::variant<evt::InputCompleted, evt::ConversationFinished,
                                     evt::EntityArchived, evt::AgentOperationStuck>;

    std::string        m_worldId;
    core::EngineConfig m_cfg;
    const core::IClock& m_clock;
    InputJournal*      m_journal = nullptr;

    InputQueue m_queue;

    // Writer side, guarded by m_stepMutex.
    mutable std::mutex m_stepMutex;
    world::World       m_world;
    EngineState        m_state;

    // Events waiting for delivery, in the order they happened.
    std::mutex               m_eventsMutex;
    std::vector<QueuedEvent> m_events;

    // Held while listeners run; m_deliveringThread marks a re-entrant step.
    std::mutex                   m_deliverMutex;
    std::atomic<std::thread::id> m_deliveringThread{};
    entt::dispatcher             m_dispatcher;

    // Reader side.
    mutable std::mutex m_snapshotMutex;
    Checkpoint         m_published;
};

} // namespace townsim::engine
