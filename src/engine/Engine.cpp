#include "townsim/engine/Engine.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

namespace townsim::engine {

using json = nlohmann::json;

json EngineStateToJson(const EngineState& s)
{
    json j = {
        {"processedInputNumber", s.processedInputNumber},
        {"generationNumber", s.generationNumber},
    };
    j["currentTime"] = s.currentTime ? json(*s.currentTime) : json();
    j["lastStepTs"]  = s.lastStepTs ? json(*s.lastStepTs) : json();
    return j;
}

EngineState EngineStateFromJson(const json& j)
{
    using namespace core::json_util;
    EngineState s;
    s.processedInputNumber = ObjInt64(j, "processedInputNumber", -1);
    s.generationNumber     = ObjInt64(j, "generationNumber", 0);
    if (const json* t = ObjFind(j, "currentTime"); t && IsNumber(*t))
        s.currentTime = SafeInt64(*t, 0);
    if (const json* t = ObjFind(j, "lastStepTs"); t && IsNumber(*t))
        s.lastStepTs = SafeInt64(*t, 0);
    return s;
}

Engine::Engine(std::string worldId,
               world::World initial,
               const core::EngineConfig& cfg,
               const core::IClock& clock,
               InputJournal* journal)
    : m_worldId(std::move(worldId))
    , m_cfg(cfg)
    , m_clock(clock)
    , m_journal(journal)
    , m_queue(clock, static_cast<std::size_t>(cfg.maxPendingInputs),
              static_cast<std::size_t>(cfg.retainCompletedInputs))
    , m_world(std::move(initial))
{
    std::lock_guard lock(m_stepMutex);
    publishLocked();
}

SubmitResult Engine::submit(const std::string& name, const json& args)
{
    Command command = ParseCommand(name, args);
    InputRecord r = m_queue.push(name, args.is_null() ? json::object() : args, std::move(command));
    if (m_journal)
        m_journal->recordSubmitted(r);
    spdlog::trace("[{}] input {} {} queued", m_worldId, r.number, r.name);
    return { r.number, r.received };
}

StepResult Engine::runStep(TimeMs now)
{
    StepResult res;
    {
        std::lock_guard lock(m_stepMutex);
        res = stepLocked(now);
    }
    deliverEvents();
    return res;
}

StepResult Engine::stepLocked(TimeMs now)
{
    StepResult res;
    const TimeMs startTs = m_state.currentTime ? *m_state.currentTime + m_cfg.tickMs : now;
    res.startTs = startTs;
    res.endTs = m_state.currentTime.value_or(now);
    if (m_state.currentTime && now < startTs)
        return res; // not a whole tick since the last step

    const auto inputs = m_queue.pending(m_state.processedInputNumber,
                                        static_cast<std::size_t>(m_cfg.maxInputsPerStep));

    world::TickBudget budget{ m_cfg.maxPathfindsPerStep };
    TimeMs currentTs = startTs;
    std::size_t next = 0;
    std::int64_t processed = m_state.processedInputNumber;

    for (;;)
    {
        ++res.ticks;

        while (next < inputs.size() && inputs[next].received <= currentTs)
        {
            const InputRecord& in = inputs[next++];
            processed = in.number;
            applyInput(in, currentTs, res);
        }

        world::TickWorld(m_world, currentTs, m_cfg.tickMs, m_cfg, budget, &res.tick);
        dispatchOutbox();

        const TimeMs candidate = currentTs + m_cfg.tickMs;
        if (now < candidate || res.ticks >= m_cfg.maxTicksPerStep)
            break;
        currentTs = candidate;
    }

    m_state.lastStepTs = m_state.currentTime;
    m_state.currentTime = currentTs;
    m_state.processedInputNumber = processed;
    ++m_state.generationNumber;
    res.endTs = currentTs;

    publishLocked();

    if (res.failed > 0)
        spdlog::debug("[{}] step {}: {} inputs applied, {} failed over {} ticks",
                      m_worldId, m_state.generationNumber, res.applied, res.failed, res.ticks);
    return res;
}

void Engine::applyInput(const InputRecord& in, TimeMs now, StepResult& res)
{
    world::World scratch = m_world;
    InputOutcome outcome;
    try
    {
        json value = ApplyCommand(scratch, in.command, now);

        const auto broken = scratch.checkInvariants();
        if (!broken.empty())
            throw std::logic_error("world invariant violated: " + broken.front());

        m_world = std::move(scratch);
        outcome = InputOutcome::Ok(std::move(value), now);
        ++res.applied;
    }
    catch (const core::ValidationError& e)
    {
        spdlog::warn("[{}] input {} {} rejected: {}", m_worldId, in.number, in.name, e.what());
        outcome = InputOutcome::Error(core::ErrorKind::Validation, e.what(), now);
        ++res.failed;
    }
    catch (const std::exception& e)
    {
        spdlog::error("[{}] input {} {} failed: {}", m_worldId, in.number, in.name, e.what());
        outcome = InputOutcome::Error(core::ErrorKind::Internal, e.what(), now);
        ++res.failed;
    }

    completeInput(in, outcome);
    if (outcome.ok)
        dispatchOutbox();
}

void Engine::completeInput(const InputRecord& in, const InputOutcome& outcome)
{
    if (!m_queue.complete(in.number, outcome))
        return;

    if (m_journal)
        m_journal->recordCompleted(in.number, outcome);

    std::lock_guard lock(m_eventsMutex);
    m_events.emplace_back(evt::InputCompleted{ m_worldId, in.number, in.name, outcome.ok, outcome.message });
}

void Engine::dispatchOutbox()
{
    evt::Outbox& out = m_world.outbox();
    if (out.empty())
        return;

    std::lock_guard lock(m_eventsMutex);
    for (auto& e : out.finished)
    {
        e.worldId = m_worldId;
        m_events.emplace_back(std::move(e));
    }
    for (auto& e : out.archived)
    {
        e.worldId = m_worldId;
        spdlog::info("[{}] archived {}: {}", m_worldId, e.entityId, e.reason);
        m_events.emplace_back(std::move(e));
    }
    for (auto& e : out.stuck)
    {
        e.worldId = m_worldId;
        m_events.emplace_back(std::move(e));
    }
    out.clear();
}

void Engine::deliverEvents()
{
    // A listener stepping this engine: the loop below picks its events up.
    if (m_deliveringThread.load() == std::this_thread::get_id())
        return;

    std::lock_guard lock(m_deliverMutex);
    struct Delivering {
        std::atomic<std::thread::id>& owner;
        ~Delivering() { owner.store(std::thread::id{}); }
    } guard{ m_deliveringThread };
    m_deliveringThread.store(std::this_thread::get_id());

    for (;;)
    {
        std::vector<QueuedEvent> batch;
        {
            std::lock_guard events(m_eventsMutex);
            batch.swap(m_events);
        }
        if (batch.empty())
            break;
        for (QueuedEvent& e : batch)
            std::visit([this](auto& ev) { m_dispatcher.trigger(std::move(ev)); }, e);
    }
}

void Engine::publishLocked()
{
    auto snap = std::make_shared<const world::World>(m_world);
    std::lock_guard lock(m_snapshotMutex);
    m_published.state = m_state;
    m_published.world = std::move(snap);
}

std::shared_ptr<const world::World> Engine::snapshot() const
{
    std::lock_guard lock(m_snapshotMutex);
    return m_published.world;
}

Checkpoint Engine::checkpoint() const
{
    std::lock_guard lock(m_snapshotMutex);
    return m_published;
}

EngineState Engine::state() const
{
    std::lock_guard lock(m_snapshotMutex);
    return m_published.state;
}

std::vector<std::int64_t> Engine::clearStuckInputs(TimeMs now,
                                                   TimeMs threshold,
                                                   const std::map<std::string, TimeMs>& overrides)
{
    std::vector<std::int64_t> cleared;
    std::unique_lock lock(m_stepMutex);
    for (const InputRecord& r : m_queue.unresolved())
    {
        auto it = overrides.find(r.name);
        const TimeMs limit = it != overrides.end() ? it->second : threshold;
        const TimeMs age = now - r.received;
        if (age <= limit)
            continue;

        const std::string reason = "cleared as stuck after " + std::to_string(age) + " ms";
        if (!m_queue.complete(r.number, InputOutcome::Error(core::ErrorKind::Stuck, reason, now)))
            continue;

        if (m_journal)
            m_journal->recordCompleted(r.number, *m_queue.get(r.number)->outcome);
        {
            std::lock_guard events(m_eventsMutex);
            m_events.emplace_back(evt::InputCompleted{ m_worldId, r.number, r.name, false, reason });
        }
        spdlog::warn("[{}] input {} {} {}", m_worldId, r.number, r.name, reason);
        cleared.push_back(r.number);
    }
    lock.unlock();

    deliverEvents();
    return cleared;
}

void Engine::restore(const EngineState& s, world::World w)
{
    std::lock_guard lock(m_stepMutex);
    m_state = s;
    m_world = std::move(w);
    m_world.outbox().clear();
    publishLocked();
}

void Engine::resume(TimeMs now)
{
    std::lock_guard lock(m_stepMutex);
    if (!m_state.currentTime)
        return;

    const TimeMs window = static_cast<TimeMs>(m_cfg.maxTicksPerStep) * m_cfg.tickMs;
    const TimeMs gap = now - *m_state.currentTime;
    if (gap <= window)
        return;

    spdlog::info("[{}] skipping {} ms of simulated time after restart", m_worldId, gap);
    m_state.currentTime = now - m_cfg.tickMs;
    publishLocked();
}

} // namespace townsim::engine
