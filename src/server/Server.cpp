#include "townsim/server/Server.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/engine/Commands.hpp"
#include "townsim/persist/SaveFormat.hpp"
#include "townsim/persist/WorldStore.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <taskflow/algorithm/for_each.hpp>

namespace fs = std::filesystem;

namespace townsim::server {

using json = nlohmann::json;

namespace {

// True when `interval` has passed since `last`. The first call only starts
// the clock.
bool Due(std::optional<TimeMs>& last, TimeMs interval, TimeMs now)
{
    if (!last)
    {
        last = now;
        return false;
    }
    if (now - *last < interval)
        return false;
    last = now;
    return true;
}

std::shared_ptr<const world::WorldMap> BuiltInMap(int width, int height)
{
    auto map = std::make_shared<world::WorldMap>(width, height);
    map->addZone(world::Zone{ "town", 0, 0, width, height });
    return map;
}

bool IsReplayable(const engine::InputRecord& r)
{
    if (r.outcome && !r.outcome->ok && r.outcome->errorKind == core::ErrorKind::Stuck)
        return false;
    try
    {
        (void)engine::ParseCommand(r.name, r.args);
        return true;
    }
    catch (const core::ValidationError&)
    {
        return false;
    }
}

} // namespace

json CountersToJson(const ServerCounters& c)
{
    return {
        {"inputsApplied", c.inputsApplied.load()},
        {"inputsFailed", c.inputsFailed.load()},
        {"conversationsFinished", c.conversationsFinished.load()},
        {"entitiesArchived", c.entitiesArchived.load()},
        {"operationsStuck", c.operationsStuck.load()},
    };
}

Server::Server(const core::ServerConfig& cfg,
               const core::IClock& clock,
               const recovery::OwnerDirectory* owners)
    : m_cfg(cfg)
    , m_clock(clock)
    , m_map(BuiltInMap(cfg.mapWidth, cfg.mapHeight))
    , m_driver(cfg.driver, m_dialogue)
    , m_channels(cfg.channels, *this, clock)
    , m_sweeper(cfg.recovery, cfg.engine, clock, owners, &m_channels)
{
}

Server::~Server()
{
    stop();
}

// ---- paths -------------------------------------------------------------------

fs::path Server::worldPath(const std::string& worldId) const
{
    return fs::path(m_cfg.data.directory) / (worldId + persist::savefmt::kWorldSuffix);
}

fs::path Server::logPath(const std::string& worldId) const
{
    return fs::path(m_cfg.data.directory) / (worldId + persist::savefmt::kInputLogSuffix);
}

fs::path Server::channelsPath() const
{
    return fs::path(m_cfg.data.directory) / persist::savefmt::kChannelsFile;
}

// ---- startup -----------------------------------------------------------------

bool Server::start(std::string* outError)
{
    std::error_code ec;
    fs::create_directories(m_cfg.data.directory, ec);
    if (ec)
    {
        if (outError)
            *outError = "Failed to create data directory '" + m_cfg.data.directory + "': " + ec.message();
        return false;
    }

    if (!m_cfg.mapFile.empty())
    {
        auto map = std::make_shared<world::WorldMap>();
        if (!world::LoadWorldMap(m_cfg.mapFile, *map, outError))
            return false;
        m_map = std::move(map);
    }

    if (fs::exists(channelsPath(), ec))
    {
        if (!m_channels.load(channelsPath(), outError))
            return false;
    }

    // Configured worlds first, then any world a persisted channel points at.
    std::vector<std::string> ids = m_cfg.worlds;
    for (const channels::Channel& c : m_channels.channels())
        if (!c.worldId.empty() && std::find(ids.begin(), ids.end(), c.worldId) == ids.end())
            ids.push_back(c.worldId);

    const TimeMs now = m_clock.now();
    for (const std::string& id : ids)
    {
        try
        {
            openWorld(id, now);
        }
        catch (const core::AllocationError& e)
        {
            if (outError)
                *outError = e.what();
            return false;
        }
    }

    m_started = true;
    spdlog::info("Server started with {} world(s), {} channel(s), data in '{}'",
                 ids.size(), m_channels.channels().size(), m_cfg.data.directory);
    return true;
}

engine::Engine& Server::openWorld(const std::string& worldId, TimeMs now)
{
    {
        std::lock_guard lock(m_mutex);
        auto it = m_worlds.find(worldId);
        if (it != m_worlds.end())
            return *it->second.engine;
    }

    std::string err;
    std::optional<persist::LoadedWorld> loaded;
    std::error_code ec;
    if (fs::exists(worldPath(worldId), ec))
    {
        persist::LoadedWorld lw;
        if (!persist::LoadWorld(worldPath(worldId), lw, &err))
            throw core::AllocationError("World '" + worldId + "': " + err);
        if (lw.worldId != worldId)
            spdlog::warn("[{}] snapshot was written for world '{}'", worldId, lw.worldId);
        loaded = std::move(lw);
    }

    std::vector<engine::InputRecord> records;
    if (!persist::InputLog::Replay(logPath(worldId), records, &err))
        throw core::AllocationError("World '" + worldId + "': " + err);

    auto log = std::make_unique<persist::InputLog>(logPath(worldId));
    if (!log->open(&err))
        throw core::AllocationError("World '" + worldId + "': " + err);

    auto eng = std::make_unique<engine::Engine>(worldId, world::World(m_map), m_cfg.engine, m_clock, log.get());

    std::int64_t processed = -1;
    if (loaded)
    {
        processed = loaded->state.processedInputNumber;
        eng->restore(loaded->state, std::move(loaded->world));
    }

    int requeued = 0, reapplied = 0;
    for (engine::InputRecord& r : records)
    {
        // Applied before the snapshot but its completion never reached the log.
        if (!r.outcome && r.number <= processed)
        {
            r.outcome = engine::InputOutcome::Error(core::ErrorKind::Internal,
                                                    "outcome lost before restart", now);
            log->recordCompleted(r.number, *r.outcome);
        }
        // Applied after the snapshot: the world no longer reflects it, so it
        // runs again. Stuck inputs and unparsable commands never touched the world.
        if (r.outcome && r.number > processed && IsReplayable(r))
        {
            r.outcome.reset();
            ++reapplied;
        }
        if (!r.outcome)
            ++requeued;
        eng->restoreInput(std::move(r));
    }
    eng->resume(now);

    if (reapplied > 0)
        spdlog::warn("[{}] {} input(s) applied after the last snapshot will be applied again",
                     worldId, reapplied);

    connectListeners(*eng);

    if (loaded || !records.empty())
        spdlog::info("[{}] restored at generation {} with {} queued input(s)",
                     worldId, eng->state().generationNumber, requeued);
    else
        spdlog::info("[{}] created", worldId);

    std::lock_guard lock(m_mutex);
    // A concurrent open of the same id may have won; its engine is the one kept.
    auto it = m_worlds.emplace(worldId, WorldSlot{ std::move(log), std::move(eng) }).first;
    return *it->second.engine;
}

void Server::connectListeners(engine::Engine& e)
{
    auto& d = e.dispatcher();
    d.sink<evt::InputCompleted>().connect<&Server::onInputCompleted>(*this);
    d.sink<evt::ConversationFinished>().connect<&Server::onConversationFinished>(*this);
    d.sink<evt::EntityArchived>().connect<&Server::onEntityArchived>(*this);
    d.sink<evt::AgentOperationStuck>().connect<&Server::onOperationStuck>(*this);
}

void Server::onInputCompleted(const evt::InputCompleted& e)
{
    if (e.ok)
        ++m_counters.inputsApplied;
    else
        ++m_counters.inputsFailed;
    spdlog::trace("[{}] input {} {} {}", e.worldId, e.inputNumber, e.name, e.ok ? "ok" : e.error);
}

void Server::onConversationFinished(const evt::ConversationFinished& e)
{
    ++m_counters.conversationsFinished;
    spdlog::info("[{}] conversation {} finished after {} message(s) between {} member(s)",
                 e.worldId, e.conversation.str(), e.numMessages, e.members.size());
}

void Server::onEntityArchived(const evt::EntityArchived&)
{
    ++m_counters.entitiesArchived;
}

void Server::onOperationStuck(const evt::AgentOperationStuck& e)
{
    ++m_counters.operationsStuck;
    spdlog::warn("[{}] agent {} stuck in {} ({}) since {}",
                 e.worldId, e.agent.str(), e.name, e.operation.str(), e.started);
}

// ---- world provider ----------------------------------------------------------

std::string Server::provideWorld(const std::string& zone, const std::string& channelName)
{
    std::string id = "w-" + channelName;
    {
        std::lock_guard lock(m_mutex);
        for (int n = 2; m_worlds.count(id); ++n)
            id = "w-" + channelName + "-" + std::to_string(n);
    }

    openWorld(id, m_clock.now());
    spdlog::info("World {} provided for channel '{}' (zone {})", id, channelName, zone);
    return id;
}

bool Server::isAlive(const std::string& worldId) const
{
    std::lock_guard lock(m_mutex);
    return m_worlds.count(worldId) != 0;
}

// ---- lookup ------------------------------------------------------------------

engine::Engine* Server::engine(const std::string& worldId) const
{
    std::lock_guard lock(m_mutex);
    auto it = m_worlds.find(worldId);
    return it != m_worlds.end() ? it->second.engine.get() : nullptr;
}

engine::Engine& Server::requireEngine(const std::string& worldId) const
{
    engine::Engine* e = engine(worldId);
    if (!e)
        throw core::ValidationError("unknown world '" + worldId + "'");
    return *e;
}

std::vector<engine::Engine*> Server::engines() const
{
    std::lock_guard lock(m_mutex);
    std::vector<engine::Engine*> out;
    out.reserve(m_worlds.size());
    for (const auto& [id, slot] : m_worlds)
        out.push_back(slot.engine.get());
    return out;
}

std::vector<std::string> Server::worldIds() const
{
    std::lock_guard lock(m_mutex);
    std::vector<std::string> out;
    for (const auto& [id, slot] : m_worlds)
        out.push_back(id);
    return out;
}

// ---- stepping ----------------------------------------------------------------

TickSummary Server::stepAll(TimeMs now, const std::optional<std::string>& only)
{
    std::vector<engine::Engine*> list;
    if (only)
        list.push_back(&requireEngine(*only));
    else
        list = engines();

    std::vector<engine::StepResult> results(list.size());

    tf::Taskflow taskflow;
    taskflow.for_each_index(std::size_t{ 0 }, list.size(), std::size_t{ 1 }, [&](std::size_t i) {
        try
        {
            results[i] = list[i]->runStep(now);
        }
        catch (const std::exception& e)
        {
            spdlog::error("[{}] step failed: {}", list[i]->worldId(), e.what());
        }
    });
    m_executor.run(taskflow).wait();

    TickSummary summary;
    summary.worlds = static_cast<int>(list.size());
    for (std::size_t i = 0; i < list.size(); ++i)
    {
        summary.ticks   += results[i].ticks;
        summary.applied += results[i].applied;
        summary.failed  += results[i].failed;
        summary.perWorld.emplace(list[i]->worldId(), results[i]);
    }
    return summary;
}

TickSummary Server::tick(TimeMs now)
{
    std::lock_guard lock(m_tickMutex);

    TickSummary summary = stepAll(now);

    if (m_cfg.driver.enabled)
        for (engine::Engine* e : engines())
            summary.driverSubmitted += m_driver.drive(*e, now).submitted;

    runPeriodic(now);
    return summary;
}

void Server::runPeriodic(TimeMs now)
{
    const auto& r = m_cfg.recovery;

    if (Due(m_lastInputSweep, r.inputSweepIntervalMs, now))
        m_sweeper.sweepStuckInputs(engines());
    if (Due(m_lastOperationSweep, r.operationSweepIntervalMs, now))
        m_sweeper.sweepStuckOperations(engines());
    if (Due(m_lastOrphanSweep, r.orphanSweepIntervalMs, now))
        m_sweeper.sweepOrphans(engines());
    if (Due(m_lastHealth, r.healthIntervalMs, now))
        logHealth(now);

    if (m_cfg.data.snapshotIntervalMs > 0 && Due(m_lastSnapshot, m_cfg.data.snapshotIntervalMs, now))
    {
        std::string err;
        if (!saveAll(&err))
            spdlog::error("Periodic save failed: {}", err);
    }
}

void Server::logHealth(TimeMs now)
{
    const channels::HealthReport report = m_channels.healthReport(now);
    spdlog::info("Channel health: {} channel(s), {}/{} bots ({:.1f}%)",
                 report.channels.size(), report.totalBots, report.totalCapacity, report.overallLoadPercent);
    for (const auto& c : report.channels)
        for (const auto& rec : c.recommendations)
            spdlog::warn("Channel {} ({}): {}", c.name, c.id, rec);
    for (const auto& rec : report.recommendations)
        spdlog::warn("Channels: {}", rec);
}

// ---- persistence -------------------------------------------------------------

bool Server::saveAll(std::string* outError)
{
    std::vector<std::pair<engine::Engine*, persist::InputLog*>> slots;
    {
        std::lock_guard lock(m_mutex);
        for (auto& [id, slot] : m_worlds)
            slots.emplace_back(slot.engine.get(), slot.log.get());
    }

    bool ok = true;
    std::string err;
    for (auto [eng, log] : slots)
    {
        const engine::Checkpoint cp = eng->checkpoint();
        if (!persist::SaveWorld(worldPath(eng->worldId()), eng->worldId(), cp, &err))
        {
            spdlog::error("[{}] snapshot failed: {}", eng->worldId(), err);
            if (ok && outError)
                *outError = err;
            ok = false;
            continue;
        }

        // Everything up to the snapshot is in the world file; keep a tail of
        // completed inputs so their outcomes stay queryable after a restart.
        const std::int64_t keepFrom = std::max<std::int64_t>(
            0, cp.state.processedInputNumber + 1 - m_cfg.engine.retainCompletedInputs);
        if (!log->compact(keepFrom, &err))
            spdlog::warn("[{}] input log compaction failed: {}", eng->worldId(), err);
    }

    if (!m_channels.save(channelsPath(), &err))
    {
        spdlog::error("Saving channels failed: {}", err);
        if (ok && outError)
            *outError = err;
        ok = false;
    }

    if (ok)
        spdlog::debug("Saved {} world(s)", slots.size());
    return ok;
}

// ---- loop --------------------------------------------------------------------

void Server::startLoop()
{
    if (m_thread.joinable())
        return;
    {
        std::lock_guard lock(m_loopMutex);
        m_stopping = false;
    }
    m_thread = std::thread([this] { loop(); });
}

void Server::loop()
{
    std::unique_lock lock(m_loopMutex);
    while (!m_stopping)
    {
        lock.unlock();
        try
        {
            tick(m_clock.now());
        }
        catch (const std::exception& e)
        {
            spdlog::error("Server tick failed: {}", e.what());
        }
        lock.lock();
        m_loopCv.wait_for(lock, std::chrono::milliseconds(m_cfg.engine.stepMs), [this] { return m_stopping; });
    }
}

void Server::stop()
{
    {
        std::lock_guard lock(m_loopMutex);
        m_stopping = true;
    }
    m_loopCv.notify_all();
    if (m_thread.joinable())
        m_thread.join();

    if (m_started)
    {
        m_started = false;
        std::string err;
        if (!saveAll(&err))
            spdlog::error("Final save failed: {}", err);
        else
            spdlog::info("Server stopped");
    }
}

} // namespace townsim::server
