#include "townsim/server/RequestRouter.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace townsim::server {

using json = nlohmann::json;
using core::ValidationError;

namespace {

std::string RequireString(const json& req, const char* key)
{
    auto it = req.find(key);
    if (it == req.end() || !it->is_string() || it->get_ref<const std::string&>().empty())
        throw ValidationError(std::string("'") + key + "' must be a non-empty string");
    return it->get<std::string>();
}

std::optional<std::string> OptString(const json& req, const char* key)
{
    auto it = req.find(key);
    if (it == req.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw ValidationError(std::string("'") + key + "' must be a string");
    return it->get<std::string>();
}

std::optional<TimeMs> OptTime(const json& req, const char* key)
{
    auto it = req.find(key);
    if (it == req.end() || it->is_null())
        return std::nullopt;
    if (!core::json_util::IsNumber(*it))
        throw ValidationError(std::string("'") + key + "' must be a number");
    return core::json_util::SafeInt64(*it, 0);
}

json ErrorBody(const char* kind, const std::string& message)
{
    return { {"kind", kind}, {"message", message} };
}

json StepToJson(const engine::StepResult& r)
{
    return {
        {"ticks", r.ticks},
        {"applied", r.applied},
        {"failed", r.failed},
        {"startTs", r.startTs},
        {"endTs", r.endTs},
        {"pathfinds", r.tick.pathfinds},
        {"collisions", r.tick.collisions},
    };
}

} // namespace

RequestRouter::RequestRouter(Server& server)
    : m_server(server)
{
    auto bind = [this](json (RequestRouter::*fn)(const json&)) -> Handler {
        return [this, fn](const json& req) { return (this->*fn)(req); };
    };

    m_handlers["submit"]                = bind(&RequestRouter::submit);
    m_handlers["input"]                 = bind(&RequestRouter::input);
    m_handlers["snapshot"]              = bind(&RequestRouter::snapshot);
    m_handlers["allocate"]              = bind(&RequestRouter::allocate);
    m_handlers["release"]               = bind(&RequestRouter::release);
    m_handlers["channels"]              = bind(&RequestRouter::listChannels);
    m_handlers["admin.pending"]         = bind(&RequestRouter::pending);
    m_handlers["admin.sweepInputs"]     = bind(&RequestRouter::sweepInputs);
    m_handlers["admin.sweepOperations"] = bind(&RequestRouter::sweepOperations);
    m_handlers["admin.sweepOrphans"]    = bind(&RequestRouter::sweepOrphans);
    m_handlers["admin.health"]          = bind(&RequestRouter::health);
    m_handlers["admin.setStatus"]       = bind(&RequestRouter::setStatus);
    m_handlers["admin.reassign"]        = bind(&RequestRouter::reassign);
    m_handlers["step"]                  = bind(&RequestRouter::step);
    m_handlers["save"]                  = bind(&RequestRouter::save);
}

json RequestRouter::Handle(const json& request) noexcept
{
    json response = json::object();
    try
    {
        if (!request.is_object())
            throw ValidationError("request must be an object");
        if (auto it = request.find("id"); it != request.end())
            response["id"] = *it;

        const std::string op = RequireString(request, "op");
        auto h = m_handlers.find(op);
        if (h == m_handlers.end())
            throw ValidationError("unknown op '" + op + "'");

        json body = h->second(request);
        response["ok"] = true;
        if (body.is_object())
            response.update(body);
        return response;
    }
    catch (const ValidationError& e)
    {
        response["ok"] = false;
        response["error"] = ErrorBody("validation", e.what());
    }
    catch (const core::CapacityExceeded& e)
    {
        response["ok"] = false;
        response["error"] = ErrorBody("capacity", e.what());
    }
    catch (const core::AllocationError& e)
    {
        response["ok"] = false;
        response["error"] = ErrorBody("allocation", e.what());
    }
    catch (const core::RateLimited& e)
    {
        response["ok"] = false;
        response["error"] = ErrorBody("rateLimited", e.what());
    }
    catch (const json::exception& e)
    {
        response["ok"] = false;
        response["error"] = ErrorBody("validation", e.what());
    }
    catch (const std::exception& e)
    {
        spdlog::error("Request failed: {}", e.what());
        response["ok"] = false;
        response["error"] = ErrorBody("internal", e.what());
    }
    return response;
}

std::string RequestRouter::HandleLine(const std::string& line) noexcept
{
    const json req = json::parse(line, nullptr, /*allow_exceptions=*/false);
    json res;
    if (req.is_discarded())
        res = { {"ok", false}, {"error", ErrorBody("validation", "malformed JSON")} };
    else
        res = Handle(req);
    return res.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ---- inputs ------------------------------------------------------------------

json RequestRouter::submit(const json& req)
{
    engine::Engine& e = m_server.requireEngine(RequireString(req, "world"));
    const std::string name = RequireString(req, "name");
    const json args = req.contains("args") ? req.at("args") : json::object();

    // A refused submission is a normal answer, not a failed request.
    try
    {
        const engine::SubmitResult r = e.submit(name, args);
        return { {"accepted", true}, {"input", r.number}, {"received", r.received} };
    }
    catch (const ValidationError& ex)
    {
        return { {"accepted", false}, {"error", ErrorBody("validation", ex.what())} };
    }
    catch (const core::RateLimited& ex)
    {
        spdlog::warn("[{}] submit {} refused: {}", e.worldId(), name, ex.what());
        return { {"accepted", false}, {"error", ErrorBody("rateLimited", ex.what())} };
    }
}

json RequestRouter::input(const json& req)
{
    engine::Engine& e = m_server.requireEngine(RequireString(req, "world"));
    auto it = req.find("input");
    if (it == req.end() || !it->is_number_integer())
        throw ValidationError("'input' must be an integer");

    const auto rec = e.input(it->get<std::int64_t>());
    if (!rec)
        throw ValidationError("unknown input " + std::to_string(it->get<std::int64_t>()));
    return { {"input", engine::InputToJson(*rec)} };
}

json RequestRouter::snapshot(const json& req)
{
    const std::string worldId = RequireString(req, "world");
    const engine::Checkpoint cp = m_server.requireEngine(worldId).checkpoint();

    json out = cp.world->toJson();
    out["worldId"] = worldId;
    out["engine"] = engine::EngineStateToJson(cp.state);
    return out;
}

json RequestRouter::pending(const json& req)
{
    std::vector<engine::Engine*> list;
    if (auto w = OptString(req, "world"))
        list.push_back(&m_server.requireEngine(*w));
    else
        list = m_server.engines();

    const TimeMs now = m_server.clock().now();
    json out = json::object();
    for (engine::Engine* e : list)
    {
        json records = json::array();
        for (const engine::InputRecord& r : e->pendingInputs())
        {
            json j = engine::InputToJson(r);
            j["ageMs"] = now - r.received;
            records.push_back(std::move(j));
        }
        out[e->worldId()] = std::move(records);
    }
    return { {"pending", std::move(out)} };
}

// ---- channels ----------------------------------------------------------------

json RequestRouter::allocate(const json& req)
{
    const channels::Allocation a = m_server.channels().findOrCreateInstance(RequireString(req, "zone"));
    return { {"instanceId", a.instanceId}, {"worldId", a.worldId}, {"created", a.created} };
}

json RequestRouter::release(const json& req)
{
    const std::string id = RequireString(req, "instanceId");
    m_server.channels().releaseSlot(id);
    return { {"instanceId", id} };
}

json RequestRouter::listChannels(const json&)
{
    json list = json::array();
    for (const channels::Channel& c : m_server.channels().channels())
        list.push_back(channels::ChannelToJson(c));
    return { {"channels", std::move(list)} };
}

json RequestRouter::setStatus(const json& req)
{
    const std::string id = RequireString(req, "instanceId");
    const std::string name = RequireString(req, "status");
    const auto status = channels::ChannelStatusFromName(name);
    if (!status)
        throw ValidationError("unknown channel status '" + name + "'");
    m_server.channels().setStatus(id, *status);
    return { {"channel", channels::ChannelToJson(*m_server.channels().find(id))} };
}

json RequestRouter::reassign(const json& req)
{
    const std::string id = RequireString(req, "instanceId");
    m_server.channels().reassignWorld(id, OptString(req, "worldId").value_or(""));
    return { {"channel", channels::ChannelToJson(*m_server.channels().find(id))} };
}

// ---- admin -------------------------------------------------------------------

json RequestRouter::sweepInputs(const json& req)
{
    const auto olderThan = OptTime(req, "olderThanMs");
    if (olderThan && *olderThan < 0)
        throw ValidationError("'olderThanMs' must not be negative");
    return recovery::SweepReportToJson(m_server.sweeper().sweepStuckInputs(m_server.engines(), olderThan));
}

json RequestRouter::sweepOperations(const json&)
{
    return recovery::SweepReportToJson(m_server.sweeper().sweepStuckOperations(m_server.engines()));
}

json RequestRouter::sweepOrphans(const json&)
{
    return recovery::SweepReportToJson(m_server.sweeper().sweepOrphans(m_server.engines()));
}

json RequestRouter::health(const json&)
{
    const TimeMs now = m_server.clock().now();
    json out = channels::HealthReportToJson(m_server.channels().healthReport(now));

    json moves = json::array();
    for (const channels::BalanceSuggestion& s : m_server.channels().balanceSuggestions())
        moves.push_back({ {"from", s.fromId}, {"to", s.toId}, {"count", s.count} });
    out["balance"] = std::move(moves);

    json worlds = json::object();
    for (engine::Engine* e : m_server.engines())
    {
        const engine::EngineState s = e->state();
        worlds[e->worldId()] = {
            {"generation", s.generationNumber},
            {"processedInput", s.processedInputNumber},
            {"pending", e->pendingCount()},
        };
    }
    out["worlds"] = std::move(worlds);
    out["counters"] = CountersToJson(m_server.counters());
    return out;
}

json RequestRouter::step(const json& req)
{
    const TimeMs now = OptTime(req, "now").value_or(m_server.clock().now());
    const TickSummary summary = m_server.stepAll(now, OptString(req, "world"));

    json worlds = json::object();
    for (const auto& [id, r] : summary.perWorld)
        worlds[id] = StepToJson(r);
    return { {"worlds", std::move(worlds)}, {"applied", summary.applied}, {"failed", summary.failed} };
}

json RequestRouter::save(const json&)
{
    std::string err;
    if (!m_server.saveAll(&err))
        throw std::runtime_error("save failed: " + err);
    return json::object();
}

} // namespace townsim::server
