#include "townsim/server/AgentDriver.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/Hash.hpp"

#include <array>
#include <iterator>
#include <vector>

#include <spdlog/spdlog.h>

namespace townsim::server {

using json = nlohmann::json;

namespace {

struct ActivityTemplate {
    const char* description;
    const char* emoji;
};

constexpr std::array<ActivityTemplate, 5> kActivities{ {
    { "reading a book", "📖" },
    { "daydreaming", "🤔" },
    { "gardening", "🥕" },
    { "grabbing a coffee", "☕" },
    { "counting coins", "🪙" },
} };

constexpr int kDestinationAttempts = 16;

std::pair<std::int64_t, std::int64_t> PairKey(world::PlayerId a, world::PlayerId b)
{
    return a.n < b.n ? std::make_pair(a.n, b.n) : std::make_pair(b.n, a.n);
}

} // namespace

AgentDriver::AgentDriver(const core::DriverConfig& cfg, const DialoguePolicy& dialogue)
    : m_cfg(cfg)
    , m_dialogue(dialogue)
{
}

AgentDriver::WorldState& AgentDriver::stateFor(const std::string& worldId)
{
    auto it = m_worlds.find(worldId);
    if (it != m_worlds.end())
        return it->second;

    std::uint64_t s = m_cfg.seed ^ core::hash_string(worldId);
    WorldState ws;
    ws.rng.seed(core::splitmix64(s));
    return m_worlds.emplace(worldId, std::move(ws)).first->second;
}

double AgentDriver::roll(WorldState& ws)
{
    return std::uniform_real_distribution<double>(0.0, 1.0)(ws.rng);
}

DriveStats AgentDriver::drive(engine::Engine& e, TimeMs now)
{
    std::lock_guard lock(m_mutex);
    WorldState& ws = stateFor(e.worldId());
    DriveStats stats;

    // An agent waits until its previous command has an outcome.
    for (auto it = ws.inflight.begin(); it != ws.inflight.end();)
    {
        const auto rec = e.input(it->second);
        if (!rec || rec->outcome)
            it = ws.inflight.erase(it);
        else
            ++it;
    }

    const auto snap = e.snapshot();
    for (const auto& [cid, c] : snap->conversations())
    {
        if (c.state() != world::ConversationState::Active)
            continue;
        for (auto x = c.participants().begin(); x != c.participants().end(); ++x)
            for (auto y = std::next(x); y != c.participants().end(); ++y)
                ws.lastTogether[PairKey(*x, *y)] = now;
    }

    for (const auto& [id, agent] : snap->agents())
    {
        if (ws.inflight.count(id.n))
            continue;
        driveAgent(e, ws, *snap, agent, now, stats);
    }
    return stats;
}

void AgentDriver::driveAgent(engine::Engine& e, WorldState& ws, const world::World& w,
                             const world::Agent& a, TimeMs now, DriveStats& stats)
{
    const world::Player* p = w.findPlayer(a.playerId);
    if (!p)
        return;
    const world::PlayerId pid = p->id;

    if (const world::Conversation* c = w.conversationFor(pid))
    {
        driveConversation(e, ws, w, a, *p, *c, now, stats);
        return;
    }

    if (a.operation)
    {
        if (a.operation->name != kOperationName)
            return;
        json args = chooseFollowUp(ws, w, a, now);
        args["agentId"] = a.id;
        args["operationId"] = a.operation->id;
        submit(e, ws, a, "finishOperation", std::move(args), stats);
        return;
    }

    if (p->isMoving() || p->activity)
        return;

    submit(e, ws, a, "startOperation", { {"agentId", a.id}, {"name", kOperationName} }, stats);
}

void AgentDriver::driveConversation(engine::Engine& e, WorldState& ws, const world::World& w,
                                    const world::Agent& a, const world::Player& p,
                                    const world::Conversation& c, TimeMs now, DriveStats& stats)
{
    const world::PlayerId pid = p.id;
    const json ids = { {"playerId", pid}, {"conversationId", c.id()} };

    if (c.isInvitee(pid))
    {
        const bool accept = roll(ws) < m_cfg.acceptProbability;
        submit(e, ws, a, accept ? "acceptInvite" : "rejectInvite", ids, stats);
        return;
    }
    if (c.state() == world::ConversationState::Requested)
    {
        if (now - c.created() > m_cfg.inviteTimeoutMs)
        {
            spdlog::debug("[{}] {} gives up on invite {}", e.worldId(), pid.str(), c.id().str());
            submit(e, ws, a, "leaveConversation", ids, stats);
        }
        return;
    }
    if (c.state() != world::ConversationState::Active)
        return;

    if (c.numMessages() >= m_cfg.maxConversationMessages ||
        now - c.created() > m_cfg.maxConversationDurationMs)
    {
        submit(e, ws, a, "leaveConversation", ids, stats);
        return;
    }

    const auto& last = c.lastMessage();
    if (last)
    {
        if (last->author == pid)
        {
            // Partner went quiet.
            if (now - last->timestamp >= m_cfg.awkwardTimeoutMs)
                submit(e, ws, a, "leaveConversation", ids, stats);
            return;
        }
        if (now - last->timestamp < m_cfg.messageCooldownMs)
            return;
    }
    else if (c.creator() != pid && now - c.created() < m_cfg.awkwardTimeoutMs)
    {
        // The creator opens; speak first only after a long silence.
        return;
    }

    std::string partner;
    for (const world::PlayerId other : c.participants())
        if (other != pid)
            if (const world::Player* op = w.findPlayer(other))
                partner = op->name;

    DialogueContext ctx;
    ctx.speaker = p.name;
    ctx.personality = a.personality;
    ctx.partner = partner;
    ctx.messageIndex = c.numMessages();
    ctx.closing = c.numMessages() + 1 >= m_cfg.maxConversationMessages;

    json args = ids;
    args["text"] = m_dialogue.compose(ctx);
    submit(e, ws, a, "sendMessage", std::move(args), stats);
}

bool AgentDriver::mayInvite(const world::Agent& a, TimeMs now) const
{
    if (a.lastConversation && now < *a.lastConversation + m_cfg.conversationCooldownMs)
        return false;
    if (a.lastInviteAttempt > 0 && now < a.lastInviteAttempt + m_cfg.conversationCooldownMs)
        return false;
    return true;
}

bool AgentDriver::pairCoolingDown(const WorldState& ws, world::PlayerId a, world::PlayerId b, TimeMs now) const
{
    auto it = ws.lastTogether.find(PairKey(a, b));
    return it != ws.lastTogether.end() && now < it->second + m_cfg.playerConversationCooldownMs;
}

json AgentDriver::chooseFollowUp(WorldState& ws, const world::World& w, const world::Agent& a, TimeMs now)
{
    json out = json::object();

    if (mayInvite(a, now) && roll(ws) < m_cfg.inviteProbability)
    {
        std::vector<world::PlayerId> candidates;
        for (const auto& [id, other] : w.players())
            if (id != a.playerId && !w.conversationFor(id) && !pairCoolingDown(ws, a.playerId, id, now))
                candidates.push_back(id);

        if (!candidates.empty())
        {
            std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
            out["invitee"] = candidates[pick(ws.rng)];
            return out;
        }
    }

    if (roll(ws) < 0.5)
    {
        const world::WorldMap& map = w.map();
        std::uniform_int_distribution<int> xs(0, map.width() - 1);
        std::uniform_int_distribution<int> ys(0, map.height() - 1);
        for (int i = 0; i < kDestinationAttempts; ++i)
        {
            const pf::IVec2 t{ xs(ws.rng), ys(ws.rng) };
            if (map.walkable(t))
            {
                out["destination"] = { {"x", t.x}, {"y", t.y} };
                return out;
            }
        }
    }

    std::uniform_int_distribution<std::size_t> pick(0, kActivities.size() - 1);
    const ActivityTemplate& act = kActivities[pick(ws.rng)];
    out["activity"] = {
        {"description", act.description},
        {"emoji", act.emoji},
        {"durationMs", m_cfg.activityDurationMs},
    };
    return out;
}

void AgentDriver::submit(engine::Engine& e, WorldState& ws, const world::Agent& a,
                         const char* name, json args, DriveStats& stats)
{
    try
    {
        const auto r = e.submit(name, args);
        ws.inflight[a.id.n] = r.number;
        ++stats.submitted;
    }
    catch (const core::RateLimited& ex)
    {
        spdlog::debug("[{}] driver backing off for {}: {}", e.worldId(), a.id.str(), ex.what());
        ++stats.rejected;
    }
    catch (const core::ValidationError& ex)
    {
        spdlog::warn("[{}] driver produced invalid {} for {}: {}", e.worldId(), name, a.id.str(), ex.what());
        ++stats.rejected;
    }
}

} // namespace townsim::server
