#include "townsim/world/World.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include <spdlog/spdlog.h>

namespace townsim::world {

using json = nlohmann::json;
using core::ValidationError;

namespace {

// ---- JSON ------------------------------------------------------------------

json TileToJson(pf::IVec2 t)
{
    return json::array({ t.x, t.y });
}

pf::IVec2 TileFromJson(const json& j)
{
    if (j.is_array() && j.size() == 2)
        return { j[0].get<int>(), j[1].get<int>() };
    return { j.at("x").get<int>(), j.at("y").get<int>() };
}

json PathStateToJson(const PathState& s)
{
    if (std::holds_alternative<NeedsPath>(s))
        return { {"kind", "needsPath"} };
    if (const auto* w = std::get_if<WaitingAfterCollision>(&s))
        return { {"kind", "waiting"}, {"until", w->until} };

    const auto& m = std::get<Moving>(s);
    json pts = json::array();
    for (const pf::IVec2& p : m.waypoints)
        pts.push_back(TileToJson(p));
    return { {"kind", "moving"}, {"waypoints", std::move(pts)}, {"next", m.next} };
}

PathState PathStateFromJson(const json& j)
{
    using namespace core::json_util;
    const std::string kind = ObjString(j, "kind", "needsPath");
    if (kind == "waiting")
        return WaitingAfterCollision{ ObjInt64(j, "until", 0) };
    if (kind == "moving")
    {
        Moving m;
        for (const auto& p : j.at("waypoints"))
            m.waypoints.push_back(TileFromJson(p));
        m.next = static_cast<std::size_t>(std::max<std::int64_t>(1, ObjInt64(j, "next", 1)));
        if (m.waypoints.size() < 2 || m.next >= m.waypoints.size())
            return NeedsPath{};
        return m;
    }
    return NeedsPath{};
}

json PlayerToJson(const Player& p)
{
    json j = {
        {"id", p.id},
        {"name", p.name},
        {"position", p.position},
        {"facing", p.facing},
        {"speed", p.speed},
        {"zone", p.zone},
        {"lastInput", p.lastInput},
    };
    if (p.humanToken)
        j["humanToken"] = *p.humanToken;
    if (p.pathfinding)
        j["pathfinding"] = {
            {"destination", TileToJson(p.pathfinding->destination)},
            {"started", p.pathfinding->started},
            {"state", PathStateToJson(p.pathfinding->state)},
        };
    if (p.activity)
        j["activity"] = {
            {"description", p.activity->description},
            {"emoji", p.activity->emoji},
            {"until", p.activity->until},
        };
    return j;
}

Player PlayerFromJson(const json& j)
{
    using namespace core::json_util;
    Player p;
    p.id        = j.at("id").get<PlayerId>();
    p.name      = ObjString(j, "name", "");
    p.position  = j.at("position").get<Vec2>();
    if (const json* f = ObjFind(j, "facing"))
        p.facing = f->get<Vec2>();
    p.speed     = ObjDouble(j, "speed", 0.0);
    p.zone      = ObjString(j, "zone", "");
    p.lastInput = ObjInt64(j, "lastInput", 0);
    if (const json* t = ObjFind(j, "humanToken"); t && t->is_string())
        p.humanToken = t->get<std::string>();
    if (const json* pf = ObjFind(j, "pathfinding"))
    {
        Pathfinding path;
        path.destination = TileFromJson(pf->at("destination"));
        path.started     = ObjInt64(*pf, "started", 0);
        if (const json* s = ObjFind(*pf, "state"))
            path.state = PathStateFromJson(*s);
        p.pathfinding = std::move(path);
    }
    if (const json* a = ObjFind(j, "activity"))
        p.activity = Activity{ ObjString(*a, "description", ""),
                               ObjString(*a, "emoji", ""),
                               ObjInt64(*a, "until", 0) };
    return p;
}

json AgentToJson(const Agent& a)
{
    json j = {
        {"id", a.id},
        {"playerId", a.playerId},
        {"personality", a.personality},
        {"lastInviteAttempt", a.lastInviteAttempt},
    };
    if (a.ownerId)
        j["ownerId"] = *a.ownerId;
    if (a.lastConversation)
        j["lastConversation"] = *a.lastConversation;
    if (a.operation)
        j["operation"] = {
            {"name", a.operation->name},
            {"operationId", a.operation->id},
            {"started", a.operation->started},
            {"flaggedStuck", a.operation->flaggedStuck},
        };
    return j;
}

Agent AgentFromJson(const json& j)
{
    using namespace core::json_util;
    Agent a;
    a.id                = j.at("id").get<AgentId>();
    a.playerId          = j.at("playerId").get<PlayerId>();
    a.personality       = ObjString(j, "personality", "");
    a.lastInviteAttempt = ObjInt64(j, "lastInviteAttempt", 0);
    if (const json* o = ObjFind(j, "ownerId"); o && o->is_string())
        a.ownerId = o->get<std::string>();
    if (const json* lc = ObjFind(j, "lastConversation"))
        a.lastConversation = SafeInt64(*lc, 0);
    if (const json* op = ObjFind(j, "operation"))
        a.operation = Operation{ ObjString(*op, "name", ""),
                                 op->at("operationId").get<OperationId>(),
                                 ObjInt64(*op, "started", 0),
                                 ObjBool(*op, "flaggedStuck", false) };
    return a;
}

} // namespace

// ---- construction / lookup ---------------------------------------------------

World::World()
    : m_map(std::make_shared<const WorldMap>())
{
}

World::World(std::shared_ptr<const WorldMap> map)
    : m_map(map ? std::move(map) : std::make_shared<const WorldMap>())
{
}

const Player* World::findPlayer(PlayerId id) const
{
    auto it = m_players.find(id);
    return it == m_players.end() ? nullptr : &it->second;
}

Player* World::findPlayer(PlayerId id)
{
    auto it = m_players.find(id);
    return it == m_players.end() ? nullptr : &it->second;
}

Player& World::player(PlayerId id)
{
    if (Player* p = findPlayer(id))
        return *p;
    throw ValidationError("Invalid player ID " + id.str());
}

const Agent* World::findAgent(AgentId id) const
{
    auto it = m_agents.find(id);
    return it == m_agents.end() ? nullptr : &it->second;
}

Agent* World::findAgent(AgentId id)
{
    auto it = m_agents.find(id);
    return it == m_agents.end() ? nullptr : &it->second;
}

Agent& World::agent(AgentId id)
{
    if (Agent* a = findAgent(id))
        return *a;
    throw ValidationError("Invalid agent ID " + id.str());
}

const Agent* World::agentForPlayer(PlayerId id) const
{
    for (const auto& [aid, a] : m_agents)
        if (a.playerId == id)
            return &a;
    return nullptr;
}

Agent* World::agentForPlayer(PlayerId id)
{
    for (auto& [aid, a] : m_agents)
        if (a.playerId == id)
            return &a;
    return nullptr;
}

const Conversation* World::findConversation(ConversationId id) const
{
    auto it = m_conversations.find(id);
    return it == m_conversations.end() ? nullptr : &it->second;
}

Conversation& World::conversation(ConversationId id)
{
    auto it = m_conversations.find(id);
    if (it == m_conversations.end())
        throw ValidationError("Invalid conversation ID " + id.str());
    return it->second;
}

const Conversation* World::conversationFor(PlayerId id) const
{
    for (const auto& [cid, c] : m_conversations)
        if (c.involves(id))
            return &c;
    return nullptr;
}

std::vector<pf::IVec2> World::occupiedTiles(std::optional<PlayerId> except) const
{
    std::vector<pf::IVec2> out;
    out.reserve(m_players.size());
    for (const auto& [id, p] : m_players)
        if (!except || id != *except)
            out.push_back(ToTile(p.position));
    return out;
}

bool World::tileFree(pf::IVec2 t) const
{
    if (!m_map->walkable(t))
        return false;
    for (const auto& [id, p] : m_players)
        if (ToTile(p.position) == t)
            return false;
    return true;
}

Vec2 World::pickSpawn(const std::optional<std::string>& zone, std::int64_t salt) const
{
    int x0 = 0, y0 = 0, w = m_map->width(), h = m_map->height();
    if (zone)
    {
        if (const Zone* z = m_map->findZone(*zone))
        {
            x0 = std::max(0, z->x);
            y0 = std::max(0, z->y);
            w  = std::min(z->w, m_map->width() - x0);
            h  = std::min(z->h, m_map->height() - y0);
        }
    }

    const std::int64_t count = std::int64_t(w) * h;
    if (count <= 0)
        throw ValidationError("World has no room for new players");

    // Start somewhere id-dependent so consecutive joins spread out, then scan.
    const std::int64_t start = (salt * 7919) % count;
    for (std::int64_t i = 0; i < count; ++i)
    {
        const std::int64_t k = (start + i) % count;
        const pf::IVec2 t{ x0 + int(k % w), y0 + int(k / w) };
        if (tileFree(t))
            return ToVec(t);
    }
    throw ValidationError("No free position" + (zone ? " in zone '" + *zone + "'" : std::string()));
}

// ---- players and agents --------------------------------------------------------

PlayerId World::join(const JoinParams& params, TimeMs now)
{
    if (params.name.empty())
        throw ValidationError("Player name must not be empty");

    if (params.humanToken)
    {
        for (const auto& [id, p] : m_players)
            if (p.humanToken && *p.humanToken == *params.humanToken)
                throw ValidationError("Token is already controlling player " + id.str());
    }

    Vec2 pos;
    if (params.position)
    {
        const pf::IVec2 t = ToTile(*params.position);
        if (!m_map->walkable(t))
            throw ValidationError("Spawn position is not walkable");
        if (!tileFree(t))
            throw ValidationError("Spawn position is occupied");
        pos = ToVec(t);
    }
    else
    {
        pos = pickSpawn(params.zone, m_nextId);
    }

    const PlayerId id = allocId<'p'>();
    Player p;
    p.id         = id;
    p.name       = params.name;
    p.humanToken = params.humanToken;
    p.position   = pos;
    p.lastInput  = now;
    p.zone       = m_map->zoneAt(pos);
    if (p.zone.empty() && params.zone)
        p.zone = *params.zone;

    m_players.emplace(id, std::move(p));
    return id;
}

std::pair<AgentId, PlayerId> World::createAgent(const std::string& name,
                                                const std::string& personality,
                                                const std::optional<std::string>& zone,
                                                const std::optional<std::string>& ownerId,
                                                TimeMs now)
{
    if (personality.empty())
        throw ValidationError("Agent personality must not be empty");

    JoinParams jp;
    jp.name = name;
    jp.zone = zone;
    const PlayerId pid = join(jp, now);

    const AgentId aid = allocId<'a'>();
    Agent a;
    a.id          = aid;
    a.playerId    = pid;
    a.personality = personality;
    a.ownerId     = ownerId;
    m_agents.emplace(aid, std::move(a));
    return { aid, pid };
}

void World::leaveAllConversations(PlayerId p, TimeMs now)
{
    for (auto it = m_conversations.begin(); it != m_conversations.end();)
    {
        Conversation& c = it->second;
        if (c.finished())
        {
            ++it;
            continue;
        }
        if (c.isInvitee(p))
        {
            it = m_conversations.erase(it);
            continue;
        }
        if (c.isParticipant(p) && c.leave(p, now))
            onConversationFinished(c, now);
        ++it;
    }
}

void World::archivePlayer(PlayerId id, const std::string& reason, TimeMs now)
{
    auto it = m_players.find(id);
    if (it == m_players.end())
        throw ValidationError("Invalid player ID " + id.str());

    if (Agent* a = agentForPlayer(id))
    {
        // Agent first: it must never reference a missing player.
        const AgentId aid = a->id;
        m_archivedAgents[aid] = ArchivedAgent{ *a, reason, now };
        m_agents.erase(aid);
        m_outbox.archived.push_back({ {}, aid.str(), reason, now });
    }

    leaveAllConversations(id, now);

    Player p = std::move(it->second);
    m_players.erase(it);
    p.pathfinding.reset();
    p.speed = 0.0;
    m_archivedPlayers[id] = ArchivedPlayer{ std::move(p), reason, now };
    m_outbox.archived.push_back({ {}, id.str(), reason, now });
}

void World::archiveAgent(AgentId id, const std::string& reason, TimeMs now)
{
    const Agent& a = agent(id);
    archivePlayer(a.playerId, reason, now);
}

void World::moveTo(PlayerId id, std::optional<pf::IVec2> destination, TimeMs now)
{
    Player& p = player(id);
    if (!destination)
    {
        p.pathfinding.reset();
        p.speed = 0.0;
        p.lastInput = now;
        return;
    }

    if (!m_map->grid().bounds().contains(*destination))
        throw ValidationError("Destination is outside the map");
    if (!m_map->walkable(*destination))
        throw ValidationError("Destination is not walkable");

    p.pathfinding = Pathfinding{ *destination, now, NeedsPath{} };
    p.lastInput = now;
}

void World::startActivity(PlayerId id, std::string description, std::string emoji, TimeMs durationMs, TimeMs now)
{
    if (description.empty())
        throw ValidationError("Activity description must not be empty");
    if (durationMs <= 0)
        throw ValidationError("Activity duration must be positive");
    if (durationMs > std::numeric_limits<TimeMs>::max() - now)
        throw ValidationError("Activity duration is too long");

    Player& p = player(id);
    p.activity = Activity{ std::move(description), std::move(emoji), now + durationMs };
    p.lastInput = now;
}

// ---- agent operations ------------------------------------------------------------

OperationId World::startOperation(AgentId id, const std::string& name, TimeMs now)
{
    if (name.empty())
        throw ValidationError("Operation name must not be empty");

    Agent& a = agent(id);
    if (a.operation)
        throw ValidationError("Agent " + id.str() + " already has operation " +
                              a.operation->name + " (" + a.operation->id.str() + ") in progress");

    const OperationId op = allocId<'o'>();
    a.operation = Operation{ name, op, now, false };
    return op;
}

bool World::finishOperation(AgentId id, OperationId op, TimeMs /*now*/)
{
    Agent& a = agent(id);
    if (!a.operation || a.operation->id != op)
    {
        spdlog::debug("Agent {} finished stale operation {}", id.str(), op.str());
        return false;
    }
    a.operation.reset();
    return true;
}

bool World::clearOperation(AgentId id, OperationId op, const std::string& reason, TimeMs now)
{
    Agent& a = agent(id);
    if (!a.operation || a.operation->id != op)
        return false;

    spdlog::warn("Clearing operation {} ({}) of agent {} after {} ms: {}",
                 a.operation->name, op.str(), id.str(), now - a.operation->started, reason);
    a.operation.reset();
    return true;
}

// ---- conversations -----------------------------------------------------------------

void World::requireAvailable(PlayerId p) const
{
    if (const Conversation* c = conversationFor(p))
        throw ValidationError("Player " + p.str() + " is already in conversation " + c->id().str());
}

ConversationId World::startConversation(PlayerId creator, PlayerId invitee, TimeMs now)
{
    if (!findPlayer(creator))
        throw ValidationError("Invalid player ID " + creator.str());
    if (!findPlayer(invitee))
        throw ValidationError("Invalid player ID " + invitee.str());
    if (creator == invitee)
        throw ValidationError("Can't invite yourself to a conversation");
    requireAvailable(creator);
    requireAvailable(invitee);

    const ConversationId id = allocId<'c'>();
    m_conversations.emplace(id, Conversation(id, creator, invitee, now));
    return id;
}

void World::acceptInvite(PlayerId p, ConversationId c, TimeMs now)
{
    player(p);
    conversation(c).accept(p, now);
}

void World::rejectInvite(PlayerId p, ConversationId c, TimeMs /*now*/)
{
    player(p);
    Conversation& conv = conversation(c);
    if (conv.finished())
        throw ValidationError("Conversation " + c.str() + " is finished");
    if (!conv.isInvitee(p))
        throw ValidationError("Player " + p.str() + " was not invited to " + c.str());
    m_conversations.erase(c);
}

void World::setTyping(PlayerId p, ConversationId c, bool typing, TimeMs now)
{
    player(p);
    conversation(c).setTyping(p, typing, now);
}

void World::sendMessage(PlayerId p, ConversationId c, std::string text, TimeMs now)
{
    Player& pl = player(p);
    conversation(c).sendMessage(p, std::move(text), now);
    pl.lastInput = now;
}

void World::leaveConversation(PlayerId p, ConversationId c, TimeMs now)
{
    player(p);
    Conversation& conv = conversation(c);
    if (!conv.finished() && conv.isInvitee(p))
    {
        m_conversations.erase(c);
        return;
    }
    if (conv.leave(p, now))
        onConversationFinished(conv, now);
}

void World::finishConversation(PlayerId p, ConversationId c, TimeMs now)
{
    player(p);
    Conversation& conv = conversation(c);
    conv.finish(p, now);
    onConversationFinished(conv, now);
}

void World::onConversationFinished(const Conversation& c, TimeMs now)
{
    for (PlayerId m : c.members())
        if (Agent* a = agentForPlayer(m))
            a->lastConversation = now;

    m_outbox.finished.push_back({ {}, c.id(),
                                  std::vector<PlayerId>(c.members().begin(), c.members().end()),
                                  c.numMessages(), now });
}

// ---- invariants ------------------------------------------------------------------------

std::vector<std::string> World::checkInvariants() const
{
    std::vector<std::string> out;

    std::set<PlayerId> owned;
    for (const auto& [aid, a] : m_agents)
    {
        if (aid != a.id)
            out.push_back("agent key mismatch " + aid.str());
        if (!findPlayer(a.playerId))
            out.push_back("agent " + aid.str() + " references missing player " + a.playerId.str());
        if (!owned.insert(a.playerId).second)
            out.push_back("player " + a.playerId.str() + " bound to more than one agent");
        if (aid.n >= m_nextId)
            out.push_back("agent id " + aid.str() + " not below nextId");
    }

    for (const auto& [pid, p] : m_players)
    {
        if (pid != p.id)
            out.push_back("player key mismatch " + pid.str());
        if (pid.n >= m_nextId)
            out.push_back("player id " + pid.str() + " not below nextId");
    }

    std::set<PlayerId> busy;
    for (const auto& [cid, c] : m_conversations)
    {
        if (c.finished())
        {
            if (!c.participants().empty() || !c.typing().empty())
                out.push_back("finished conversation " + cid.str() + " still has participants");
            continue;
        }
        if (c.participants().empty())
            out.push_back("live conversation " + cid.str() + " has no participants");
        for (const auto& [p, since] : c.typing())
            if (!c.isParticipant(p))
                out.push_back("typing player " + p.str() + " not in " + cid.str());

        std::vector<PlayerId> involved(c.participants().begin(), c.participants().end());
        if (c.invitee())
            involved.push_back(*c.invitee());
        for (PlayerId p : involved)
            if (!busy.insert(p).second)
                out.push_back("player " + p.str() + " is in more than one live conversation");
    }

    return out;
}

// ---- persistence -------------------------------------------------------------------------

json World::toJson() const
{
    json players = json::array();
    for (const auto& [id, p] : m_players)
        players.push_back(PlayerToJson(p));

    json agents = json::array();
    for (const auto& [id, a] : m_agents)
        agents.push_back(AgentToJson(a));

    json conversations = json::array();
    for (const auto& [id, c] : m_conversations)
        conversations.push_back(c.toJson());

    json archivedPlayers = json::array();
    for (const auto& [id, ap] : m_archivedPlayers)
        archivedPlayers.push_back({ {"player", PlayerToJson(ap.player)},
                                    {"reason", ap.reason},
                                    {"archivedAt", ap.archivedAt} });

    json archivedAgents = json::array();
    for (const auto& [id, aa] : m_archivedAgents)
        archivedAgents.push_back({ {"agent", AgentToJson(aa.agent)},
                                   {"reason", aa.reason},
                                   {"archivedAt", aa.archivedAt} });

    return {
        {"nextId", m_nextId},
        {"players", std::move(players)},
        {"agents", std::move(agents)},
        {"conversations", std::move(conversations)},
        {"archivedPlayers", std::move(archivedPlayers)},
        {"archivedAgents", std::move(archivedAgents)},
    };
}

World World::fromJson(const json& j, std::shared_ptr<const WorldMap> map)
{
    using namespace core::json_util;

    World w(std::move(map));
    w.m_nextId = ObjInt64(j, "nextId", 0);

    for (const auto& pj : j.at("players"))
    {
        Player p = PlayerFromJson(pj);
        const PlayerId id = p.id;
        if (!w.m_players.emplace(id, std::move(p)).second)
            throw ValidationError("duplicate player " + id.str());
    }
    for (const auto& aj : j.at("agents"))
    {
        Agent a = AgentFromJson(aj);
        const AgentId id = a.id;
        if (!w.m_agents.emplace(id, std::move(a)).second)
            throw ValidationError("duplicate agent " + id.str());
    }
    for (const auto& cj : j.at("conversations"))
    {
        Conversation c = Conversation::fromJson(cj);
        const ConversationId id = c.id();
        if (!w.m_conversations.emplace(id, std::move(c)).second)
            throw ValidationError("duplicate conversation " + id.str());
    }

    if (const json* ap = ObjFind(j, "archivedPlayers"); ap && ap->is_array())
        for (const auto& e : *ap)
        {
            Player p = PlayerFromJson(e.at("player"));
            const PlayerId id = p.id;
            w.m_archivedPlayers[id] = ArchivedPlayer{ std::move(p), ObjString(e, "reason", ""), ObjInt64(e, "archivedAt", 0) };
        }
    if (const json* aa = ObjFind(j, "archivedAgents"); aa && aa->is_array())
        for (const auto& e : *aa)
        {
            Agent a = AgentFromJson(e.at("agent"));
            const AgentId id = a.id;
            w.m_archivedAgents[id] = ArchivedAgent{ std::move(a), ObjString(e, "reason", ""), ObjInt64(e, "archivedAt", 0) };
        }

    return w;
}

} // namespace townsim::world
