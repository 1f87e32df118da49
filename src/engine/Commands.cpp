#include "townsim/engine/Commands.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"
#include "townsim/world/World.hpp"

#include <cmath>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

namespace townsim::engine {

using json = nlohmann::json;
using core::ValidationError;

namespace {

// ---- argument readers (strict: wrong types are rejected, not defaulted) ----

const json* Field(const json& args, const char* key)
{
    return core::json_util::ObjFind(args, key);
}

std::string RequireString(const json& args, const char* key)
{
    const json* v = Field(args, key);
    if (!v)
        throw ValidationError(std::string("missing argument '") + key + "'");
    if (!v->is_string())
        throw ValidationError(std::string("argument '") + key + "' must be a string");
    return v->get<std::string>();
}

std::optional<std::string> OptString(const json& args, const char* key)
{
    const json* v = Field(args, key);
    if (!v)
        return std::nullopt;
    if (!v->is_string())
        throw ValidationError(std::string("argument '") + key + "' must be a string");
    return v->get<std::string>();
}

template <class Id>
Id RequireId(const json& args, const char* key)
{
    const std::string s = RequireString(args, key);
    auto id = Id::parse(s);
    if (!id)
        throw ValidationError(std::string("argument '") + key + "' is not a valid id: '" + s + "'");
    return *id;
}

template <class Id>
std::optional<Id> OptId(const json& args, const char* key)
{
    if (!Field(args, key))
        return std::nullopt;
    return RequireId<Id>(args, key);
}

bool RequireBool(const json& args, const char* key)
{
    const json* v = Field(args, key);
    if (!v || !v->is_boolean())
        throw ValidationError(std::string("argument '") + key + "' must be a boolean");
    return v->get<bool>();
}

// Upper bound only; the world rejects durations that are not positive.
TimeMs RequireDuration(const json& args, const char* key)
{
    const json* v = Field(args, key);
    if (!v || !core::json_util::IsNumber(*v))
        throw ValidationError(std::string("argument '") + key + "' must be a number");
    const double d = v->get<double>();
    if (!std::isfinite(d) || d > static_cast<double>(core::kMaxActivityMs))
        throw ValidationError(std::string("argument '") + key + "' must be at most " +
                              std::to_string(core::kMaxActivityMs) + " ms");
    return core::json_util::SafeInt64(*v, 0);
}

int RequireCoord(const json& v, const char* key)
{
    const double d = v.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > static_cast<double>(std::numeric_limits<int>::max() - 1))
        throw ValidationError(std::string("argument '") + key + "' has an out-of-range coordinate");
    return static_cast<int>(std::lround(d));
}

std::optional<pf::IVec2> OptTile(const json& args, const char* key)
{
    const json* v = Field(args, key);
    if (!v)
        return std::nullopt;
    if (!v->is_object() || !core::json_util::IsNumber(v->value("x", json())) ||
        !core::json_util::IsNumber(v->value("y", json())))
        throw ValidationError(std::string("argument '") + key + "' must be {x, y}");
    return pf::IVec2{ RequireCoord(v->at("x"), key), RequireCoord(v->at("y"), key) };
}

std::optional<world::Vec2> OptPoint(const json& args, const char* key)
{
    auto t = OptTile(args, key);
    if (!t)
        return std::nullopt;
    return world::ToVec(*t);
}

void RequireObject(const json& args)
{
    if (!args.is_object() && !args.is_null())
        throw ValidationError("arguments must be an object");
}

// ---- handlers ----------------------------------------------------------------

struct Applier {
    world::World& w;
    TimeMs now;

    json operator()(const cmd::Join& c) const
    {
        world::JoinParams jp{ c.name, c.zone, c.position, c.humanToken };
        return w.join(jp, now);
    }

    json operator()(const cmd::Leave& c) const
    {
        w.archivePlayer(c.playerId, c.reason, now);
        return nullptr;
    }

    json operator()(const cmd::MoveTo& c) const
    {
        w.moveTo(c.playerId, c.destination, now);
        return nullptr;
    }

    json operator()(const cmd::StartActivity& c) const
    {
        w.startActivity(c.playerId, c.description, c.emoji, c.durationMs, now);
        return nullptr;
    }

    json operator()(const cmd::CreateAgent& c) const
    {
        auto [aid, pid] = w.createAgent(c.name, c.personality, c.zone, c.ownerId, now);
        return { {"agentId", aid}, {"playerId", pid} };
    }

    json operator()(const cmd::ArchiveAgent& c) const
    {
        w.archiveAgent(c.agentId, c.reason, now);
        return nullptr;
    }

    json operator()(const cmd::StartOperation& c) const
    {
        return w.startOperation(c.agentId, c.name, now);
    }

    // The operation is released even if its follow-up can no longer be
    // carried out (invitee busy, destination walled in); the agent is then
    // simply idle again.
    json operator()(const cmd::FinishOperation& c) const
    {
        if (!w.finishOperation(c.agentId, c.operationId, now))
            return nullptr;

        world::Agent& a = w.agent(c.agentId);
        const PlayerId pid = a.playerId;

        if (c.invitee)
        {
            a.lastInviteAttempt = now;
            const world::Player* invitee = w.findPlayer(*c.invitee);
            if (invitee && !w.conversationFor(pid) && !w.conversationFor(*c.invitee) && *c.invitee != pid)
                w.startConversation(pid, *c.invitee, now);
            else
                spdlog::debug("Agent {} could not invite {}", c.agentId.str(), c.invitee->str());
        }
        if (c.destination)
        {
            if (w.map().walkable(*c.destination))
                w.moveTo(pid, c.destination, now);
            else
                spdlog::debug("Agent {} picked unwalkable destination ({}, {})",
                              c.agentId.str(), c.destination->x, c.destination->y);
        }
        if (c.activity && c.activity->durationMs > 0 && !c.activity->description.empty())
            w.startActivity(pid, c.activity->description, c.activity->emoji, c.activity->durationMs, now);
        return nullptr;
    }

    json operator()(const cmd::ClearOperation& c) const
    {
        w.clearOperation(c.agentId, c.operationId, c.reason, now);
        return nullptr;
    }

    json operator()(const cmd::StartConversation& c) const
    {
        return w.startConversation(c.playerId, c.inviteeId, now);
    }

    json operator()(const cmd::AcceptInvite& c) const
    {
        w.acceptInvite(c.playerId, c.conversationId, now);
        return nullptr;
    }

    json operator()(const cmd::RejectInvite& c) const
    {
        w.rejectInvite(c.playerId, c.conversationId, now);
        return nullptr;
    }

    json operator()(const cmd::SetTyping& c) const
    {
        w.setTyping(c.playerId, c.conversationId, c.typing, now);
        return nullptr;
    }

    json operator()(const cmd::SendMessage& c) const
    {
        w.sendMessage(c.playerId, c.conversationId, c.text, now);
        return nullptr;
    }

    json operator()(const cmd::LeaveConversation& c) const
    {
        w.leaveConversation(c.playerId, c.conversationId, now);
        return nullptr;
    }

    json operator()(const cmd::FinishConversation& c) const
    {
        w.finishConversation(c.playerId, c.conversationId, now);
        return nullptr;
    }
};

} // namespace

const char* CommandName(const Command& c) noexcept
{
    return std::visit([](const auto& v) { return std::decay_t<decltype(v)>::kName; }, c);
}

Command ParseCommand(const std::string& name, const json& rawArgs)
{
    RequireObject(rawArgs);
    const json args = rawArgs.is_null() ? json::object() : rawArgs;

    if (name == cmd::Join::kName)
        return cmd::Join{ RequireString(args, "name"), OptString(args, "zone"),
                          OptPoint(args, "position"), OptString(args, "humanToken") };
    if (name == cmd::Leave::kName)
        return cmd::Leave{ RequireId<PlayerId>(args, "playerId"),
                           OptString(args, "reason").value_or("left") };
    if (name == cmd::MoveTo::kName)
        return cmd::MoveTo{ RequireId<PlayerId>(args, "playerId"), OptTile(args, "destination") };
    if (name == cmd::StartActivity::kName)
        return cmd::StartActivity{ RequireId<PlayerId>(args, "playerId"),
                                   RequireString(args, "description"),
                                   OptString(args, "emoji").value_or(""),
                                   RequireDuration(args, "durationMs") };
    if (name == cmd::CreateAgent::kName)
        return cmd::CreateAgent{ RequireString(args, "name"), RequireString(args, "personality"),
                                 OptString(args, "zone"), OptString(args, "ownerId") };
    if (name == cmd::ArchiveAgent::kName)
        return cmd::ArchiveAgent{ RequireId<AgentId>(args, "agentId"),
                                  OptString(args, "reason").value_or("archived") };
    if (name == cmd::StartOperation::kName)
        return cmd::StartOperation{ RequireId<AgentId>(args, "agentId"), RequireString(args, "name") };
    if (name == cmd::FinishOperation::kName)
    {
        cmd::FinishOperation c;
        c.agentId     = RequireId<AgentId>(args, "agentId");
        c.operationId = RequireId<OperationId>(args, "operationId");
        c.destination = OptTile(args, "destination");
        c.invitee     = OptId<PlayerId>(args, "invitee");
        if (const json* a = Field(args, "activity"))
        {
            if (!a->is_object())
                throw ValidationError("argument 'activity' must be an object");
            c.activity = cmd::ActivitySpec{ RequireString(*a, "description"),
                                            OptString(*a, "emoji").value_or(""),
                                            RequireDuration(*a, "durationMs") };
        }
        return c;
    }
    if (name == cmd::ClearOperation::kName)
        return cmd::ClearOperation{ RequireId<AgentId>(args, "agentId"),
                                    RequireId<OperationId>(args, "operationId"),
                                    OptString(args, "reason").value_or("cleared") };
    if (name == cmd::StartConversation::kName)
        return cmd::StartConversation{ RequireId<PlayerId>(args, "playerId"),
                                       RequireId<PlayerId>(args, "inviteeId") };
    if (name == cmd::AcceptInvite::kName)
        return cmd::AcceptInvite{ RequireId<PlayerId>(args, "playerId"),
                                  RequireId<ConversationId>(args, "conversationId") };
    if (name == cmd::RejectInvite::kName)
        return cmd::RejectInvite{ RequireId<PlayerId>(args, "playerId"),
                                  RequireId<ConversationId>(args, "conversationId") };
    if (name == cmd::SetTyping::kName)
        return cmd::SetTyping{ RequireId<PlayerId>(args, "playerId"),
                               RequireId<ConversationId>(args, "conversationId"),
                               RequireBool(args, "typing") };
    if (name == cmd::SendMessage::kName)
        return cmd::SendMessage{ RequireId<PlayerId>(args, "playerId"),
                                 RequireId<ConversationId>(args, "conversationId"),
                                 RequireString(args, "text") };
    if (name == cmd::LeaveConversation::kName)
        return cmd::LeaveConversation{ RequireId<PlayerId>(args, "playerId"),
                                       RequireId<ConversationId>(args, "conversationId") };
    if (name == cmd::FinishConversation::kName)
        return cmd::FinishConversation{ RequireId<PlayerId>(args, "playerId"),
                                        RequireId<ConversationId>(args, "conversationId") };

    throw ValidationError("unknown command '" + name + "'");
}

json ApplyCommand(world::World& world, const Command& c, TimeMs now)
{
    return std::visit(Applier{ world, now }, c);
}

} // namespace townsim::engine
