#include "townsim/world/Conversation.hpp"

#include "townsim/core/Errors.hpp"
#include "townsim/core/JsonUtil.hpp"

namespace townsim::world {

using json = nlohmann::json;
using core::ValidationError;

const char* ConversationStateName(ConversationState s) noexcept
{
    switch (s)
    {
    case ConversationState::Requested: return "requested";
    case ConversationState::Active:    return "active";
    case ConversationState::Finished:  return "finished";
    }
    return "finished";
}

Conversation::Conversation(ConversationId id, PlayerId creator, PlayerId invitee, TimeMs now)
    : m_id(id)
    , m_creator(creator)
    , m_created(now)
    , m_invitee(invitee)
{
    if (creator == invitee)
        throw ValidationError("Can't invite yourself to a conversation");
    m_participants.insert(creator);
    m_members.insert(creator);
}

ConversationState Conversation::state() const noexcept
{
    if (m_finished)
        return ConversationState::Finished;
    return m_invitee ? ConversationState::Requested : ConversationState::Active;
}

void Conversation::requireLive() const
{
    if (m_finished)
        throw ValidationError("Conversation " + m_id.str() + " is finished");
}

void Conversation::requireParticipant(PlayerId p, const char* action) const
{
    requireLive();
    if (!isParticipant(p))
        throw ValidationError(std::string("Player ") + p.str() + " can't " + action +
                              ": not a participant of " + m_id.str());
}

void Conversation::markFinished(TimeMs now)
{
    m_finished = true;
    m_finishedAt = now;
    m_participants.clear();
    m_typing.clear();
    m_invitee.reset();
}

void Conversation::accept(PlayerId p, TimeMs /*now*/)
{
    requireLive();
    if (!isInvitee(p))
        throw ValidationError("Player " + p.str() + " was not invited to " + m_id.str());
    m_invitee.reset();
    m_participants.insert(p);
    m_members.insert(p);
}

void Conversation::setTyping(PlayerId p, bool typing, TimeMs now)
{
    requireParticipant(p, "type");
    if (typing)
        m_typing[p] = now;
    else
        m_typing.erase(p);
}

void Conversation::sendMessage(PlayerId p, std::string text, TimeMs now)
{
    requireParticipant(p, "send a message");
    if (text.empty())
        throw ValidationError("Message text must not be empty");

    m_lastMessage = Message{ p, std::move(text), now };
    ++m_numMessages;
    m_typing.erase(p);
}

bool Conversation::leave(PlayerId p, TimeMs now)
{
    requireParticipant(p, "leave");
    m_participants.erase(p);
    m_typing.erase(p);
    if (m_participants.empty())
    {
        markFinished(now);
        return true;
    }
    return false;
}

void Conversation::finish(PlayerId p, TimeMs now)
{
    requireParticipant(p, "finish");
    markFinished(now);
}

void Conversation::forceFinish(TimeMs now)
{
    if (!m_finished)
        markFinished(now);
}

std::size_t Conversation::expireTyping(TimeMs now, TimeMs timeout)
{
    std::size_t dropped = 0;
    for (auto it = m_typing.begin(); it != m_typing.end();)
    {
        if (now - it->second > timeout)
        {
            it = m_typing.erase(it);
            ++dropped;
        }
        else
        {
            ++it;
        }
    }
    return dropped;
}

json Conversation::toJson() const
{
    json typing = json::array();
    for (const auto& [p, since] : m_typing)
        typing.push_back({ {"playerId", p}, {"since", since} });

    json j = {
        {"id", m_id},
        {"creator", m_creator},
        {"created", m_created},
        {"participants", m_participants},
        {"typing", std::move(typing)},
        {"members", m_members},
        {"numMessages", m_numMessages},
        {"finished", m_finished},
    };
    if (m_invitee)
        j["invitee"] = *m_invitee;
    if (m_finishedAt)
        j["finishedAt"] = *m_finishedAt;
    if (m_lastMessage)
        j["lastMessage"] = { {"author", m_lastMessage->author},
                             {"text", m_lastMessage->text},
                             {"timestamp", m_lastMessage->timestamp} };
    return j;
}

Conversation Conversation::fromJson(const json& j)
{
    using namespace core::json_util;

    Conversation c;
    c.m_id      = j.at("id").get<ConversationId>();
    c.m_creator = j.at("creator").get<PlayerId>();
    c.m_created = ObjInt64(j, "created", 0);

    for (const auto& p : j.at("participants"))
        c.m_participants.insert(p.get<PlayerId>());
    if (const json* t = ObjFind(j, "typing"); t && t->is_array())
        for (const auto& e : *t)
            c.m_typing[e.at("playerId").get<PlayerId>()] = ObjInt64(e, "since", 0);
    if (const json* m = ObjFind(j, "members"); m && m->is_array())
        for (const auto& p : *m)
            c.m_members.insert(p.get<PlayerId>());
    c.m_members.insert(c.m_participants.begin(), c.m_participants.end());

    if (const json* inv = ObjFind(j, "invitee"))
        c.m_invitee = inv->get<PlayerId>();
    if (const json* lm = ObjFind(j, "lastMessage"))
        c.m_lastMessage = Message{ lm->at("author").get<PlayerId>(),
                                   ObjString(*lm, "text", ""),
                                   ObjInt64(*lm, "timestamp", 0) };

    c.m_numMessages = ObjInt64(j, "numMessages", 0);
    c.m_finished    = ObjBool(j, "finished", false);
    if (const json* fa = ObjFind(j, "finishedAt"))
        c.m_finishedAt = SafeInt64(*fa, 0);

    if (c.m_finished)
    {
        c.m_participants.clear();
        c.m_typing.clear();
        c.m_invitee.reset();
    }
    return c;
}

} // namespace townsim::world
