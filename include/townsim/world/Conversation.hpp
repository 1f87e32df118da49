#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"
#include "townsim/world/Ids.hpp"

namespace townsim::world {

using core::TimeMs;

enum class ConversationState : std::uint8_t {
    Requested, // creator waiting on the invitee
    Active,    // invitee accepted
    Finished,  // terminal
};

[[nodiscard]] const char* ConversationStateName(ConversationState s) noexcept;

struct Message {
    PlayerId    author;
    std::string text;
    TimeMs      timestamp = 0;
};

// Invite/accept/message/leave/finish protocol for one conversation.
// Every transition validates the actor first and throws core::ValidationError
// without touching state when it is not allowed. Cross-conversation rules
// (one live conversation per player) are enforced by World.
class Conversation {
public:
    Conversation() = default;
    Conversation(ConversationId id, PlayerId creator, PlayerId invitee, TimeMs now);

    [[nodiscard]] ConversationId id() const noexcept { return m_id; }
    [[nodiscard]] PlayerId creator() const noexcept { return m_creator; }
    [[nodiscard]] TimeMs created() const noexcept { return m_created; }
    [[nodiscard]] ConversationState state() const noexcept;
    [[nodiscard]] bool finished() const noexcept { return m_finished; }
    [[nodiscard]] std::optional<TimeMs> finishedAt() const noexcept { return m_finishedAt; }

    [[nodiscard]] const std::set<PlayerId>& participants() const noexcept { return m_participants; }
    [[nodiscard]] const std::optional<PlayerId>& invitee() const noexcept { return m_invitee; }
    [[nodiscard]] const std::map<PlayerId, TimeMs>& typing() const noexcept { return m_typing; }
    [[nodiscard]] const std::set<PlayerId>& members() const noexcept { return m_members; }
    [[nodiscard]] const std::optional<Message>& lastMessage() const noexcept { return m_lastMessage; }
    [[nodiscard]] std::int64_t numMessages() const noexcept { return m_numMessages; }

    [[nodiscard]] bool isParticipant(PlayerId p) const { return m_participants.count(p) != 0; }
    [[nodiscard]] bool isInvitee(PlayerId p) const { return m_invitee && *m_invitee == p; }
    // Participant or pending invitee of a conversation that is still live.
    [[nodiscard]] bool involves(PlayerId p) const { return !m_finished && (isParticipant(p) || isInvitee(p)); }

    void accept(PlayerId p, TimeMs now);
    void setTyping(PlayerId p, bool typing, TimeMs now);
    void sendMessage(PlayerId p, std::string text, TimeMs now);
    // Removes a participant; finishes the conversation when nobody is left.
    // Returns true if this call finished it.
    bool leave(PlayerId p, TimeMs now);
    void finish(PlayerId p, TimeMs now);

    // Finish without an actor (archival of a participant).
    void forceFinish(TimeMs now);

    // Drops typing markers older than `timeout`. Returns how many were dropped.
    std::size_t expireTyping(TimeMs now, TimeMs timeout);

    [[nodiscard]] nlohmann::json toJson() const;
    [[nodiscard]] static Conversation fromJson(const nlohmann::json& j);

private:
    void requireLive() const;
    void requireParticipant(PlayerId p, const char* action) const;
    void markFinished(TimeMs now);

    ConversationId m_id;
    PlayerId       m_creator;
    TimeMs         m_created = 0;

    std::set<PlayerId>         m_participants;
    std::optional<PlayerId>    m_invitee;
    std::map<PlayerId, TimeMs> m_typing;
    std::set<PlayerId>         m_members;

    std::optional<Message> m_lastMessage;
    std::int64_t           m_numMessages = 0;

    bool                  m_finished = false;
    std::optional<TimeMs> m_finishedAt;
};

} // namespace townsim::world
