#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"
#include "townsim/world/Agent.hpp"
#include "townsim/world/Conversation.hpp"
#include "townsim/world/Events.hpp"
#include "townsim/world/Ids.hpp"
#include "townsim/world/Player.hpp"
#include "townsim/world/WorldMap.hpp"

namespace townsim::world {

using core::TimeMs;

struct ArchivedPlayer {
    Player      player;
    std::string reason;
    TimeMs      archivedAt = 0;
};

struct ArchivedAgent {
    Agent       agent;
    std::string reason;
    TimeMs      archivedAt = 0;
};

struct JoinParams {
    std::string                name;
    std::optional<std::string> zone;
    std::optional<Vec2>        position;
    std::optional<std::string> humanToken;
};

// One simulated environment. A value type: the engine copies it to apply an
// input and swaps the copy in on success. The static map is shared between
// copies.
//
// Mutators validate first and throw core::ValidationError with the world
// unchanged when a reference or actor is invalid.
class World {
public:
    World();
    explicit World(std::shared_ptr<const WorldMap> map);

    template <char P>
    [[nodiscard]] GameId<P> allocId() { return GameId<P>{ m_nextId++ }; }
    [[nodiscard]] std::int64_t nextId() const noexcept { return m_nextId; }

    [[nodiscard]] const WorldMap& map() const noexcept { return *m_map; }
    [[nodiscard]] const std::shared_ptr<const WorldMap>& mapPtr() const noexcept { return m_map; }

    // ---- lookup ------------------------------------------------------------
    [[nodiscard]] const std::map<PlayerId, Player>& players() const noexcept { return m_players; }
    [[nodiscard]] std::map<PlayerId, Player>& players() noexcept { return m_players; }
    [[nodiscard]] const std::map<AgentId, Agent>& agents() const noexcept { return m_agents; }
    [[nodiscard]] std::map<AgentId, Agent>& agents() noexcept { return m_agents; }
    [[nodiscard]] const std::map<ConversationId, Conversation>& conversations() const noexcept { return m_conversations; }
    [[nodiscard]] std::map<ConversationId, Conversation>& conversations() noexcept { return m_conversations; }
    [[nodiscard]] const std::map<PlayerId, ArchivedPlayer>& archivedPlayers() const noexcept { return m_archivedPlayers; }
    [[nodiscard]] const std::map<AgentId, ArchivedAgent>& archivedAgents() const noexcept { return m_archivedAgents; }

    [[nodiscard]] const Player* findPlayer(PlayerId id) const;
    [[nodiscard]] Player* findPlayer(PlayerId id);
    Player& player(PlayerId id);                       // throws ValidationError

    [[nodiscard]] const Agent* findAgent(AgentId id) const;
    [[nodiscard]] Agent* findAgent(AgentId id);
    Agent& agent(AgentId id);                          // throws ValidationError
    [[nodiscard]] const Agent* agentForPlayer(PlayerId id) const;
    [[nodiscard]] Agent* agentForPlayer(PlayerId id);

    [[nodiscard]] const Conversation* findConversation(ConversationId id) const;
    Conversation& conversation(ConversationId id);     // throws ValidationError
    // Live conversation the player participates in or is invited to.
    [[nodiscard]] const Conversation* conversationFor(PlayerId id) const;

    // Tiles occupied by players other than `except`.
    [[nodiscard]] std::vector<pf::IVec2> occupiedTiles(std::optional<PlayerId> except = std::nullopt) const;

    // ---- players and agents -------------------------------------------------
    PlayerId join(const JoinParams& params, TimeMs now);
    std::pair<AgentId, PlayerId> createAgent(const std::string& name,
                                             const std::string& personality,
                                             const std::optional<std::string>& zone,
                                             const std::optional<std::string>& ownerId,
                                             TimeMs now);

    // Archival keeps the record for history; the entity stops taking part in
    // the simulation. Archiving an agent's player archives the agent too.
    void archivePlayer(PlayerId id, const std::string& reason, TimeMs now);
    void archiveAgent(AgentId id, const std::string& reason, TimeMs now);

    // nullopt stops the player.
    void moveTo(PlayerId id, std::optional<pf::IVec2> destination, TimeMs now);
    void startActivity(PlayerId id, std::string description, std::string emoji, TimeMs durationMs, TimeMs now);

    // ---- agent operations ---------------------------------------------------
    OperationId startOperation(AgentId id, const std::string& name, TimeMs now);
    // Both return false (no change) when `op` is not the agent's current operation.
    bool finishOperation(AgentId id, OperationId op, TimeMs now);
    bool clearOperation(AgentId id, OperationId op, const std::string& reason, TimeMs now);

    // ---- conversations ------------------------------------------------------
    ConversationId startConversation(PlayerId creator, PlayerId invitee, TimeMs now);
    void acceptInvite(PlayerId p, ConversationId c, TimeMs now);
    void rejectInvite(PlayerId p, ConversationId c, TimeMs now);
    void setTyping(PlayerId p, ConversationId c, bool typing, TimeMs now);
    void sendMessage(PlayerId p, ConversationId c, std::string text, TimeMs now);
    void leaveConversation(PlayerId p, ConversationId c, TimeMs now);
    void finishConversation(PlayerId p, ConversationId c, TimeMs now);

    // ---- events / checks / persistence --------------------------------------
    [[nodiscard]] evt::Outbox& outbox() noexcept { return m_outbox; }
    [[nodiscard]] const evt::Outbox& outbox() const noexcept { return m_outbox; }

    // Empty when every structural invariant holds.
    [[nodiscard]] std::vector<std::string> checkInvariants() const;

    [[nodiscard]] nlohmann::json toJson() const;
    // Throws nlohmann::json::exception or core::ValidationError.
    [[nodiscard]] static World fromJson(const nlohmann::json& j, std::shared_ptr<const WorldMap> map);

private:
    [[nodiscard]] Vec2 pickSpawn(const std::optional<std::string>& zone, std::int64_t salt) const;
    [[nodiscard]] bool tileFree(pf::IVec2 t) const;
    void requireAvailable(PlayerId p) const;
    void onConversationFinished(const Conversation& c, TimeMs now);
    void leaveAllConversations(PlayerId p, TimeMs now);

    std::shared_ptr<const WorldMap> m_map;
    std::int64_t m_nextId = 0;

    std::map<PlayerId, Player>             m_players;
    std::map<AgentId, Agent>               m_agents;
    std::map<ConversationId, Conversation> m_conversations;
    std::map<PlayerId, ArchivedPlayer>     m_archivedPlayers;
    std::map<AgentId, ArchivedAgent>       m_archivedAgents;

    evt::Outbox m_outbox;
};

} // namespace townsim::world
