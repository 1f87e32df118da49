#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"
#include "townsim/pathfinding/GridTypes.hpp"
#include "townsim/world/Geometry.hpp"
#include "townsim/world/Ids.hpp"

namespace townsim::world { class World; }

namespace townsim::engine {

using core::TimeMs;
using world::AgentId;
using world::ConversationId;
using world::OperationId;
using world::PlayerId;

// One struct per command name; arguments are parsed and type-checked when the
// input is submitted, so a queued input is always well-formed.
namespace cmd {

struct Join {
    static constexpr const char* kName = "join";
    std::string                 name;
    std::optional<std::string>  zone;
    std::optional<world::Vec2>  position;
    std::optional<std::string>  humanToken;
};

struct Leave {
    static constexpr const char* kName = "leave";
    PlayerId    playerId;
    std::string reason = "left";
};

struct MoveTo {
    static constexpr const char* kName = "moveTo";
    PlayerId                 playerId;
    std::optional<pf::IVec2> destination; // nullopt = stop
};

struct StartActivity {
    static constexpr const char* kName = "startActivity";
    PlayerId    playerId;
    std::string description;
    std::string emoji;
    TimeMs      durationMs = 0;
};

struct CreateAgent {
    static constexpr const char* kName = "createAgent";
    std::string                name;
    std::string                personality;
    std::optional<std::string> zone;
    std::optional<std::string> ownerId;
};

struct ArchiveAgent {
    static constexpr const char* kName = "archiveAgent";
    AgentId     agentId;
    std::string reason;
};

struct StartOperation {
    static constexpr const char* kName = "startOperation";
    AgentId     agentId;
    std::string name;
};

struct ActivitySpec {
    std::string description;
    std::string emoji;
    TimeMs      durationMs = 0;
};

struct FinishOperation {
    static constexpr const char* kName = "finishOperation";
    AgentId                     agentId;
    OperationId                 operationId;
    std::optional<pf::IVec2>    destination;
    std::optional<PlayerId>     invitee;
    std::optional<ActivitySpec> activity;
};

struct ClearOperation {
    static constexpr const char* kName = "clearOperation";
    AgentId     agentId;
    OperationId operationId;
    std::string reason;
};

struct StartConversation {
    static constexpr const char* kName = "startConversation";
    PlayerId playerId;
    PlayerId inviteeId;
};

struct AcceptInvite {
    static constexpr const char* kName = "acceptInvite";
    PlayerId       playerId;
    ConversationId conversationId;
};

struct RejectInvite {
    static constexpr const char* kName = "rejectInvite";
    PlayerId       playerId;
    ConversationId conversationId;
};

struct SetTyping {
    static constexpr const char* kName = "setTyping";
    PlayerId       playerId;
    ConversationId conversationId;
    bool           typing = true;
};

struct SendMessage {
    static constexpr const char* kName = "sendMessage";
    PlayerId       playerId;
    ConversationId conversationId;
    std::string    text;
};

struct LeaveConversation {
    static constexpr const char* kName = "leaveConversation";
    PlayerId       playerId;
    ConversationId conversationId;
};

struct FinishConversation {
    static constexpr const char* kName = "finishConversation";
    PlayerId       playerId;
    ConversationId conversationId;
};

} // namespace cmd

using Command = std::variant<
    cmd::Join,
    cmd::Leave,
    cmd::MoveTo,
    cmd::StartActivity,
    cmd::CreateAgent,
    cmd::ArchiveAgent,
    cmd::StartOperation,
    cmd::FinishOperation,
    cmd::ClearOperation,
    cmd::StartConversation,
    cmd::AcceptInvite,
    cmd::RejectInvite,
    cmd::SetTyping,
    cmd::SendMessage,
    cmd::LeaveConversation,
    cmd::FinishConversation
>;

[[nodiscard]] const char* CommandName(const Command& c) noexcept;

// Throws core::ValidationError for unknown names or malformed arguments.
[[nodiscard]] Command ParseCommand(const std::string& name, const nlohmann::json& args);

// Applies one command to `world` and returns its result value.
// Throws core::ValidationError (world may be partially modified; callers
// apply to a scratch copy).
nlohmann::json ApplyCommand(world::World& world, const Command& c, TimeMs now);

} // namespace townsim::engine
