#pragma once

#include <optional>
#include <string>

#include "townsim/core/Clock.hpp"
#include "townsim/world/Ids.hpp"

namespace townsim::world {

using core::TimeMs;

// An asynchronous decision the agent's policy is working on. While one is in
// progress no other operation may start for that agent.
struct Operation {
    std::string name;
    OperationId id;
    TimeMs      started = 0;
    bool        flaggedStuck = false;
};

struct Agent {
    AgentId                    id;
    PlayerId                   playerId;
    std::string                personality;  // CRIMINAL, GAMBLER, WORKER, ...
    std::optional<std::string> ownerId;      // external record that keeps this agent alive

    std::optional<Operation> operation;
    TimeMs                   lastInviteAttempt = 0;
    std::optional<TimeMs>    lastConversation;
};

} // namespace townsim::world
