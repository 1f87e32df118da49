#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "townsim/core/Clock.hpp"
#include "townsim/world/Ids.hpp"

// Delivered through entt::dispatcher after the mutation that produced them has
// been committed. `worldId` is filled in by the engine.
namespace townsim::evt {

using core::TimeMs;

struct InputCompleted {
    std::string  worldId;
    std::int64_t inputNumber = 0;
    std::string  name;
    bool         ok = false;
    std::string  error;
};

struct ConversationFinished {
    std::string                  worldId;
    world::ConversationId        conversation;
    std::vector<world::PlayerId> members;
    std::int64_t                 numMessages = 0;
    TimeMs                       at = 0;
};

struct EntityArchived {
    std::string worldId;
    std::string entityId;  // rendered id ("p:3" / "a:4")
    std::string reason;
    TimeMs      at = 0;
};

struct AgentOperationStuck {
    std::string        worldId;
    world::AgentId     agent;
    world::OperationId operation;
    std::string        name;
    TimeMs             started = 0;
    TimeMs             detectedAt = 0;
};

// Mutations append here; the engine drains it after commit so a failed
// input never leaks events.
struct Outbox {
    std::vector<ConversationFinished> finished;
    std::vector<EntityArchived>       archived;
    std::vector<AgentOperationStuck>  stuck;

    [[nodiscard]] bool empty() const noexcept
    {
        return finished.empty() && archived.empty() && stuck.empty();
    }
    void clear()
    {
        finished.clear();
        archived.clear();
        stuck.clear();
    }
};

} // namespace townsim::evt
