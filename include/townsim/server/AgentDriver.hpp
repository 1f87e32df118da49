#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <utility>
#include <string>

#include <nlohmann/json.hpp>

#include "townsim/core/Clock.hpp"
#include "townsim/core/Config.hpp"
#include "townsim/engine/Engine.hpp"
#include "townsim/server/DialoguePolicy.hpp"
#include "townsim/world/World.hpp"

namespace townsim::server {

using core::TimeMs;

struct DriveStats {
    int submitted = 0;
    int rejected = 0;    // submit threw (rate limit, validation)
};

// Stand-in for the agents' decision loop. Reads the published snapshot and
// submits ordinary commands; it never touches world state directly.
//
// Idle agents start an operation; the next pass finishes it with a wander
// destination, an activity or an invitee. Invited agents answer, agents in a
// conversation take turns talking and leave after a fixed number of messages.
// Unanswered invites are withdrawn after inviteTimeoutMs and no conversation
// outlasts maxConversationDurationMs. Invitees are only chosen outside the
// agent's own cooldown and the pair's cooldown.
class AgentDriver {
public:
    static constexpr const char* kOperationName = "agentDoSomething";

    AgentDriver(const core::DriverConfig& cfg, const DialoguePolicy& dialogue);

    DriveStats drive(engine::Engine& e, TimeMs now);

private:
    struct WorldState {
        std::mt19937_64                   rng;
        std::map<std::int64_t, std::int64_t> inflight;   // agent id -> input number
        // Player pair (lower id first) -> last pass they shared a conversation.
        std::map<std::pair<std::int64_t, std::int64_t>, TimeMs> lastTogether;
    };

    WorldState& stateFor(const std::string& worldId);

    void driveAgent(engine::Engine& e, WorldState& ws, const world::World& w,
                    const world::Agent& a, TimeMs now, DriveStats& stats);

    void submit(engine::Engine& e, WorldState& ws, const world::Agent& a,
                const char* name, nlohmann::json args, DriveStats& stats);

    void driveConversation(engine::Engine& e, WorldState& ws, const world::World& w,
                           const world::Agent& a, const world::Player& p,
                           const world::Conversation& c, TimeMs now, DriveStats& stats);

    [[nodiscard]] nlohmann::json chooseFollowUp(WorldState& ws, const world::World& w,
                                                const world::Agent& a, TimeMs now);
    [[nodiscard]] bool mayInvite(const world::Agent& a, TimeMs now) const;
    [[nodiscard]] bool pairCoolingDown(const WorldState& ws, world::PlayerId a, world::PlayerId b,
                                       TimeMs now) const;

    [[nodiscard]] double roll(WorldState& ws);

    core::DriverConfig    m_cfg;
    const DialoguePolicy& m_dialogue;

    std::mutex                        m_mutex;
    std::map<std::string, WorldState> m_worlds;
};

} // namespace townsim::server
