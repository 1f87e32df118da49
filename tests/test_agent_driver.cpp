#include <doctest/doctest.h>

#include "townsim/server/AgentDriver.hpp"
#include "townsim/server/DialoguePolicy.hpp"
#include "test_support/TestHelpers.hpp"

#include <string>
#include <vector>

using namespace townsim;
using json = nlohmann::json;

namespace {

struct FinishedLog {
    std::vector<evt::ConversationFinished> finished;
    void on(const evt::ConversationFinished& e) { finished.push_back(e); }
};

core::DriverConfig ChattyConfig()
{
    core::DriverConfig cfg;
    cfg.enabled = true;
    cfg.seed = 42;
    cfg.inviteProbability = 1.0;
    cfg.acceptProbability = 1.0;
    cfg.maxConversationMessages = 4;
    cfg.messageCooldownMs = 0;
    cfg.activityDurationMs = 60'000;
    return cfg;
}

void AddAgents(engine::Engine& eng, core::ManualClock& clock, int n)
{
    for (int i = 0; i < n; ++i)
        eng.submit("createAgent", json{ {"name", "Bot" + std::to_string(i)}, {"personality", "WORKER"} });
    eng.runStep(clock.now());
}

// One driver pass followed by one engine tick.
server::DriveStats Round(server::AgentDriver& driver, engine::Engine& eng, core::ManualClock& clock)
{
    clock.advance(eng.config().tickMs);
    const auto stats = driver.drive(eng, clock.now());
    eng.runStep(clock.now());
    return stats;
}

// One agent (p:0, a:1) and one human player (p:2) nobody drives.
world::PlayerId AddAgentAndHuman(engine::Engine& eng, core::ManualClock& clock)
{
    AddAgents(eng, clock, 1);
    clock.advance(eng.config().tickMs);
    eng.submit("join", json{ {"name", "Hu"}, {"humanToken", "tok-hu"} });
    eng.runStep(clock.now());
    return world::PlayerId{ 2 };
}

// Starts the driver's operation by hand at `t` and returns the arguments of
// the finishOperation the driver answers with.
json FollowUpAt(server::AgentDriver& driver, engine::Engine& eng, core::ManualClock& clock,
                world::AgentId aid, TimeMs t)
{
    clock.set(t);
    eng.submit("startOperation", json{ {"agentId", aid.str()}, {"name", server::AgentDriver::kOperationName} });
    eng.runStep(t);
    driver.drive(eng, t);

    const auto pending = eng.pendingInputs();
    REQUIRE(pending.size() == 1);
    CHECK(pending[0].name == "finishOperation");
    eng.runStep(t + eng.config().tickMs);
    return pending[0].args;
}

} // namespace

TEST_CASE("AgentDriver/IdleAgentStartsThenFinishesOperation")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    AddAgents(eng, clock, 1);
    const world::AgentId aid = eng.snapshot()->agents().begin()->first;

    core::DriverConfig cfg = ChattyConfig();
    cfg.inviteProbability = 0.0;
    server::TemplateDialoguePolicy dialogue;
    server::AgentDriver driver(cfg, dialogue);

    clock.advance(100);
    auto stats = driver.drive(eng, clock.now());
    CHECK(stats.submitted == 1);
    CHECK(eng.pendingInputs().front().name == "startOperation");

    // No second command while the first is unresolved.
    CHECK(driver.drive(eng, clock.now()).submitted == 0);

    eng.runStep(clock.now());
    REQUIRE(eng.snapshot()->findAgent(aid)->operation.has_value());

    clock.advance(100);
    stats = driver.drive(eng, clock.now());
    CHECK(stats.submitted == 1);

    // With nobody to invite the follow-up is either a walk or an activity.
    const auto pending = eng.pendingInputs();
    REQUIRE(pending.size() == 1);
    CHECK(pending[0].name == "finishOperation");
    CHECK((pending[0].args.contains("destination") || pending[0].args.contains("activity")));

    eng.runStep(clock.now());
    CHECK(eng.input(pending[0].number)->outcome->ok);
    CHECK_FALSE(eng.snapshot()->findAgent(aid)->operation.has_value());
}

TEST_CASE("AgentDriver/ForeignOperationsAreLeftAlone")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    AddAgents(eng, clock, 1);
    const world::AgentId aid = eng.snapshot()->agents().begin()->first;

    clock.advance(100);
    eng.submit("startOperation", json{ {"agentId", aid.str()}, {"name", "remember"} });
    eng.runStep(clock.now());

    server::TemplateDialoguePolicy dialogue;
    server::AgentDriver driver(ChattyConfig(), dialogue);
    CHECK(Round(driver, eng, clock).submitted == 0);
}

TEST_CASE("AgentDriver/TwoAgentsHoldAConversation")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    FinishedLog log;
    eng.dispatcher().sink<evt::ConversationFinished>().connect<&FinishedLog::on>(log);
    AddAgents(eng, clock, 2);

    server::TemplateDialoguePolicy dialogue;
    server::AgentDriver driver(ChattyConfig(), dialogue);

    for (int i = 0; i < 40 && log.finished.empty(); ++i)
        Round(driver, eng, clock);

    REQUIRE(log.finished.size() == 1);
    CHECK(log.finished[0].numMessages == 4);
    CHECK(log.finished[0].members.size() == 2);

    const auto snap = eng.snapshot();
    CHECK(snap->checkInvariants().empty());
    for (const auto& [id, a] : snap->agents())
        CHECK(a.lastConversation.has_value());
}

TEST_CASE("AgentDriver/UnansweredInviteIsWithdrawn")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    const world::PlayerId human = AddAgentAndHuman(eng, clock);
    const world::PlayerId bot{ 0 };

    core::DriverConfig cfg = ChattyConfig();
    cfg.inviteTimeoutMs = 1000;
    server::TemplateDialoguePolicy dialogue;
    server::AgentDriver driver(cfg, dialogue);

    Round(driver, eng, clock); // startOperation
    Round(driver, eng, clock); // finishOperation inviting the human
    const auto invited = eng.snapshot();
    const world::Conversation* c = invited->conversationFor(human);
    REQUIRE(c != nullptr);
    CHECK(c->state() == world::ConversationState::Requested);
    CHECK(c->creator() == bot);

    // Inside the timeout the agent keeps waiting.
    CHECK(Round(driver, eng, clock).submitted == 0);

    clock.advance(cfg.inviteTimeoutMs);
    CHECK(Round(driver, eng, clock).submitted == 1);

    const auto snap = eng.snapshot();
    CHECK(snap->conversationFor(human) == nullptr);
    CHECK(snap->conversationFor(bot) == nullptr);
    CHECK(snap->findAgent(world::AgentId{ 1 })->lastConversation.has_value());
}

TEST_CASE("AgentDriver/ConversationEndsAfterMaxDuration")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    const world::PlayerId human = AddAgentAndHuman(eng, clock);
    const world::PlayerId bot{ 0 };

    core::DriverConfig cfg = ChattyConfig();
    cfg.maxConversationMessages = 100;
    cfg.awkwardTimeoutMs = 1'000'000;
    cfg.maxConversationDurationMs = 2000;
    server::TemplateDialoguePolicy dialogue;
    server::AgentDriver driver(cfg, dialogue);

    Round(driver, eng, clock);
    Round(driver, eng, clock);
    const auto invited = eng.snapshot();
    const world::Conversation* c = invited->conversationFor(human);
    REQUIRE(c != nullptr);
    const world::ConversationId cid = c->id();
    const TimeMs created = c->created();

    clock.advance(100);
    eng.submit("acceptInvite", json{ {"playerId", human.str()}, {"conversationId", cid.str()} });
    eng.runStep(clock.now());

    CHECK(Round(driver, eng, clock).submitted == 1); // opener
    CHECK(eng.snapshot()->conversations().at(cid).numMessages() == 1);

    // The human never answers; within the limit the agent just waits.
    CHECK(Round(driver, eng, clock).submitted == 0);

    clock.set(created + cfg.maxConversationDurationMs);
    CHECK(Round(driver, eng, clock).submitted == 1);

    const auto snap = eng.snapshot();
    CHECK(snap->conversationFor(bot) == nullptr);
    CHECK(snap->conversationFor(human) != nullptr);
}

TEST_CASE("AgentDriver/InvitesWaitForCooldowns")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    const world::PlayerId human = AddAgentAndHuman(eng, clock);
    const world::AgentId aid{ 1 };

    core::DriverConfig cfg = ChattyConfig();
    cfg.awkwardTimeoutMs = 1'000'000;
    cfg.conversationCooldownMs = 1000;
    cfg.playerConversationCooldownMs = 5000;
    server::TemplateDialoguePolicy dialogue;
    server::AgentDriver driver(cfg, dialogue);

    Round(driver, eng, clock); // 200: startOperation
    Round(driver, eng, clock); // 300: invite
    const auto invited = eng.snapshot();
    const world::Conversation* c = invited->conversationFor(human);
    REQUIRE(c != nullptr);
    const world::ConversationId cid = c->id();

    clock.advance(100);        // 400
    eng.submit("acceptInvite", json{ {"playerId", human.str()}, {"conversationId", cid.str()} });
    eng.runStep(clock.now());
    Round(driver, eng, clock); // 500: opener, pair seen together

    clock.advance(100);        // 600
    eng.submit("finishConversation", json{ {"playerId", human.str()}, {"conversationId", cid.str()} });
    eng.runStep(clock.now());
    REQUIRE(eng.snapshot()->findAgent(aid)->lastConversation == TimeMs{ 600 });

    // Agent cooldown: no invite right after a conversation.
    CHECK_FALSE(FollowUpAt(driver, eng, clock, aid, 1200).contains("invitee"));
    // Agent cooldown over, but the only candidate is the last partner.
    CHECK_FALSE(FollowUpAt(driver, eng, clock, aid, 3000).contains("invitee"));
    // Both cooldowns over.
    const json args = FollowUpAt(driver, eng, clock, aid, 6000);
    REQUIRE(args.contains("invitee"));
    CHECK(args.at("invitee") == human.str());
}

TEST_CASE("AgentDriver/SameSeedSameWorld")
{
    auto run = [](std::uint64_t seed) {
        core::ManualClock clock(0);
        engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
        AddAgents(eng, clock, 3);

        core::DriverConfig cfg = ChattyConfig();
        cfg.seed = seed;
        cfg.inviteProbability = 0.3;
        cfg.acceptProbability = 0.5;
        server::TemplateDialoguePolicy dialogue;
        server::AgentDriver driver(cfg, dialogue);
        for (int i = 0; i < 30; ++i)
            Round(driver, eng, clock);
        return eng.snapshot()->toJson();
    };

    CHECK(run(7) == run(7));
}

TEST_CASE("AgentDriver/RateLimitIsCountedNotThrown")
{
    core::ManualClock clock(0);
    core::EngineConfig cfg = test::test_engine_config();
    cfg.maxPendingInputs = 1;
    engine::Engine eng("w", test::make_world(), cfg, clock);
    eng.submit("createAgent", json{ {"name", "A"}, {"personality", "WORKER"} });
    eng.runStep(0);
    clock.set(100);
    eng.submit("createAgent", json{ {"name", "B"}, {"personality", "WORKER"} });
    eng.runStep(100);

    server::TemplateDialoguePolicy dialogue;
    server::AgentDriver driver(ChattyConfig(), dialogue);
    clock.set(200);
    const auto stats = driver.drive(eng, clock.now());
    CHECK(stats.submitted == 1);
    CHECK(stats.rejected == 1);
}

TEST_CASE("DialoguePolicy/LinesFollowPersonalityAndTurn")
{
    server::TemplateDialoguePolicy policy;

    server::DialogueContext ctx;
    ctx.speaker = "Rex";
    ctx.personality = "GAMBLER";
    ctx.partner = "Ann";

    const std::string opener = policy.compose(ctx);
    CHECK(opener == policy.compose(ctx));
    CHECK(opener.find("{partner}") == std::string::npos);

    policy.setLines("POET", { "Hello {partner}, {partner}!" }, { "Verse." }, { "Farewell." });
    ctx.personality = "POET";
    CHECK(policy.compose(ctx) == "Hello Ann, Ann!");
    ctx.messageIndex = 3;
    CHECK(policy.compose(ctx) == "Verse.");
    ctx.closing = true;
    CHECK(policy.compose(ctx) == "Farewell.");

    // Unknown personalities fall back to the default lines.
    ctx.personality = "UNKNOWN";
    ctx.closing = false;
    CHECK_FALSE(policy.compose(ctx).empty());
}
