#include <doctest/doctest.h>

#include "townsim/core/Errors.hpp"
#include "townsim/engine/Commands.hpp"
#include "test_support/TestHelpers.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace townsim;
using json = nlohmann::json;

namespace {

json Apply(world::World& w, const std::string& name, const json& args, core::TimeMs now = 0)
{
    return engine::ApplyCommand(w, engine::ParseCommand(name, args), now);
}

} // namespace

TEST_CASE("Commands/ParseRejectsUnknownNames")
{
    CHECK_THROWS_AS((void)engine::ParseCommand("teleport", json::object()), core::ValidationError);
    CHECK_THROWS_AS((void)engine::ParseCommand("", json::object()), core::ValidationError);
}

TEST_CASE("Commands/ParseValidatesArguments")
{
    using engine::ParseCommand;

    // Missing, mistyped and malformed arguments.
    CHECK_THROWS_AS((void)ParseCommand("join", json::object()), core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("join", json{ {"name", 7} }), core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("join", json::array({ "Ann" })), core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("moveTo", json{ {"playerId", "a:1"} }), core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("moveTo", json{ {"playerId", "p:x"} }), core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("moveTo", json{ {"playerId", "p:1"}, {"destination", "north"} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("setTyping", json{ {"playerId", "p:1"}, {"conversationId", "c:2"} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("startActivity",
                                       json{ {"playerId", "p:1"}, {"description", "x"}, {"durationMs", "long"} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("finishOperation",
                                       json{ {"agentId", "a:1"}, {"operationId", "o:2"}, {"activity", 3} }),
                    core::ValidationError);

    // Optional arguments may be absent or null.
    const auto stop = ParseCommand("moveTo", json{ {"playerId", "p:1"}, {"destination", nullptr} });
    REQUIRE(std::holds_alternative<engine::cmd::MoveTo>(stop));
    CHECK_FALSE(std::get<engine::cmd::MoveTo>(stop).destination.has_value());

    const auto leave = ParseCommand("leave", json{ {"playerId", "p:4"} });
    CHECK(std::get<engine::cmd::Leave>(leave).reason == "left");
    CHECK(std::string(engine::CommandName(leave)) == "leave");
}

TEST_CASE("Commands/ParseRoundsTileCoordinates")
{
    const auto c = engine::ParseCommand("moveTo",
        json{ {"playerId", "p:1"}, {"destination", { {"x", 2.6}, {"y", 4.2} }} });
    const auto& mv = std::get<engine::cmd::MoveTo>(c);
    REQUIRE(mv.destination.has_value());
    CHECK(mv.destination->x == 3);
    CHECK(mv.destination->y == 4);
}

TEST_CASE("Commands/ParseRejectsOutOfRangeCoordinates")
{
    using engine::ParseCommand;
    const json wrapped = { {"x", 4294967301.0}, {"y", 3} };
    const json huge    = { {"x", 1}, {"y", -1e300} };
    const json nan     = { {"x", std::nan("")}, {"y", 1} };

    CHECK_THROWS_AS((void)ParseCommand("moveTo", json{ {"playerId", "p:1"}, {"destination", wrapped} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("moveTo", json{ {"playerId", "p:1"}, {"destination", json{ {"x", 4294967301LL}, {"y", 3} }} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("moveTo", json{ {"playerId", "p:1"}, {"destination", huge} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("moveTo", json{ {"playerId", "p:1"}, {"destination", nan} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("join", json{ {"name", "Ann"}, {"position", wrapped} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("finishOperation",
                                       json{ {"agentId", "a:1"}, {"operationId", "o:2"}, {"destination", huge} }),
                    core::ValidationError);

    // Large but representable coordinates still parse; the world decides if they are on the map.
    const auto far = ParseCommand("moveTo", json{ {"playerId", "p:1"}, {"destination", { {"x", 100000}, {"y", -7} }} });
    CHECK(std::get<engine::cmd::MoveTo>(far).destination->x == 100000);
    CHECK(std::get<engine::cmd::MoveTo>(far).destination->y == -7);
}

TEST_CASE("Commands/ParseCapsActivityDuration")
{
    using engine::ParseCommand;
    const json tooLong = json{ {"playerId", "p:1"}, {"description", "nap"},
                               {"durationMs", std::numeric_limits<std::int64_t>::max()} };
    CHECK_THROWS_AS((void)ParseCommand("startActivity", tooLong), core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("startActivity",
                                       json{ {"playerId", "p:1"}, {"description", "nap"}, {"durationMs", 1e30} }),
                    core::ValidationError);
    CHECK_THROWS_AS((void)ParseCommand("finishOperation",
                                       json{ {"agentId", "a:1"}, {"operationId", "o:2"},
                                             {"activity", { {"description", "nap"}, {"durationMs", core::kMaxActivityMs + 1} }} }),
                    core::ValidationError);

    const auto ok = ParseCommand("startActivity",
                                 json{ {"playerId", "p:1"}, {"description", "nap"}, {"durationMs", core::kMaxActivityMs} });
    CHECK(std::get<engine::cmd::StartActivity>(ok).durationMs == core::kMaxActivityMs);

    // Accepted durations never overflow the end time.
    world::World w = test::make_world();
    const auto pid = Apply(w, "join", json{ {"name", "Ann"} }).get<std::string>();
    Apply(w, "startActivity", json{ {"playerId", pid}, {"description", "nap"}, {"durationMs", core::kMaxActivityMs} },
          1000);
    const auto& p = w.players().at(*world::PlayerId::parse(pid));
    REQUIRE(p.activity.has_value());
    CHECK(p.activity->until == 1000 + core::kMaxActivityMs);
}

TEST_CASE("Commands/ApplyReturnsCreatedIds")
{
    world::World w = test::make_world();

    const json joined = Apply(w, "join", json{ {"name", "Ann"}, {"zone", "market"} });
    REQUIRE(joined.is_string());
    const auto pid = world::PlayerId::parse(joined.get<std::string>());
    REQUIRE(pid.has_value());
    CHECK(w.findPlayer(*pid)->zone == "market");

    const json agent = Apply(w, "createAgent", json{ {"name", "Bob"}, {"personality", "WORKER"} });
    REQUIRE(agent.is_object());
    const auto aid = world::AgentId::parse(agent.at("agentId").get<std::string>());
    REQUIRE(aid.has_value());
    CHECK(w.findAgent(*aid)->personality == "WORKER");

    const json op = Apply(w, "startOperation", json{ {"agentId", aid->str()}, {"name", "agentDoSomething"} });
    CHECK(world::OperationId::parse(op.get<std::string>()).has_value());

    // Unknown references fail at apply time, not parse time.
    CHECK_THROWS_AS(Apply(w, "moveTo", json{ {"playerId", "p:999"}, {"destination", { {"x", 1}, {"y", 1} }} }),
                    core::ValidationError);
}

TEST_CASE("Commands/FinishOperationCarriesOutFollowUp")
{
    world::World w = test::make_world();
    const auto [aid, pid] = w.createAgent("Bot", "GAMBLER", std::nullopt, std::nullopt, 0);
    const world::PlayerId other = w.join({ "Ann", std::nullopt, std::nullopt, std::nullopt }, 0);

    SUBCASE("invitee")
    {
        const auto op = w.startOperation(aid, "agentDoSomething", 0);
        Apply(w, "finishOperation", json{ {"agentId", aid.str()}, {"operationId", op.str()}, {"invitee", other.str()} }, 50);
        CHECK_FALSE(w.findAgent(aid)->operation.has_value());
        CHECK(w.findAgent(aid)->lastInviteAttempt == 50);
        const world::Conversation* c = w.conversationFor(other);
        REQUIRE(c != nullptr);
        CHECK(c->creator() == pid);
        CHECK(c->isInvitee(other));
    }

    SUBCASE("destination")
    {
        const auto op = w.startOperation(aid, "agentDoSomething", 0);
        Apply(w, "finishOperation", json{ {"agentId", aid.str()}, {"operationId", op.str()},
                                          {"destination", { {"x", 9}, {"y", 9} }} });
        REQUIRE(w.findPlayer(pid)->isMoving());
        CHECK(w.findPlayer(pid)->pathfinding->destination == pf::IVec2{ 9, 9 });
    }

    SUBCASE("activity")
    {
        const auto op = w.startOperation(aid, "agentDoSomething", 0);
        Apply(w, "finishOperation", json{ {"agentId", aid.str()}, {"operationId", op.str()},
                                          {"activity", { {"description", "reading"}, {"emoji", "📖"}, {"durationMs", 500} }} }, 100);
        REQUIRE(w.findPlayer(pid)->activity.has_value());
        CHECK(w.findPlayer(pid)->activity->until == 600);
    }

    SUBCASE("stale operation is a no-op")
    {
        const auto op = w.startOperation(aid, "agentDoSomething", 0);
        const world::OperationId stale{ op.n + 100 };
        const json r = Apply(w, "finishOperation", json{ {"agentId", aid.str()}, {"operationId", stale.str()},
                                                         {"invitee", other.str()} });
        CHECK(r.is_null());
        REQUIRE(w.findAgent(aid)->operation.has_value());
        CHECK(w.findAgent(aid)->operation->id == op);
        CHECK(w.conversationFor(other) == nullptr);
    }

    SUBCASE("busy invitee still releases the operation")
    {
        const world::PlayerId third = w.join({ "Cy", std::nullopt, std::nullopt, std::nullopt }, 0);
        (void)w.startConversation(other, third, 0);
        const auto op = w.startOperation(aid, "agentDoSomething", 0);
        Apply(w, "finishOperation", json{ {"agentId", aid.str()}, {"operationId", op.str()}, {"invitee", other.str()} });
        CHECK_FALSE(w.findAgent(aid)->operation.has_value());
        CHECK(w.conversationFor(pid) == nullptr);
    }
}

TEST_CASE("Commands/ConversationCommandsDriveTheProtocol")
{
    world::World w = test::make_world();
    const world::PlayerId a = w.join({ "Ann", std::nullopt, std::nullopt, std::nullopt }, 0);
    const world::PlayerId b = w.join({ "Bob", std::nullopt, std::nullopt, std::nullopt }, 0);

    const json cid = Apply(w, "startConversation", json{ {"playerId", a.str()}, {"inviteeId", b.str()} });
    const std::string c = cid.get<std::string>();

    Apply(w, "acceptInvite", json{ {"playerId", b.str()}, {"conversationId", c} });
    Apply(w, "setTyping", json{ {"playerId", a.str()}, {"conversationId", c}, {"typing", true} });
    Apply(w, "sendMessage", json{ {"playerId", a.str()}, {"conversationId", c}, {"text", "hi"} });

    const world::Conversation* conv = w.conversationFor(a);
    REQUIRE(conv != nullptr);
    CHECK(conv->numMessages() == 1);
    CHECK(conv->typing().empty());

    // Only participants may speak.
    const world::PlayerId outsider = w.join({ "Cy", std::nullopt, std::nullopt, std::nullopt }, 0);
    CHECK_THROWS_AS(Apply(w, "sendMessage", json{ {"playerId", outsider.str()}, {"conversationId", c}, {"text", "hey"} }),
                    core::ValidationError);

    Apply(w, "finishConversation", json{ {"playerId", b.str()}, {"conversationId", c} }, 10);
    CHECK(w.conversationFor(a) == nullptr);
    CHECK(w.outbox().finished.size() == 1);
}
