#include <doctest/doctest.h>

#include "townsim/core/Errors.hpp"
#include "townsim/world/World.hpp"
#include "test_support/TestHelpers.hpp"

#include <set>

using namespace townsim;
using world::PlayerId;

TEST_CASE("Ids/RenderAndParse")
{
    const world::PlayerId p{ 7 };
    CHECK(p.str() == "p:7");
    CHECK(world::PlayerId::parse("p:7") == std::optional<world::PlayerId>(p));
    CHECK_FALSE(world::PlayerId::parse("a:7").has_value());
    CHECK_FALSE(world::PlayerId::parse("p:").has_value());
    CHECK_FALSE(world::PlayerId::parse("p:-1").has_value());
    CHECK_FALSE(world::PlayerId::parse("p:7x").has_value());

    world::AgentId a;
    CHECK_THROWS_AS(nlohmann::json("p:1").get_to(a), core::ValidationError);
}

TEST_CASE("World/JoinAllocatesDistinctIdsAndTiles")
{
    world::World w = test::make_world(4, 4);

    std::set<std::pair<int, int>> tiles;
    for (int i = 0; i < 16; ++i)
    {
        const PlayerId id = w.join({ "P" + std::to_string(i), std::nullopt, std::nullopt, std::nullopt }, 0);
        const auto t = world::ToTile(w.findPlayer(id)->position);
        CHECK(tiles.insert({ t.x, t.y }).second);
    }
    CHECK(w.players().size() == 16);

    // Map is full now.
    CHECK_THROWS_AS(w.join({ "Late", std::nullopt, std::nullopt, std::nullopt }, 0), core::ValidationError);
    CHECK(w.checkInvariants().empty());
}

TEST_CASE("World/JoinInZoneAndRejectsDuplicateToken")
{
    world::World w = test::make_world(16, 16);

    const PlayerId id = w.join({ "Shopper", std::string("market"), std::nullopt, std::string("tok-1") }, 5);
    const world::Player* p = w.findPlayer(id);
    CHECK(p->zone == "market");
    CHECK(p->lastInput == 5);
    const auto t = world::ToTile(p->position);
    CHECK(t.x < 8);
    CHECK(t.y < 8);

    CHECK_THROWS_AS(w.join({ "Twin", std::nullopt, std::nullopt, std::string("tok-1") }, 6), core::ValidationError);
    CHECK_THROWS_AS(w.join({ "", std::nullopt, std::nullopt, std::nullopt }, 6), core::ValidationError);
    CHECK_THROWS_AS(w.join({ "Ghost", std::nullopt, test::tile(99, 0), std::nullopt }, 6), core::ValidationError);
}

TEST_CASE("World/AgentOperationsAreExclusive")
{
    world::World w = test::make_world();
    const auto [aid, pid] = w.createAgent("Bot", "WORKER", std::nullopt, std::string("owner-1"), 0);
    CHECK(w.agentForPlayer(pid)->id == aid);

    const auto op = w.startOperation(aid, "agentDoSomething", 10);
    CHECK_THROWS_AS(w.startOperation(aid, "agentDoSomething", 11), core::ValidationError);

    // Stale ids are ignored.
    CHECK_FALSE(w.finishOperation(aid, world::OperationId{ op.n + 100 }, 12));
    CHECK(w.findAgent(aid)->operation.has_value());

    CHECK(w.finishOperation(aid, op, 12));
    CHECK_FALSE(w.findAgent(aid)->operation.has_value());
    CHECK_FALSE(w.clearOperation(aid, op, "late", 13));

    const auto op2 = w.startOperation(aid, "agentDoSomething", 14);
    CHECK(op2 != op);
    CHECK(w.clearOperation(aid, op2, "stuck", 15));
    CHECK_FALSE(w.findAgent(aid)->operation.has_value());
}

TEST_CASE("World/ArchivingAPlayerArchivesItsAgentAndEndsConversations")
{
    world::World w = test::make_world();
    const auto [aid, pid] = w.createAgent("Bot", "GAMBLER", std::nullopt, std::nullopt, 0);
    const PlayerId human = w.join({ "Human", std::nullopt, std::nullopt, std::nullopt }, 0);

    const auto c = w.startConversation(human, pid, 1);
    w.acceptInvite(pid, c, 2);

    w.archivePlayer(human, "idle", 10);
    CHECK(w.findPlayer(human) == nullptr);
    CHECK(w.archivedPlayers().count(human) == 1);
    CHECK(w.findConversation(c)->participants() == std::set<PlayerId>{ pid });

    w.archiveAgent(aid, "owner gone", 20);
    CHECK(w.findAgent(aid) == nullptr);
    CHECK(w.findPlayer(pid) == nullptr);
    CHECK(w.archivedAgents().at(aid).reason == "owner gone");
    CHECK(w.findConversation(c)->finished());
    CHECK(w.checkInvariants().empty());

    // agent + its player + the human
    CHECK(w.outbox().archived.size() == 3);
    CHECK(w.outbox().finished.size() == 1);
}

TEST_CASE("World/MoveToValidatesDestination")
{
    auto map = std::make_shared<world::WorldMap>(8, 8);
    map->setBlocked(4, 4, true);
    world::World w(map);
    const PlayerId p = w.join({ "Walker", std::nullopt, test::tile(0, 0), std::nullopt }, 0);

    CHECK_THROWS_AS(w.moveTo(p, pf::IVec2{ 4, 4 }, 1), core::ValidationError);
    CHECK_THROWS_AS(w.moveTo(p, pf::IVec2{ 8, 0 }, 1), core::ValidationError);
    CHECK_FALSE(w.findPlayer(p)->isMoving());

    w.moveTo(p, pf::IVec2{ 7, 7 }, 2);
    REQUIRE(w.findPlayer(p)->pathfinding.has_value());
    CHECK(w.findPlayer(p)->pathfinding->destination == pf::IVec2{ 7, 7 });

    w.moveTo(p, std::nullopt, 3);
    CHECK_FALSE(w.findPlayer(p)->isMoving());
}

TEST_CASE("World/JsonRoundTripPreservesStateAndInvariants")
{
    world::World w = test::make_world();
    const auto [aid, pid] = w.createAgent("Bot", "CRIMINAL", std::string("market"), std::string("o-1"), 0);
    const PlayerId human = w.join({ "Human", std::nullopt, std::nullopt, std::string("tok") }, 0);
    w.startOperation(aid, "agentDoSomething", 3);
    w.moveTo(human, pf::IVec2{ 10, 10 }, 4);
    w.startActivity(human, "reading", "📖", 1000, 4);
    const auto c = w.startConversation(human, pid, 5);
    w.archivePlayer(w.join({ "Gone", std::nullopt, std::nullopt, std::nullopt }, 0), "left", 6);

    const world::World back = world::World::fromJson(w.toJson(), w.mapPtr());
    CHECK(back.checkInvariants().empty());
    CHECK(back.nextId() == w.nextId());
    CHECK(back.players().size() == 2);
    CHECK(back.findAgent(aid)->ownerId == std::optional<std::string>("o-1"));
    CHECK(back.findAgent(aid)->operation->name == "agentDoSomething");
    CHECK(back.findPlayer(human)->humanToken == std::optional<std::string>("tok"));
    CHECK(back.findPlayer(human)->pathfinding->destination == pf::IVec2{ 10, 10 });
    CHECK(back.findPlayer(human)->activity->until == 1004);
    CHECK(back.findConversation(c)->isInvitee(pid));
    CHECK(back.archivedPlayers().size() == 1);
    CHECK(back.toJson() == w.toJson());
}

TEST_CASE("World/InvariantsCatchBrokenReferences")
{
    world::World w = test::make_world();
    const auto [aid, pid] = w.createAgent("Bot", "WORKER", std::nullopt, std::nullopt, 0);
    CHECK(w.checkInvariants().empty());

    w.players().erase(pid);
    const auto broken = w.checkInvariants();
    REQUIRE_FALSE(broken.empty());
    CHECK(broken.front().find("missing player") != std::string::npos);
}
