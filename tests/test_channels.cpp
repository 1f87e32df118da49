#include <doctest/doctest.h>

#include "townsim/channels/ChannelManager.hpp"
#include "townsim/core/Errors.hpp"
#include "test_support/TestHelpers.hpp"

#include <algorithm>
#include <set>
#include <string>

using namespace townsim;
using channels::ChannelStatus;

namespace {

class FakeWorlds final : public channels::WorldProvider {
public:
    std::string provideWorld(const std::string& /*zone*/, const std::string& channelName) override
    {
        if (failNext)
            throw core::AllocationError("out of worlds");
        std::string id = "w-" + channelName;
        alive.insert(id);
        return id;
    }

    bool isAlive(const std::string& worldId) const override { return alive.count(worldId) != 0; }

    std::set<std::string> alive;
    bool failNext = false;
};

core::ChannelConfig MarketConfig()
{
    core::ChannelConfig cfg;
    cfg.defaultMaxBots = 30;
    cfg.perZoneMaxBots["market"] = 10;
    return cfg;
}

bool HasRecommendation(const std::vector<std::string>& recs, const std::string& needle)
{
    return std::any_of(recs.begin(), recs.end(),
                       [&](const std::string& r) { return r.find(needle) != std::string::npos; });
}

} // namespace

TEST_CASE("Channels/FullChannelSpillsIntoNewShard")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    const auto first = mgr.findOrCreateInstance("market");
    CHECK(first.created);
    for (int i = 1; i < 10; ++i)
    {
        const auto a = mgr.findOrCreateInstance("market");
        CHECK(a.instanceId == first.instanceId);
        CHECK_FALSE(a.created);
    }

    auto ch1 = mgr.find(first.instanceId);
    REQUIRE(ch1.has_value());
    CHECK(ch1->currentBots == 10);
    CHECK(ch1->maxBots == 10);
    CHECK(ch1->status == ChannelStatus::Full);
    CHECK(ch1->isDefault);

    const auto second = mgr.findOrCreateInstance("market");
    CHECK(second.created);
    CHECK(second.instanceId != first.instanceId);
    CHECK(second.worldId != first.worldId);

    const auto ch2 = mgr.find(second.instanceId);
    CHECK(ch2->currentBots == 1);
    CHECK(ch2->status == ChannelStatus::Active);
    CHECK(ch2->name == "market-shard-2");
    CHECK_FALSE(ch2->isDefault);

    ch1 = mgr.find(first.instanceId);
    CHECK(ch1->currentBots == 10);
    CHECK(ch1->status == ChannelStatus::Full);
}

TEST_CASE("Channels/AllocationPicksLeastLoaded")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    const auto a = mgr.createChannel("market");
    const auto b = mgr.createChannel("market", channels::ChannelType::Regional, 20);

    // Equal load: creation order decides.
    CHECK(mgr.findOrCreateInstance("market").instanceId == a.id);
    // a is at 10%, b at 0%.
    CHECK(mgr.findOrCreateInstance("market").instanceId == b.id);
    // a 10%, b 5%.
    CHECK(mgr.findOrCreateInstance("market").instanceId == b.id);
    // a 10%, b 10%: fewer occupants wins.
    CHECK(mgr.findOrCreateInstance("market").instanceId == a.id);

    // Other zones never share.
    const auto plaza = mgr.findOrCreateInstance("plaza");
    CHECK(plaza.created);
    CHECK(mgr.find(plaza.instanceId)->maxBots == 30);
}

TEST_CASE("Channels/ReleaseDemotesFullToActive")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    const auto c = mgr.createChannel("market", channels::ChannelType::General, 2);
    mgr.findOrCreateInstance("market");
    mgr.findOrCreateInstance("market");
    CHECK(mgr.find(c.id)->status == ChannelStatus::Full);

    mgr.releaseSlot(c.id);
    CHECK(mgr.find(c.id)->currentBots == 1);
    CHECK(mgr.find(c.id)->status == ChannelStatus::Active);

    mgr.releaseSlot(c.id);
    mgr.releaseSlot(c.id); // already empty
    CHECK(mgr.find(c.id)->currentBots == 0);
    CHECK(mgr.find(c.id)->emptySince.has_value());

    CHECK_THROWS_AS(mgr.releaseSlot("ch:404"), core::ValidationError);
}

TEST_CASE("Channels/OperatorStatesRefuseNewOccupants")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    const auto first = mgr.findOrCreateInstance("market");
    mgr.setStatus(first.instanceId, ChannelStatus::Draining);

    const auto next = mgr.findOrCreateInstance("market");
    CHECK(next.created);
    CHECK(next.instanceId != first.instanceId);
    CHECK_THROWS_AS(mgr.assignToChannel(first.instanceId), core::ValidationError);

    // Releases don't take a channel out of an operator state.
    mgr.releaseSlot(first.instanceId);
    CHECK(mgr.find(first.instanceId)->status == ChannelStatus::Draining);

    CHECK_THROWS_AS(mgr.setStatus(next.instanceId, ChannelStatus::Full), core::ValidationError);

    mgr.setStatus(next.instanceId, ChannelStatus::Maintenance);
    CHECK(mgr.findOrCreateInstance("market").created);

    mgr.setStatus(first.instanceId, ChannelStatus::Active);
    CHECK(mgr.find(first.instanceId)->status == ChannelStatus::Active);
}

TEST_CASE("Channels/ExplicitAssignmentHonoursGraceWindow")
{
    core::ManualClock clock(1000);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    const auto c = mgr.createChannel("market", channels::ChannelType::Event, 1);
    mgr.assignToChannel(c.id);
    CHECK_THROWS_AS(mgr.assignToChannel(c.id), core::CapacityExceeded);

    mgr.grantOverCapacity(c.id, 5000);
    CHECK_NOTHROW(mgr.assignToChannel(c.id));
    CHECK(mgr.find(c.id)->currentBots == 2);
    CHECK(mgr.find(c.id)->status == ChannelStatus::Full);

    auto report = mgr.healthReport(clock.now());
    CHECK_FALSE(HasRecommendation(report.channels[0].recommendations, "over capacity"));

    clock.set(5000);
    CHECK_THROWS_AS(mgr.assignToChannel(c.id), core::CapacityExceeded);
    report = mgr.healthReport(clock.now());
    CHECK(HasRecommendation(report.channels[0].recommendations, "over capacity"));
}

TEST_CASE("Channels/ProviderFailureCreatesNothing")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    worlds.failNext = true;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    CHECK_THROWS_AS(mgr.findOrCreateInstance("market"), core::AllocationError);
    CHECK(mgr.channels().empty());

    worlds.failNext = false;
    CHECK(mgr.findOrCreateInstance("market").created);
    CHECK_THROWS_AS(mgr.createChannel("market", channels::ChannelType::General, std::nullopt, std::string("market")),
                    core::ValidationError);
    CHECK_THROWS_AS(mgr.createChannel(""), core::ValidationError);
}

TEST_CASE("Channels/HealthReportFlagsLoadEmptinessAndDeadWorlds")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    core::ChannelConfig cfg = MarketConfig();
    cfg.chronicEmptyAfterMs = 60'000;
    channels::ChannelManager mgr(cfg, worlds, clock);

    const auto busy = mgr.createChannel("market");       // default shard
    const auto idle = mgr.createChannel("market");
    const auto gone = mgr.createChannel("plaza", channels::ChannelType::General, 4);
    for (int i = 0; i < 10; ++i)
        mgr.assignToChannel(busy.id);
    mgr.assignToChannel(gone.id);
    worlds.alive.erase(gone.worldId);

    clock.set(120'000);
    const auto report = mgr.healthReport(clock.now());
    REQUIRE(report.channels.size() == 3);

    auto byId = [&](const std::string& id) {
        return *std::find_if(report.channels.begin(), report.channels.end(),
                             [&](const channels::ChannelHealth& h) { return h.id == id; });
    };

    const auto hb = byId(busy.id);
    CHECK(hb.loadPercent == doctest::Approx(100.0));
    CHECK(HasRecommendation(hb.recommendations, "near capacity"));

    const auto hi = byId(idle.id);
    CHECK(HasRecommendation(hi.recommendations, "drain"));

    const auto hg = byId(gone.id);
    CHECK_FALSE(hg.worldAlive);
    CHECK(HasRecommendation(hg.recommendations, "reassign"));

    CHECK(report.totalBots == 11);
    CHECK(report.totalCapacity == 24);
    CHECK(HasRecommendation(report.recommendations, "imbalanced"));

    const auto j = channels::HealthReportToJson(report);
    CHECK(j.at("channels").size() == 3);
    CHECK(j.at("totalBots") == 11);
}

TEST_CASE("Channels/DeadWorldsAreFlaggedAndReassigned")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    const auto a = mgr.findOrCreateInstance("market");
    worlds.alive.erase(a.worldId);

    CHECK(mgr.flagDeadWorlds() == std::vector<std::string>{ a.instanceId });
    CHECK(mgr.flagDeadWorlds().empty());
    CHECK(mgr.find(a.instanceId)->needsWorldReassignment);

    // A flagged channel takes no one new.
    CHECK(mgr.findOrCreateInstance("market").instanceId != a.instanceId);

    CHECK_THROWS_AS(mgr.reassignWorld(a.instanceId, "w-nowhere"), core::ValidationError);
    mgr.reassignWorld(a.instanceId);
    const auto fixed = mgr.find(a.instanceId);
    CHECK_FALSE(fixed->needsWorldReassignment);
    CHECK(worlds.isAlive(fixed->worldId));
}

TEST_CASE("Channels/BalanceSuggestionsMoveExcessToUnderloaded")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);

    const auto hot = mgr.createChannel("market");
    const auto cold = mgr.createChannel("market");
    for (int i = 0; i < 10; ++i)
        mgr.assignToChannel(hot.id);
    mgr.assignToChannel(cold.id);

    const auto s = mgr.balanceSuggestions();
    REQUIRE(s.size() == 1);
    CHECK(s[0].fromId == hot.id);
    CHECK(s[0].toId == cold.id);
    CHECK(s[0].count == 3);
}

TEST_CASE("Channels/TableSurvivesSaveAndLoad")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(MarketConfig(), worlds, clock);
    const auto a = mgr.findOrCreateInstance("market");
    mgr.setStatus(a.instanceId, ChannelStatus::Maintenance);

    const auto dir = test::make_unique_temp_dir("channels");
    std::string err;
    REQUIRE(mgr.save(dir / "channels.json", &err));

    channels::ChannelManager other(MarketConfig(), worlds, clock);
    REQUIRE(other.load(dir / "channels.json", &err));
    const auto back = other.find(a.instanceId);
    REQUIRE(back.has_value());
    CHECK(back->status == ChannelStatus::Maintenance);
    CHECK(back->worldId == a.worldId);
    CHECK(back->currentBots == 1);

    // New ids continue after the loaded ones.
    const auto next = other.createChannel("market");
    CHECK(next.id != a.id);

    CHECK_FALSE(other.load(dir / "missing.json", &err));
    CHECK_FALSE(err.empty());
}
