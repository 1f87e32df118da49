#include <doctest/doctest.h>

#include "townsim/core/Errors.hpp"
#include "townsim/recovery/RecoverySweeper.hpp"
#include "test_support/TestHelpers.hpp"

#include <set>
#include <string>

using namespace townsim;
using json = nlohmann::json;

namespace {

class FakeWorlds final : public channels::WorldProvider {
public:
    std::string provideWorld(const std::string& /*zone*/, const std::string& channelName) override
    {
        alive.insert("w-" + channelName);
        return "w-" + channelName;
    }
    bool isAlive(const std::string& worldId) const override { return alive.count(worldId) != 0; }

    std::set<std::string> alive;
};

core::EngineConfig SweepEngineConfig()
{
    core::EngineConfig cfg = test::test_engine_config();
    cfg.stuckOperationThresholdMs = 1000;
    return cfg;
}

// Submits and applies one input at the clock's current time.
json Apply(engine::Engine& eng, core::ManualClock& clock, const std::string& name, const json& args)
{
    const auto r = eng.submit(name, args);
    eng.runStep(clock.now());
    const auto rec = eng.input(r.number);
    REQUIRE(rec->outcome.has_value());
    REQUIRE(rec->outcome->ok);
    return rec->outcome->value;
}

} // namespace

TEST_CASE("Recovery/StuckInputSweepIsIdempotent")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);

    core::RecoveryConfig rc;
    rc.stuckInputThresholdMs = 60'000;
    rc.stuckInputOverrides["moveTo"] = 600'000;
    recovery::RecoverySweeper sweeper(rc, eng.config(), clock);

    eng.submit("join", json{ {"name", "Ann"} });
    eng.submit("moveTo", json{ {"playerId", "p:0"}, {"destination", nullptr} });
    clock.set(120'000);

    const auto first = sweeper.sweepStuckInputs({ &eng });
    CHECK(first.pass == "stuckInputs");
    CHECK(first.examined == 2);
    CHECK(first.repaired == 1);
    REQUIRE(first.details.size() == 1);
    CHECK(first.details[0] == "w/input 0");

    const auto second = sweeper.sweepStuckInputs({ &eng });
    CHECK(second.repaired == 0);
    CHECK(second.examined == 1);

    // An operator threshold ignores the per-command overrides.
    const auto forced = sweeper.sweepStuckInputs({ &eng }, 1000);
    CHECK(forced.repaired == 1);
    CHECK(eng.pendingCount() == 0);
    CHECK(eng.input(1)->outcome->errorKind == core::ErrorKind::Stuck);

    const json j = recovery::SweepReportToJson(forced);
    CHECK(j.at("repaired") == 1);
}

TEST_CASE("Recovery/StuckOperationsAreClearedOnce")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), SweepEngineConfig(), clock);
    recovery::RecoverySweeper sweeper(core::RecoveryConfig{}, eng.config(), clock);

    const json created = Apply(eng, clock, "createAgent", json{ {"name", "Bot"}, {"personality", "WORKER"} });
    const std::string agentId = created.at("agentId").get<std::string>();
    clock.set(100);
    Apply(eng, clock, "startOperation", json{ {"agentId", agentId}, {"name", "agentDoSomething"} });

    clock.set(500);
    auto r = sweeper.sweepStuckOperations({ &eng });
    CHECK(r.examined == 1);
    CHECK(r.repaired == 0);

    clock.set(2000);
    r = sweeper.sweepStuckOperations({ &eng });
    CHECK(r.repaired == 1);
    CHECK(eng.pendingCount() == 1);

    // Already submitted: nothing new until the clear is applied.
    r = sweeper.sweepStuckOperations({ &eng });
    CHECK(r.examined == 1);
    CHECK(r.repaired == 0);
    CHECK(eng.pendingCount() == 1);

    eng.runStep(2000);
    const auto aid = world::AgentId::parse(agentId);
    CHECK_FALSE(eng.snapshot()->findAgent(*aid)->operation.has_value());

    r = sweeper.sweepStuckOperations({ &eng });
    CHECK(r.examined == 0);
    CHECK(r.repaired == 0);

    // A new operation is watched afresh.
    clock.set(2100);
    Apply(eng, clock, "startOperation", json{ {"agentId", agentId}, {"name", "agentDoSomething"} });
    clock.set(5000);
    CHECK(sweeper.sweepStuckOperations({ &eng }).repaired == 1);
}

TEST_CASE("Recovery/OrphansAndIdleHumansLeave")
{
    core::ManualClock clock(0);
    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    recovery::InMemoryOwnerDirectory owners;
    owners.add("kept");

    core::RecoveryConfig rc;
    rc.humanIdleTimeoutMs = 5 * 60'000;
    recovery::RecoverySweeper sweeper(rc, eng.config(), clock, &owners);

    eng.submit("createAgent", json{ {"name", "Gone"}, {"personality", "GAMBLER"}, {"ownerId", "gone"} });
    eng.submit("createAgent", json{ {"name", "Kept"}, {"personality", "WORKER"}, {"ownerId", "kept"} });
    eng.submit("join", json{ {"name", "Human"}, {"humanToken", "tok"} });
    eng.runStep(0);
    REQUIRE(eng.snapshot()->agents().size() == 2);

    clock.set(60'000);
    auto r = sweeper.sweepOrphans({ &eng });
    CHECK(r.pass == "orphans");
    CHECK(r.examined == 3);
    CHECK(r.repaired == 1);

    clock.set(10 * 60'000);
    r = sweeper.sweepOrphans({ &eng });
    CHECK(r.repaired == 1);   // the orphan is already queued
    CHECK(sweeper.sweepOrphans({ &eng }).repaired == 0);

    eng.resume(clock.now());
    eng.runStep(clock.now());

    const auto snap = eng.snapshot();
    CHECK(snap->agents().size() == 1);
    CHECK(snap->agents().begin()->second.ownerId == std::optional<std::string>("kept"));
    CHECK(snap->archivedAgents().size() == 1);
    CHECK(snap->archivedPlayers().size() == 2);
    CHECK(snap->checkInvariants().empty());

    r = sweeper.sweepOrphans({ &eng });
    CHECK(r.examined == 1);
    CHECK(r.repaired == 0);
}

TEST_CASE("Recovery/OrphanSweepFlagsChannelsOnDeadWorlds")
{
    core::ManualClock clock(0);
    FakeWorlds worlds;
    channels::ChannelManager mgr(core::ChannelConfig{}, worlds, clock);
    const auto a = mgr.findOrCreateInstance("market");

    engine::Engine eng("w", test::make_world(), test::test_engine_config(), clock);
    recovery::RecoverySweeper sweeper(core::RecoveryConfig{}, eng.config(), clock, nullptr, &mgr);

    CHECK(sweeper.sweepOrphans({ &eng }).repaired == 0);

    worlds.alive.clear();
    const auto r = sweeper.sweepOrphans({ &eng });
    CHECK(r.repaired == 1);
    REQUIRE(r.details.size() == 1);
    CHECK(r.details[0].find(a.instanceId) == 0);
    CHECK(mgr.find(a.instanceId)->needsWorldReassignment);

    CHECK(sweeper.sweepOrphans({ &eng }).repaired == 0);
}
