// tests/test_simulation.cpp
//
// Coverage for src/sim/Simulation.{h,cpp}: session lifecycle, wall-clock
// catch-up, tick order effects and notification delivery.

#include <doctest/doctest.h>

#include "sim/Catalog.h"
#include "sim/Simulation.h"
#include "test_support/RecordingDisplay.h"

#include <chrono>

using namespace civ;
using namespace std::chrono_literals;

namespace {

using TimePoint = sim::Simulation::TimePoint;

const TimePoint kT0 = TimePoint(std::chrono::seconds(1'700'000'000));

sim::SimConfig TestConfig(int maxCatchUp = 100)
{
    sim::SimConfig cfg;
    cfg.tickSeconds = 1.0;
    cfg.maxCatchUpTicks = maxCatchUp;
    cfg.researchRate = 0.1;
    return cfg;
}

} // namespace

TEST_CASE("Simulation: starting a session seeds the settlement")
{
    test::RecordingDisplay display;
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(), &display);

    CHECK(simulation.GetState() == sim::Simulation::State::Idle);
    CHECK(simulation.Update(kT0 + 5s) == 0);

    REQUIRE(simulation.StartSession(kT0));
    CHECK(simulation.IsRunning());
    CHECK_FALSE(simulation.StartSession(kT0));

    const sim::Snapshot s = simulation.TakeSnapshot();
    CHECK(s.running);
    CHECK(s.age == "Stone Age");
    CHECK(s.tick == 0);
    CHECK(s.resources.at("foraging") == doctest::Approx(20.0));
    CHECK(s.resources.at("wood") == doctest::Approx(15.0));
    CHECK(s.totalFood == doctest::Approx(20.0));
    CHECK(s.workers.at("villager").count == 1);
    CHECK(s.workers.at("villager").assignment.at("idle") == 1);
    CHECK(s.population == 1);
    CHECK(s.capacity == 1);

    CHECK(display.Saw("Your settlement begins in the Stone Age."));
}

TEST_CASE("Simulation: update runs at least one tick and catches up whole intervals")
{
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(), nullptr);
    REQUIRE(simulation.StartSession(kT0));

    CHECK_FALSE(simulation.TickDue(kT0 + 500ms));
    CHECK(simulation.TickDue(kT0 + 1s));

    // Less than an interval still makes progress for interactive input.
    CHECK(simulation.Update(kT0 + 500ms) == 1);
    CHECK(simulation.TakeSnapshot().tick == 1);

    CHECK(simulation.Update(kT0 + 500ms + 10s) == 10);
    CHECK(simulation.TakeSnapshot().tick == 11);

    // The fraction left over is not carried.
    CHECK_FALSE(simulation.TickDue(kT0 + 500ms + 10s + 900ms));
}

TEST_CASE("Simulation: catch-up is capped after a long absence")
{
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(25), nullptr);
    REQUIRE(simulation.StartSession(kT0));

    CHECK(simulation.Update(kT0 + 10h) == 25);
    CHECK(simulation.TakeSnapshot().tick == 25);

    // Backlog past the cap is dropped.
    CHECK(simulation.Update(kT0 + 10h + 2s) == 2);
}

TEST_CASE("Simulation: a tick gathers, then produces, then pays upkeep")
{
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(), nullptr);
    REQUIRE(simulation.StartSession(kT0));

    REQUIRE(simulation.Apply([](sim::Settlement& w, sim::SimEventQueue&) {
        REQUIRE(w.workforce.Assign("villager", "wood", 1));
        REQUIRE(w.buildings.Restore({{"mine", 1}}));
    }));

    CHECK(simulation.Update(kT0 + 1s) == 1);

    const sim::Snapshot s = simulation.TakeSnapshot();
    CHECK(s.resources.at("wood") == doctest::Approx(16.0));
    CHECK(s.resources.at("stone") == doctest::Approx(1.0));
    CHECK(s.resources.at("gold") == doctest::Approx(0.2));
    CHECK(s.totalFood == doctest::Approx(19.5));
    CHECK(s.foodUpkeep == doctest::Approx(0.5));
}

TEST_CASE("Simulation: research is fed a share of the knowledge stock")
{
    test::RecordingDisplay display;
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(), &display);
    display.Attach(&simulation);
    REQUIRE(simulation.StartSession(kT0));

    REQUIRE(simulation.Apply([](sim::Settlement& w, sim::SimEventQueue&) {
        REQUIRE(w.ledger.Add("knowledge", 100.0));
        REQUIRE(w.research.StartResearch("agriculture")); // cost 20
    }));

    CHECK(simulation.Update(kT0 + 1s) == 1);
    sim::Snapshot s = simulation.TakeSnapshot();
    CHECK(s.research.current == "agriculture");
    CHECK(s.research.progress == doctest::Approx(10.0));
    CHECK(s.research.cost == doctest::Approx(20.0));

    CHECK(simulation.Update(kT0 + 2s) == 1);
    s = simulation.TakeSnapshot();
    CHECK(s.research.current.empty());
    REQUIRE(s.research.researched.size() == 1);
    CHECK(s.research.researched[0] == "agriculture");
    CHECK(display.Saw("Research completed: Agriculture"));
}

TEST_CASE("Simulation: meeting the thresholds advances the age and notifies")
{
    test::RecordingDisplay display;
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(), &display);
    display.Attach(&simulation);
    REQUIRE(simulation.StartSession(kT0));

    REQUIRE(simulation.Apply([](sim::Settlement& w, sim::SimEventQueue&) {
        REQUIRE(w.ledger.Add("stone", 50.0));
        REQUIRE(w.ledger.Add("hunting", 100.0));
        REQUIRE(w.buildings.Restore({{"hut", 3}, {"farm", 2}}));
    }));

    CHECK(simulation.Update(kT0 + 1s) == 1);

    CHECK(simulation.TakeSnapshot().age == "Bronze Age");
    REQUIRE(display.ages.size() == 1);
    CHECK(display.ages[0] == "Bronze Age");

    // Only one age per tick even though nothing else changed.
    CHECK(simulation.Update(kT0 + 2s) == 1);
    CHECK(simulation.TakeSnapshot().age == "Bronze Age");

    bool recorded = false;
    REQUIRE(simulation.Apply([&](sim::Settlement& w, sim::SimEventQueue&) {
        for (const auto& e : w.stats.Events())
            recorded = recorded || e.type == "age_advancement";
        CHECK(w.stats.AgesReached().size() == 2);
    }));
    CHECK(recorded);
}

TEST_CASE("Simulation: quit stops everything and releases the display once")
{
    test::RecordingDisplay display;
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(), &display);
    REQUIRE(simulation.StartSession(kT0));

    simulation.Quit();
    simulation.Quit();

    CHECK(simulation.GetState() == sim::Simulation::State::Stopped);
    CHECK(display.releases == 1);
    CHECK(display.Saw("Goodbye"));

    CHECK(simulation.Update(kT0 + 5s) == 0);
    CHECK_FALSE(simulation.TickDue(kT0 + 5s));
    CHECK_FALSE(simulation.StartSession(kT0));
    CHECK_FALSE(simulation.Apply([](sim::Settlement&, sim::SimEventQueue&) {}));

    const auto before = display.snapshots.size();
    simulation.RefreshDisplay();
    CHECK(display.snapshots.size() == before);

    simulation.Notify("too late");
    CHECK_FALSE(display.Saw("too late"));
    CHECK(display.callsAfterRelease == 0);
}

TEST_CASE("Simulation: refresh pushes a snapshot while running")
{
    test::RecordingDisplay display;
    sim::Simulation simulation(sim::DefaultCatalog(), TestConfig(), &display);

    simulation.RefreshDisplay();
    CHECK(display.snapshots.empty());

    REQUIRE(simulation.StartSession(kT0));
    simulation.RefreshDisplay();
    REQUIRE(display.snapshots.size() == 1);
    CHECK(display.snapshots[0].age == "Stone Age");
}
