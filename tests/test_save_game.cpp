// tests/test_save_game.cpp
//
// Coverage for include/civ/save/SaveGame.hpp and src/sim/SettlementSave.cpp:
// document validation, optional sections, legacy migration and the
// all-or-nothing load into a live simulation.

#include <doctest/doctest.h>

#include "civ/save/SaveGame.hpp"
#include "sim/Catalog.h"
#include "sim/SettlementSave.h"
#include "sim/Simulation.h"
#include "test_support/RecordingDisplay.h"
#include "test_support/TempDir.h"

#include <chrono>
#include <climits>
#include <fstream>
#include <string>
#include <vector>

using namespace civ;
namespace fs = std::filesystem;

namespace {

void write_text(const fs::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    REQUIRE(f.good());
    f << text;
}

const char* kMinimalSave = R"({
  "age": "Bronze Age",
  "tick": 42,
  "resources": { "foraging": 30.5, "wood": 12, "stone": 60 }
})";

} // namespace

TEST_CASE("save::ParseSaveGame rejects documents without the mandatory fields")
{
    save::SaveGame out;
    save::SaveError err;

    CHECK_FALSE(save::ParseSaveGame("{ not json", out, &err));
    CHECK(err.code == save::SaveError::Code::JsonParseError);

    CHECK_FALSE(save::ParseSaveGame("[1, 2, 3]", out, &err));
    CHECK(err.code == save::SaveError::Code::JsonTypeError);

    CHECK_FALSE(save::ParseSaveGame(R"({"resources": {}})", out, &err));
    CHECK(err.code == save::SaveError::Code::MissingField);

    CHECK_FALSE(save::ParseSaveGame(R"({"age": "", "resources": {}})", out, &err));
    CHECK(err.code == save::SaveError::Code::InvalidValue);

    CHECK_FALSE(save::ParseSaveGame(R"({"age": "Stone Age"})", out, &err));
    CHECK(err.code == save::SaveError::Code::MissingField);

    CHECK_FALSE(save::ParseSaveGame(R"({"age": "Stone Age", "resources": [1]})", out, &err));
    CHECK(err.code == save::SaveError::Code::JsonTypeError);

    CHECK_FALSE(save::ParseSaveGame(R"({"age": "Stone Age", "resources": {"wood": "lots"}})", out, &err));
    CHECK(err.code == save::SaveError::Code::JsonTypeError);

    CHECK_FALSE(save::ParseSaveGame(R"({"age": "Stone Age", "resources": {}, "tick": -3})", out, &err));
    CHECK(err.code == save::SaveError::Code::InvalidValue);

    CHECK_FALSE(save::ParseSaveGame(R"({"schema_version": 99, "age": "Stone Age", "resources": {}})", out, &err));
    CHECK(err.code == save::SaveError::Code::MigrationFailed);
}

TEST_CASE("save::ParseSaveGame loads a minimal record with defaults")
{
    save::SaveGame out;
    REQUIRE(save::ParseSaveGame(kMinimalSave, out));

    CHECK(out.schema_version == save::kSchemaVersion);
    CHECK(out.age == "Bronze Age");
    CHECK(out.tick == 42);
    CHECK(out.resources.at("foraging") == doctest::Approx(30.5));
    CHECK(out.buildings.empty());
    CHECK(out.villagers.empty());
    CHECK_FALSE(out.stats.has_value());
    CHECK_FALSE(out.research.has_value());
    CHECK_FALSE(out.last_update_unix_ms.has_value());
}

TEST_CASE("save::ParseSaveGame migrates the legacy layout")
{
    const char* legacy = R"({
      "timestamp": "2024-01-01T00:00:00Z",
      "tick": 7,
      "age": "Stone Age",
      "resources": { "foraging": 10 },
      "buildings": { "hut": 1 },
      "villagers": { "villager": { "Count": 2, "Assignment": { "idle": 1, "wood": 1 } } },
      "stats": {
        "events": [
          { "tick": 3, "timestamp": "2024-01-01T00:00:05.123456789+01:00",
            "eventType": "building_built", "message": "Built a hut" }
        ],
        "resourcesGathered": { "wood": 12.5 },
        "buildingsBuilt": { "hut": 1 },
        "villagersRecruited": { "villager": 1 },
        "agesReached": [ "Stone Age" ],
        "startTime": "2024-01-01T00:00:00Z"
      },
      "lastUpdateTime": "2024-01-01T00:00:00Z"
    })";

    save::SaveGame out;
    save::SaveError err;
    REQUIRE(save::ParseSaveGame(legacy, out, &err));

    CHECK(out.schema_version == 1);
    REQUIRE(out.villagers.count("villager") == 1);
    CHECK(out.villagers.at("villager").count == 2);
    CHECK(out.villagers.at("villager").assignment.at("wood") == 1);
    CHECK_FALSE(out.extras.contains("lastUpdateTime"));

    REQUIRE(out.stats.has_value());
    const save::StatsRecord& stats = *out.stats;
    CHECK(stats.start_time == 1704067200);
    REQUIRE(stats.events.size() == 1);
    CHECK(stats.events[0].tick == 3);
    CHECK(stats.events[0].type == "building_built");
    CHECK(stats.events[0].timestamp == 1704067200 + 5 - 3600);
    CHECK(stats.resources_gathered.at("wood") == doctest::Approx(12.5));
    CHECK(stats.buildings_built.at("hut") == 1);
    CHECK(stats.workers_recruited.at("villager") == 1);
    CHECK(stats.ages_reached == std::vector<std::string>{"Stone Age"});
    CHECK(stats.extras.empty());
}

TEST_CASE("save::ParseSaveGame rejects a legacy save with an unreadable time")
{
    const char* legacy = R"({
      "age": "Stone Age",
      "resources": {},
      "stats": { "startTime": "yesterday" }
    })";

    save::SaveGame out;
    save::SaveError err;
    CHECK_FALSE(save::ParseSaveGame(legacy, out, &err));
    CHECK(err.code == save::SaveError::Code::MigrationFailed);
    CHECK(std::string(save::SaveErrorCodeName(err.code)) == "MigrationFailed");
}

TEST_CASE("save::ParseRfc3339 reads UTC and offset times")
{
    std::int64_t t = 0;
    CHECK(save::ParseRfc3339("1970-01-01T00:00:00Z", t));
    CHECK(t == 0);
    CHECK(save::ParseRfc3339("2024-02-29T12:30:00-02:30", t));
    CHECK(t == 1709209800 + 9000);

    CHECK_FALSE(save::ParseRfc3339("2023-02-29T00:00:00Z", t));
    CHECK_FALSE(save::ParseRfc3339("2024-01-01 00:00:00", t));
    CHECK_FALSE(save::ParseRfc3339("2024-01-01T00:00:00Zjunk", t));
}

TEST_CASE("save::SaveGame preserves unknown fields")
{
    const char* withExtras = R"({
      "schema_version": 1,
      "age": "Stone Age",
      "resources": {},
      "mod_data": { "color": "blue" }
    })";

    save::SaveGame out;
    REQUIRE(save::ParseSaveGame(withExtras, out));
    REQUIRE(out.extras.contains("mod_data"));

    const save::json j = out;
    CHECK(j.at("mod_data").at("color") == "blue");
}

TEST_CASE("save slot names are restricted")
{
    CHECK(save::IsValidSaveName("my_save-2.v1"));
    CHECK_FALSE(save::IsValidSaveName(""));
    CHECK_FALSE(save::IsValidSaveName(".hidden"));
    CHECK_FALSE(save::IsValidSaveName("../escape"));
    CHECK_FALSE(save::IsValidSaveName("dir/name"));
    CHECK_FALSE(save::IsValidSaveName("with space"));
    CHECK_FALSE(save::IsValidSaveName(std::string(65, 'a')));

    CHECK(save::SavePathFor("saves", "alpha") == fs::path("saves") / "alpha.json");
}

TEST_CASE("save::ListSaves returns sorted json stems")
{
    test::TempDir tmp("list_saves");
    write_text(tmp.path() / "beta.json", "{}");
    write_text(tmp.path() / "alpha.json", "{}");
    write_text(tmp.path() / "notes.txt", "x");

    const auto names = save::ListSaves(tmp.path());
    REQUIRE(names.size() == 2);
    CHECK(names[0] == "alpha");
    CHECK(names[1] == "beta");

    CHECK(save::ListSaves(tmp.path() / "nope").empty());
}

TEST_CASE("save::SaveSaveGame keeps the previous save as a backup")
{
    test::TempDir tmp("save_backup");
    const fs::path file = save::SavePathFor(tmp.path(), "camp");

    save::SaveGame record;
    REQUIRE(save::ParseSaveGame(kMinimalSave, record));
    record.tick = 1;
    REQUIRE(save::SaveSaveGame(record, file));
    CHECK_FALSE(fs::exists(tmp.path() / "camp.json.bak"));

    record.tick = 2;
    REQUIRE(save::SaveSaveGame(record, file));

    save::SaveGame current, previous;
    REQUIRE(save::LoadSaveGame(file, current));
    REQUIRE(save::LoadSaveGame(tmp.path() / "camp.json.bak", previous));
    CHECK(current.tick == 2);
    CHECK(previous.tick == 1);

    const auto names = save::ListSaves(tmp.path());
    REQUIRE(names.size() == 1);
    CHECK(names[0] == "camp");
}

TEST_CASE("RestoreSettlement rebuilds a settlement and fills in defaults")
{
    save::SaveGame record;
    REQUIRE(save::ParseSaveGame(kMinimalSave, record));

    std::string err;
    auto world = sim::RestoreSettlement(record, sim::DefaultCatalog(), &err);
    REQUIRE(world);
    CHECK(world->age == "Bronze Age");
    CHECK(world->tick == 42);
    CHECK(world->ledger.Get("foraging") == doctest::Approx(30.5));
    CHECK(world->ledger.Get("gold") == doctest::Approx(0.0));
    CHECK(world->workforce.TotalPopulation() == 0);
    CHECK_FALSE(world->research.Current().has_value());
    REQUIRE(world->stats.AgesReached().size() == 2);
    CHECK(world->stats.AgesReached()[1] == "Bronze Age");
}

TEST_CASE("RestoreSettlement rejects inconsistent records")
{
    save::SaveGame record;
    REQUIRE(save::ParseSaveGame(kMinimalSave, record));
    std::string err;

    SUBCASE("unknown age")
    {
        record.age = "Space Age";
        CHECK_FALSE(sim::RestoreSettlement(record, sim::DefaultCatalog(), &err));
        CHECK(err.find("Space Age") != std::string::npos);
    }
    SUBCASE("negative stock")
    {
        record.resources["wood"] = -1.0;
        CHECK_FALSE(sim::RestoreSettlement(record, sim::DefaultCatalog(), &err));
    }
    SUBCASE("assignments that do not add up")
    {
        save::WorkerRecord w;
        w.count = 3;
        w.assignment = {{"idle", 1}};
        record.villagers["villager"] = w;
        CHECK_FALSE(sim::RestoreSettlement(record, sim::DefaultCatalog(), &err));
    }
    SUBCASE("assignments whose sum wraps past the int range")
    {
        save::WorkerRecord w;
        w.count = 0;
        w.assignment = {{"idle", INT_MAX}, {"wood", INT_MAX}, {"stone", 2}};
        record.villagers["villager"] = w;
        CHECK_FALSE(sim::RestoreSettlement(record, sim::DefaultCatalog(), &err));
        CHECK(err.find("villager") != std::string::npos);
    }
    SUBCASE("unknown building")
    {
        record.buildings["castle"] = 1;
        CHECK_FALSE(sim::RestoreSettlement(record, sim::DefaultCatalog(), &err));
    }
    SUBCASE("unknown technology")
    {
        save::ResearchRecord r;
        r.researched = {"alchemy"};
        record.research = r;
        CHECK_FALSE(sim::RestoreSettlement(record, sim::DefaultCatalog(), &err));
    }
}

TEST_CASE("RestoreSettlement skips resources the catalog does not know")
{
    save::SaveGame record;
    REQUIRE(save::ParseSaveGame(kMinimalSave, record));
    record.resources["mana"] = 5.0;

    auto world = sim::RestoreSettlement(record, sim::DefaultCatalog());
    REQUIRE(world);
    CHECK_FALSE(world->ledger.IsKnown("mana"));
}

TEST_CASE("Simulation: save then load restores the same settlement")
{
    using namespace std::chrono_literals;
    test::TempDir tmp("sim_save");
    const fs::path file = tmp.path() / "slot.json";
    const auto t0 = std::chrono::system_clock::now();

    sim::Simulation original(sim::DefaultCatalog(), sim::SimConfig{}, nullptr);
    REQUIRE(original.StartSession(t0));
    REQUIRE(original.Apply([](sim::Settlement& w, sim::SimEventQueue&) {
        REQUIRE(w.ledger.Add("knowledge", 10.0));
        REQUIRE(w.workforce.Assign("villager", "wood", 1));
        REQUIRE(w.buildings.Restore({{"hut", 2}}));
        REQUIRE(w.research.StartResearch("toolmaking", 3.0));
    }));
    REQUIRE(original.Update(t0 + 3s) == 3);

    save::SaveError err;
    REQUIRE(original.SaveTo(file, &err));
    const sim::Snapshot before = original.TakeSnapshot();

    sim::Simulation restored(sim::DefaultCatalog(), sim::SimConfig{}, nullptr);
    REQUIRE(restored.LoadFrom(file, t0 + 3s, &err));
    CHECK(restored.IsRunning());

    const sim::Snapshot after = restored.TakeSnapshot();
    CHECK(after.age == before.age);
    CHECK(after.tick == before.tick);
    CHECK(after.buildings == before.buildings);
    CHECK(after.capacity == before.capacity);
    CHECK(after.workers.at("villager").assignment == before.workers.at("villager").assignment);
    CHECK(after.research.current == before.research.current);
    CHECK(after.research.progress == doctest::Approx(before.research.progress));
    for (const auto& [name, amount] : before.resources)
    {
        CAPTURE(name);
        CHECK(after.resources.at(name) == doctest::Approx(amount));
    }

    // The last-update time travels with the save.
    CHECK(restored.Update(t0 + 5s) == 2);
}

TEST_CASE("Simulation: a rejected load leaves the live settlement untouched")
{
    test::TempDir tmp("sim_bad_load");
    const auto now = std::chrono::system_clock::now();

    test::RecordingDisplay display;
    sim::Simulation simulation(sim::DefaultCatalog(), sim::SimConfig{}, &display);
    REQUIRE(simulation.StartSession(now));
    REQUIRE(simulation.Apply([](sim::Settlement& w, sim::SimEventQueue&) {
        REQUIRE(w.ledger.Add("wood", 100.0));
    }));

    const fs::path corrupt = tmp.path() / "corrupt.json";
    write_text(corrupt, R"({"age": "Stone Age", "resources": {"wood": 1},
                            "villagers": {"villager": {"count": 2, "assignment": {"idle": 5}}}})");

    save::SaveError err;
    CHECK_FALSE(simulation.LoadFrom(corrupt, now, &err));
    CHECK(err.code == save::SaveError::Code::InvalidValue);

    CHECK_FALSE(simulation.LoadFrom(tmp.path() / "absent.json", now, &err));
    CHECK(err.code == save::SaveError::Code::IoOpenFail);
    CHECK(std::string(save::SaveErrorCodeName(err.code)) == "IoOpenFail");

    CHECK(simulation.TakeSnapshot().resources.at("wood") == doctest::Approx(115.0));
}

TEST_CASE("Simulation: loading starts an idle session but not a stopped one")
{
    test::TempDir tmp("sim_load_states");
    const fs::path file = tmp.path() / "min.json";
    write_text(file, kMinimalSave);
    const auto now = std::chrono::system_clock::now();

    sim::Simulation idle(sim::DefaultCatalog(), sim::SimConfig{}, nullptr);
    REQUIRE(idle.LoadFrom(file, now));
    CHECK(idle.IsRunning());
    CHECK(idle.TakeSnapshot().age == "Bronze Age");

    sim::Simulation stopped(sim::DefaultCatalog(), sim::SimConfig{}, nullptr);
    REQUIRE(stopped.StartSession(now));
    stopped.Quit();
    CHECK_FALSE(stopped.LoadFrom(file, now));
    CHECK(stopped.GetState() == sim::Simulation::State::Stopped);
}
