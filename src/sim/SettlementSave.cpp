#include "sim/SettlementSave.h"

#include <cmath>
#include <map>
#include <vector>

#include <spdlog/spdlog.h>

namespace civ::sim {

save::SaveGame CaptureSave(const Settlement& world, std::int64_t lastUpdateUnixMs)
{
    save::SaveGame out;
    out.timestamp = save::NowUtcIso8601();
    out.tick      = world.tick;
    out.age       = world.age;

    for (const auto& [name, amount] : world.ledger.Stocks())
        out.resources[name] = amount;
    for (const auto& [name, count] : world.buildings.Counts())
        out.buildings[name] = count;
    for (const auto& g : world.workforce.Groups())
    {
        save::WorkerRecord rec;
        rec.count      = g.count;
        rec.assignment = g.assignment;
        out.villagers[g.type] = std::move(rec);
    }

    save::StatsRecord stats;
    for (const auto& e : world.stats.Events())
        stats.events.push_back(save::EventRecord{e.tick, e.timestamp, e.type, e.message});
    stats.resources_gathered = world.stats.ResourcesGathered();
    stats.buildings_built    = world.stats.BuildingsBuilt();
    stats.workers_recruited  = world.stats.WorkersRecruited();
    stats.ages_reached       = world.stats.AgesReached();
    stats.start_time         = world.stats.StartTime();
    out.stats = std::move(stats);

    save::ResearchRecord research;
    research.current  = world.research.Current().value_or(std::string{});
    research.progress = world.research.Progress();
    research.researched.assign(world.research.Researched().begin(), world.research.Researched().end());
    out.research = std::move(research);

    out.last_update_unix_ms = lastUpdateUnixMs;
    return out;
}

std::unique_ptr<Settlement> RestoreSettlement(const save::SaveGame& record,
                                              const Catalog& catalog,
                                              std::string* outError)
{
    auto fail = [&](std::string msg) -> std::unique_ptr<Settlement> {
        if (outError) *outError = std::move(msg);
        return nullptr;
    };

    auto world = std::make_unique<Settlement>(catalog);

    if (!catalog.FindAge(record.age))
        return fail("unknown age: " + record.age);
    world->age  = record.age;
    world->tick = record.tick;

    for (const auto& [name, amount] : record.resources)
    {
        if (!std::isfinite(amount) || amount < 0.0)
            return fail("invalid amount for resource " + name);
        if (!world->ledger.IsKnown(name))
        {
            spdlog::warn("RestoreSettlement: skipping unknown resource '{}'", name);
            continue;
        }
        world->ledger.Add(name, amount);
    }

    std::string err;
    if (!world->buildings.Restore(record.buildings, &err))
        return fail(err);

    std::vector<WorkerGroup> groups;
    groups.reserve(record.villagers.size());
    for (const auto& [type, rec] : record.villagers)
        groups.push_back(WorkerGroup{type, rec.count, rec.assignment});
    if (!world->workforce.Restore(groups, &err))
        return fail(err);

    if (record.stats)
    {
        const auto& s = *record.stats;
        GameStats stats(s.start_time > 0 ? s.start_time : GameStats::NowUnix());
        for (const auto& e : s.events)
            stats.AddEvent(StatEvent{e.tick, e.timestamp, e.type, e.message});
        for (const auto& [res, amount] : s.resources_gathered)
            stats.AddResourceGathered(res, amount);
        for (const auto& [bld, count] : s.buildings_built)
            stats.AddBuildingBuilt(bld, count);
        for (const auto& [type, count] : s.workers_recruited)
            stats.AddWorkersRecruited(type, count);
        for (const auto& age : s.ages_reached)
            stats.AddAgeReached(age);
        stats.AddAgeReached(record.age);
        world->stats = std::move(stats);
    }
    else
    {
        world->stats.AddAgeReached(catalog.InitialAge());
        world->stats.AddAgeReached(record.age);
    }

    if (record.research)
    {
        const auto& r = *record.research;
        std::optional<std::string> current;
        if (!r.current.empty())
            current = r.current;
        if (!world->research.Restore(r.researched, current, r.progress, &err))
            return fail(err);
    }

    return world;
}

} // namespace civ::sim
