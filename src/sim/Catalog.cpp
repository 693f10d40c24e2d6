#include "sim/Catalog.h"

#include <algorithm>
#include <set>

namespace civ::sim {

namespace {

template <class Def>
const Def* FindByName(const std::vector<Def>& defs, const std::string& name)
{
    const auto it = std::find_if(defs.begin(), defs.end(),
                                 [&](const Def& d) { return d.name == name; });
    return it != defs.end() ? &*it : nullptr;
}

Catalog BuildDefaultCatalog()
{
    Catalog c;

    // ---------- resources ----------
    //              name         rate  food   foodShare
    c.resources = {
        {"foraging",  1.0,  true,  0.0},
        {"wood",      1.0,  false, 0.0},
        {"stone",     0.5,  false, 0.0},
        {"gold",      0.2,  false, 0.0},
        {"knowledge", 0.1,  false, 0.0},
        {"hunting",   1.8,  true,  0.4},
    };
    c.primaryFood = "foraging";

    // ---------- buildings ----------
    c.buildings = {
        {"hut",
         {{"wood", 20}},
         {},
         2,
         {}},
        {"farm",
         {{"wood", 100}, {"stone", 50}, {kFood, 100}},
         {{kFood, 3.5}},
         0,
         {}},
        {"lumber_mill",
         {{"wood", 100}, {"stone", 300}},
         {{"wood", 2.0}},
         0,
         {{"villager", "wood", 0.1}}},
        {"mine",
         {{"wood", 100}, {"stone", 400}},
         {{"stone", 1.0}, {"gold", 0.2}},
         0,
         {{"villager", "stone", 0.05}, {"villager", "gold", 0.05}}},
        {"market",
         {{"wood", 200}, {"stone", 200}, {"gold", 100}},
         {{"gold", 0.5}},
         0,
         {{"villager", "gold", 0.1}}},
        {"library",
         {{"wood", 400}, {"stone", 200}, {"knowledge", 100}},
         {{"knowledge", 0.5}},
         0,
         {{"scholar", "knowledge", 0.15}, {"villager", "knowledge", 0.02}}},
    };
    c.baseCapacity = 1;

    // ---------- worker types ----------
    c.workers = {
        {"villager",
         0.5,
         {"foraging", "wood", "stone", "gold", "knowledge", "hunting"},
         {{"knowledge", 0.2}},
         true},
        {"scholar",
         0.75,
         {"knowledge"},
         {{"knowledge", 1.5}},
         false},
    };

    // ---------- ages ----------
    c.ages = {
        {"Stone Age", {}, {},
         {"hut", "farm"}, {kFood, "wood"}, {}},
        {"Bronze Age",
         {{"stone", 50}, {kFood, 100}},
         {{"hut", 3}, {"farm", 2}},
         {"lumber_mill", "mine"}, {"stone"}, {}},
        {"Iron Age",
         {{"stone", 100}, {"wood", 150}, {"knowledge", 20}},
         {{"mine", 2}, {"lumber_mill", 2}},
         {"market", "library"}, {"gold", "knowledge"}, {}},
        {"Medieval Age",
         {{"stone", 200}, {"wood", 250}, {"gold", 50}, {"knowledge", 50}},
         {{"market", 1}, {"library", 1}},
         {}, {}, {"scholar"}},
        {"Renaissance Age",
         {{"gold", 150}, {"knowledge", 100}},
         {{"library", 3}, {"market", 2}},
         {}, {}, {}},
        {"Industrial Age",
         {{"gold", 300}, {"knowledge", 200}},
         {{"library", 5}, {"market", 4}},
         {}, {}, {}},
        {"Modern Age",
         {{"gold", 500}, {"knowledge", 400}},
         {{"library", 8}, {"market", 6}},
         {}, {}, {}},
    };

    // ---------- technologies ----------
    c.techs = {
        {"agriculture", "Agriculture", "Improve food production methods",
         "Stone Age", 20, {},
         {{"food_production_bonus", 0.2}}},
        {"toolmaking", "Toolmaking", "Craft better tools for gathering",
         "Stone Age", 25, {},
         {{"resource_production_bonus", 0.1}}},
        {"writing", "Writing", "Record knowledge for future generations",
         "Bronze Age", 40, {},
         {{"knowledge_production_bonus", 0.2}}},
        {"metallurgy", "Metallurgy", "Work metals into stronger materials",
         "Bronze Age", 50, {},
         {{"new_building:foundry", 1.0}}},
        {"mathematics", "Mathematics", "Advanced calculations for construction",
         "Iron Age", 60, {"writing"},
         {{"knowledge_production_bonus", 0.3}, {"resource_production_bonus", 0.1}}},
    };

    c.startingResources = {{kFood, 20}, {"wood", 15}};
    c.startingWorkers   = {{"villager", 1}};

    return c;
}

// Resource names an amount line may reference: every stock plus "food".
bool IsResourceKey(const Catalog& c, const std::string& key)
{
    return key == kFood || c.FindResource(key) != nullptr;
}

} // namespace

const ResourceDef* Catalog::FindResource(const std::string& name) const
{
    return FindByName(resources, name);
}

const BuildingDef* Catalog::FindBuilding(const std::string& name) const
{
    return FindByName(buildings, name);
}

const WorkerTypeDef* Catalog::FindWorker(const std::string& name) const
{
    return FindByName(workers, name);
}

const AgeDef* Catalog::FindAge(const std::string& name) const
{
    return FindByName(ages, name);
}

const TechDef* Catalog::FindTech(const std::string& key) const
{
    const auto it = std::find_if(techs.begin(), techs.end(),
                                 [&](const TechDef& t) { return t.key == key; });
    return it != techs.end() ? &*it : nullptr;
}

const Catalog& DefaultCatalog()
{
    static const Catalog catalog = BuildDefaultCatalog();
    return catalog;
}

bool ValidateCatalog(const Catalog& c, std::string* outError)
{
    auto fail = [&](std::string msg) {
        if (outError) *outError = std::move(msg);
        return false;
    };

    auto unique = [](const auto& defs, auto key) {
        std::set<std::string> seen;
        for (const auto& d : defs)
            if (!seen.insert(key(d)).second)
                return false;
        return true;
    };

    if (!unique(c.resources, [](const ResourceDef& d) { return d.name; }))
        return fail("duplicate resource name");
    if (!unique(c.buildings, [](const BuildingDef& d) { return d.name; }))
        return fail("duplicate building name");
    if (!unique(c.workers, [](const WorkerTypeDef& d) { return d.name; }))
        return fail("duplicate worker type");
    if (!unique(c.ages, [](const AgeDef& d) { return d.name; }))
        return fail("duplicate age name");
    if (!unique(c.techs, [](const TechDef& d) { return d.key; }))
        return fail("duplicate technology key");

    for (const auto& r : c.resources)
    {
        if (r.name == kFood || r.name == kIdleTask)
            return fail("reserved resource name: " + r.name);
        if (r.baseRate < 0.0 || r.foodShare < 0.0)
            return fail("negative rate on resource " + r.name);
    }

    const ResourceDef* primary = c.FindResource(c.primaryFood);
    if (!primary || !primary->isFood)
        return fail("primary food source is not a food resource: " + c.primaryFood);

    for (const auto& b : c.buildings)
    {
        for (const auto& [res, amount] : b.cost)
            if (!IsResourceKey(c, res) || amount < 0.0)
                return fail("building " + b.name + " has invalid cost line " + res);
        for (const auto& [res, amount] : b.effects)
            if (!IsResourceKey(c, res) || amount < 0.0)
                return fail("building " + b.name + " has invalid effect " + res);
        if (b.capacity < 0)
            return fail("building " + b.name + " has negative capacity");
        for (const auto& bonus : b.bonuses)
        {
            const WorkerTypeDef* w = c.FindWorker(bonus.workerType);
            if (!w)
                return fail("building " + b.name + " bonus names unknown worker " + bonus.workerType);
            if (std::find(w->tasks.begin(), w->tasks.end(), bonus.resource) == w->tasks.end())
                return fail("building " + b.name + " bonus names task " + bonus.resource +
                            " that " + w->name + " cannot perform");
        }
    }

    bool anyAlwaysAvailable = false;
    for (const auto& w : c.workers)
    {
        if (w.upkeep < 0.0)
            return fail("worker " + w.name + " has negative upkeep");
        for (const auto& task : w.tasks)
            if (!c.FindResource(task))
                return fail("worker " + w.name + " has task with no resource: " + task);
        for (const auto& [task, mult] : w.modifiers)
            if (std::find(w.tasks.begin(), w.tasks.end(), task) == w.tasks.end() || mult < 0.0)
                return fail("worker " + w.name + " has invalid modifier for " + task);
        anyAlwaysAvailable = anyAlwaysAvailable || w.alwaysAvailable;
    }
    if (!anyAlwaysAvailable)
        return fail("no worker type is available from the start");

    if (c.ages.empty())
        return fail("no ages defined");
    if (!c.ages.front().requiredResources.empty() || !c.ages.front().requiredBuildings.empty())
        return fail("initial age must not have requirements");

    for (const auto& a : c.ages)
    {
        for (const auto& [res, amount] : a.requiredResources)
            if (!IsResourceKey(c, res) || amount < 0.0)
                return fail("age " + a.name + " requires unknown resource " + res);
        for (const auto& [bld, count] : a.requiredBuildings)
            if (!c.FindBuilding(bld) || count < 0)
                return fail("age " + a.name + " requires unknown building " + bld);
        for (const auto& bld : a.unlockBuildings)
            if (!c.FindBuilding(bld))
                return fail("age " + a.name + " unlocks unknown building " + bld);
        for (const auto& res : a.unlockResources)
            if (!IsResourceKey(c, res))
                return fail("age " + a.name + " unlocks unknown resource " + res);
        for (const auto& w : a.unlockWorkers)
            if (!c.FindWorker(w))
                return fail("age " + a.name + " unlocks unknown worker " + w);
    }

    for (const auto& t : c.techs)
    {
        if (!c.FindAge(t.age))
            return fail("technology " + t.key + " gated by unknown age " + t.age);
        if (t.cost <= 0.0)
            return fail("technology " + t.key + " must have a positive cost");
        for (const auto& p : t.prereqs)
            if (!c.FindTech(p) || p == t.key)
                return fail("technology " + t.key + " has invalid prerequisite " + p);
    }

    for (const auto& [res, amount] : c.startingResources)
        if (!IsResourceKey(c, res) || amount < 0.0)
            return fail("invalid starting resource " + res);
    for (const auto& [type, count] : c.startingWorkers)
        if (!c.FindWorker(type) || count < 0)
            return fail("invalid starting worker " + type);

    return true;
}

} // namespace civ::sim
