#include "sim/Workforce.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

namespace civ::sim {

namespace {

WorkerGroup MakeEmptyGroup(const WorkerTypeDef& def)
{
    WorkerGroup g;
    g.type = def.name;
    g.assignment[kIdleTask] = 0;
    for (const auto& task : def.tasks)
        g.assignment[task] = 0;
    return g;
}

} // namespace

Workforce::Workforce(const Catalog& catalog)
    : m_catalog(&catalog)
{
    m_groups.reserve(catalog.workers.size());
    for (const auto& def : catalog.workers)
        m_groups.push_back(MakeEmptyGroup(def));
}

WorkerGroup* Workforce::FindGroup(std::string_view type)
{
    const auto it = std::find_if(m_groups.begin(), m_groups.end(),
                                 [&](const WorkerGroup& g) { return g.type == type; });
    return it != m_groups.end() ? &*it : nullptr;
}

const WorkerGroup* Workforce::FindGroup(std::string_view type) const
{
    const auto it = std::find_if(m_groups.begin(), m_groups.end(),
                                 [&](const WorkerGroup& g) { return g.type == type; });
    return it != m_groups.end() ? &*it : nullptr;
}

bool Workforce::IsKnownType(std::string_view type) const
{
    return FindGroup(type) != nullptr;
}

bool Workforce::CanPerform(std::string_view type, std::string_view task) const
{
    const WorkerTypeDef* def = m_catalog->FindWorker(std::string(type));
    if (!def)
        return false;
    return std::find(def->tasks.begin(), def->tasks.end(), task) != def->tasks.end();
}

bool Workforce::Add(std::string_view type, int count)
{
    WorkerGroup* g = FindGroup(type);
    if (!g || count <= 0 || count > std::numeric_limits<int>::max() - g->count)
        return false;

    g->count += count;
    g->assignment[kIdleTask] += count;
    return true;
}

bool Workforce::Remove(std::string_view type, int count)
{
    WorkerGroup* g = FindGroup(type);
    if (!g || count <= 0 || g->count < count)
        return false;

    const WorkerTypeDef* def = m_catalog->FindWorker(g->type);

    int remaining = count;
    auto drain = [&](int& slot) {
        const int taken = std::min(slot, remaining);
        slot -= taken;
        remaining -= taken;
    };

    drain(g->assignment[kIdleTask]);
    for (const auto& task : def->tasks)
    {
        if (remaining == 0)
            break;
        drain(g->assignment[task]);
    }

    g->count -= count;
    return true;
}

bool Workforce::Assign(std::string_view type, std::string_view task, int count)
{
    WorkerGroup* g = FindGroup(type);
    if (!g || count <= 0 || !CanPerform(type, task))
        return false;

    int& idle = g->assignment[kIdleTask];
    if (idle < count)
        return false;

    idle -= count;
    g->assignment[std::string(task)] += count;
    return true;
}

bool Workforce::Unassign(std::string_view type, std::string_view task, int count)
{
    WorkerGroup* g = FindGroup(type);
    if (!g || count <= 0 || !CanPerform(type, task))
        return false;

    int& slot = g->assignment[std::string(task)];
    if (slot < count)
        return false;

    slot -= count;
    g->assignment[kIdleTask] += count;
    return true;
}

double Workforce::UpkeepOf(std::string_view type) const
{
    const WorkerTypeDef* def = m_catalog->FindWorker(std::string(type));
    return def ? def->upkeep : 0.0;
}

double Workforce::FoodUpkeep() const
{
    double total = 0.0;
    for (const auto& g : m_groups)
        total += g.count * UpkeepOf(g.type);
    return total;
}

double Workforce::TypeModifier(const WorkerTypeDef& def, std::string_view task) const
{
    for (const auto& [t, mult] : def.modifiers)
        if (t == task)
            return mult;
    return 1.0;
}

double Workforce::TaskYield(std::string_view type,
                            std::string_view task,
                            int count,
                            const ResourceLedger& ledger,
                            const BuildingRegistry& buildings) const
{
    const WorkerTypeDef* def = m_catalog->FindWorker(std::string(type));
    if (!def || count <= 0)
        return 0.0;

    return count * ledger.GetRate(task) * TypeModifier(*def, task) *
           (1.0 + buildings.CollectionRateBonus(type, task));
}

void Workforce::CollectAndTrack(ResourceLedger& ledger,
                                const BuildingRegistry& buildings,
                                GameStats* stats) const
{
    for (const auto& g : m_groups)
    {
        const WorkerTypeDef* def = m_catalog->FindWorker(g.type);
        if (!def || g.count == 0)
            continue;

        for (const auto& task : def->tasks)
        {
            const auto slot = g.assignment.find(task);
            const int count = slot != g.assignment.end() ? slot->second : 0;
            if (count <= 0)
                continue;

            const double amount = TaskYield(g.type, task, count, ledger, buildings);
            ledger.Add(task, amount);
            if (stats)
                stats->AddResourceGathered(task, amount);

            // Food-source tasks with a food share feed the common pool on top
            // of their own stock, from the base rate only.
            const ResourceDef* res = m_catalog->FindResource(task);
            if (res && res->foodShare > 0.0)
            {
                const double extra = ledger.GetRate(task) * res->foodShare * count;
                ledger.Add(kFood, extra);
                if (stats)
                    stats->AddResourceGathered(kFood, extra);
            }
        }
    }

    ledger.ConsumeFood(FoodUpkeep());
}

int Workforce::Count(std::string_view type) const
{
    const WorkerGroup* g = FindGroup(type);
    return g ? g->count : 0;
}

int Workforce::Idle(std::string_view type) const
{
    return Assigned(type, kIdleTask);
}

int Workforce::Assigned(std::string_view type, std::string_view task) const
{
    const WorkerGroup* g = FindGroup(type);
    if (!g)
        return 0;
    const auto it = g->assignment.find(std::string(task));
    return it != g->assignment.end() ? it->second : 0;
}

int Workforce::TotalPopulation() const
{
    std::int64_t total = 0;
    for (const auto& g : m_groups)
        total += g.count;
    return static_cast<int>(std::min<std::int64_t>(total, std::numeric_limits<int>::max()));
}

bool Workforce::Restore(const std::vector<WorkerGroup>& groups, std::string* outError)
{
    auto fail = [&](std::string msg) {
        if (outError) *outError = std::move(msg);
        return false;
    };

    std::vector<WorkerGroup> next;
    next.reserve(m_catalog->workers.size());
    for (const auto& def : m_catalog->workers)
        next.push_back(MakeEmptyGroup(def));

    std::vector<std::string> seen;
    for (const auto& in : groups)
    {
        if (std::find(seen.begin(), seen.end(), in.type) != seen.end())
            return fail("duplicate worker type: " + in.type);
        seen.push_back(in.type);

        const auto it = std::find_if(next.begin(), next.end(),
                                     [&](const WorkerGroup& g) { return g.type == in.type; });
        if (it == next.end())
            return fail("unknown worker type: " + in.type);
        if (in.count < 0)
            return fail("negative count for worker type: " + in.type);

        std::int64_t sum = 0;
        for (const auto& [task, n] : in.assignment)
        {
            if (task != kIdleTask && !CanPerform(in.type, task))
                return fail(in.type + " cannot perform task: " + task);
            if (n < 0)
                return fail("negative assignment for " + in.type + "/" + task);
            if (n > in.count)
                return fail("assignment for " + in.type + "/" + task + " exceeds its count");
            it->assignment[task] = n;
            sum += n;
        }
        if (sum != in.count)
            return fail("assignments for " + in.type + " do not add up to its count");

        it->count = in.count;
    }

    m_groups = std::move(next);
    return true;
}

} // namespace civ::sim
