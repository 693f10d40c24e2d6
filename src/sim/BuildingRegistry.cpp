#include "sim/BuildingRegistry.h"

#include <utility>

namespace civ::sim {

BuildingRegistry::BuildingRegistry(const Catalog& catalog)
    : m_catalog(&catalog)
{
    for (const auto& b : catalog.buildings)
        m_counts[b.name] = 0;
}

bool BuildingRegistry::IsKnown(std::string_view name) const
{
    return m_counts.find(name) != m_counts.end();
}

const BuildingDef* BuildingRegistry::Find(std::string_view name) const
{
    return m_catalog->FindBuilding(std::string(name));
}

bool BuildingRegistry::CanBuild(std::string_view name, const ResourceLedger& ledger) const
{
    const BuildingDef* def = Find(name);
    if (!def)
        return false;

    for (const auto& [res, amount] : def->cost)
        if (!ledger.Has(res, amount))
            return false;
    return true;
}

bool BuildingRegistry::Build(std::string_view name, ResourceLedger& ledger)
{
    const BuildingDef* def = Find(name);
    if (!def || !CanBuild(name, ledger))
        return false;

    // Cost lines can overlap through the food aggregate, so deduct on a copy
    // and commit only if every line went through.
    ResourceLedger staged = ledger;
    for (const auto& [res, amount] : def->cost)
        if (!staged.Remove(res, amount))
            return false;

    ledger = std::move(staged);
    ++m_counts[def->name];
    return true;
}

void BuildingRegistry::Update(ResourceLedger& ledger) const
{
    for (const auto& def : m_catalog->buildings)
    {
        const int count = Count(def.name);
        if (count <= 0)
            continue;

        for (const auto& [res, amount] : def.effects)
            ledger.Add(res, amount * count);
    }
}

int BuildingRegistry::VillagerCapacity() const
{
    int capacity = m_catalog->baseCapacity;
    for (const auto& def : m_catalog->buildings)
        capacity += def.capacity * Count(def.name);
    return capacity;
}

double BuildingRegistry::CollectionRateBonus(std::string_view workerType,
                                             std::string_view resource) const
{
    double bonus = 0.0;
    for (const auto& def : m_catalog->buildings)
    {
        const int count = Count(def.name);
        if (count <= 0)
            continue;

        for (const auto& b : def.bonuses)
            if (b.workerType == workerType && b.resource == resource)
                bonus += b.fraction * count;
    }
    return bonus;
}

int BuildingRegistry::Count(std::string_view name) const
{
    const auto it = m_counts.find(name);
    return it != m_counts.end() ? it->second : 0;
}

bool BuildingRegistry::Restore(const std::map<std::string, int>& counts, std::string* outError)
{
    CountMap next;
    for (const auto& def : m_catalog->buildings)
        next[def.name] = 0;

    for (const auto& [name, count] : counts)
    {
        const auto it = next.find(name);
        if (it == next.end())
        {
            if (outError) *outError = "unknown building: " + name;
            return false;
        }
        if (count < 0)
        {
            if (outError) *outError = "negative count for building: " + name;
            return false;
        }
        it->second = count;
    }

    m_counts = std::move(next);
    return true;
}

} // namespace civ::sim
