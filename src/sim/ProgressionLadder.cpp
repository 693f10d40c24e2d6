#include "sim/ProgressionLadder.h"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

namespace civ::sim {

ProgressionLadder::ProgressionLadder(const Catalog& catalog)
    : m_catalog(&catalog)
{
}

std::optional<std::size_t> ProgressionLadder::IndexOf(std::string_view age) const
{
    const auto& ages = m_catalog->ages;
    for (std::size_t i = 0; i < ages.size(); ++i)
        if (ages[i].name == age)
            return i;
    return std::nullopt;
}

const AgeDef* ProgressionLadder::Find(std::string_view age) const
{
    const auto idx = IndexOf(age);
    return idx ? &m_catalog->ages[*idx] : nullptr;
}

const AgeDef* ProgressionLadder::NextAge(std::string_view age) const
{
    const auto idx = IndexOf(age);
    if (!idx || *idx + 1 >= m_catalog->ages.size())
        return nullptr;
    return &m_catalog->ages[*idx + 1];
}

bool ProgressionLadder::MeetsRequirements(const AgeDef& age,
                                          const ResourceLedger& ledger,
                                          const BuildingRegistry& buildings) const
{
    for (const auto& [res, threshold] : age.requiredResources)
        if (ledger.Get(res) < threshold)
            return false;
    for (const auto& [bld, threshold] : age.requiredBuildings)
        if (buildings.Count(bld) < threshold)
            return false;
    return true;
}

std::string ProgressionLadder::CheckAdvancement(const ResourceLedger& ledger,
                                                const BuildingRegistry& buildings,
                                                std::string_view currentAge) const
{
    const AgeDef* next = NextAge(currentAge);
    if (!next || !MeetsRequirements(*next, ledger, buildings))
        return std::string(currentAge);
    return next->name;
}

bool ProgressionLadder::IsBuildingUnlocked(std::string_view building, std::string_view currentAge) const
{
    const auto idx = IndexOf(currentAge);
    if (!idx)
        return false;

    for (std::size_t i = 0; i <= *idx; ++i)
    {
        const auto& unlocks = m_catalog->ages[i].unlockBuildings;
        if (std::find(unlocks.begin(), unlocks.end(), building) != unlocks.end())
            return true;
    }
    return false;
}

bool ProgressionLadder::IsWorkerUnlocked(std::string_view type, std::string_view currentAge) const
{
    const WorkerTypeDef* def = m_catalog->FindWorker(std::string(type));
    if (!def)
        return false;
    if (def->alwaysAvailable)
        return true;

    const auto idx = IndexOf(currentAge);
    if (!idx)
        return false;

    for (std::size_t i = 0; i <= *idx; ++i)
    {
        const auto& unlocks = m_catalog->ages[i].unlockWorkers;
        if (std::find(unlocks.begin(), unlocks.end(), type) != unlocks.end())
            return true;
    }
    return false;
}

std::vector<std::string> ProgressionLadder::UnlockedBuildings(std::string_view currentAge) const
{
    std::vector<std::string> out;
    for (const auto& def : m_catalog->buildings)
        if (IsBuildingUnlocked(def.name, currentAge))
            out.push_back(def.name);
    return out;
}

std::vector<std::string> ProgressionLadder::MissingRequirements(const ResourceLedger& ledger,
                                                                const BuildingRegistry& buildings,
                                                                std::string_view currentAge) const
{
    std::vector<std::string> out;
    const AgeDef* next = NextAge(currentAge);
    if (!next)
        return out;

    for (const auto& [res, threshold] : next->requiredResources)
    {
        const double have = ledger.Get(res);
        if (have < threshold)
            out.push_back(fmt::format("{}: {:.1f} / {:.0f}", res, have, threshold));
    }
    for (const auto& [bld, threshold] : next->requiredBuildings)
    {
        const int have = buildings.Count(bld);
        if (have < threshold)
            out.push_back(fmt::format("{}: {} / {}", bld, have, threshold));
    }
    return out;
}

} // namespace civ::sim
