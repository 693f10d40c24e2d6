#pragma once

#include "sim/Catalog.h"
#include "sim/ResourceLedger.h"

#include <map>
#include <string>
#include <string_view>

namespace civ::sim {

using CountMap = std::map<std::string, int, std::less<>>;

// Constructed building counts and everything derived from them: passive
// production, housing capacity and worker collection-rate bonuses.
class BuildingRegistry
{
public:
    explicit BuildingRegistry(const Catalog& catalog);

    [[nodiscard]] bool IsKnown(std::string_view name) const;
    [[nodiscard]] const BuildingDef* Find(std::string_view name) const;

    [[nodiscard]] bool CanBuild(std::string_view name, const ResourceLedger& ledger) const;

    // Deducts the full cost and adds one building, or changes nothing.
    bool Build(std::string_view name, ResourceLedger& ledger);

    // Flat per-tick production of every building, scaled by count.
    void Update(ResourceLedger& ledger) const;

    [[nodiscard]] int    VillagerCapacity() const;
    [[nodiscard]] double CollectionRateBonus(std::string_view workerType,
                                             std::string_view resource) const;

    [[nodiscard]] int Count(std::string_view name) const;
    [[nodiscard]] const CountMap& Counts() const noexcept { return m_counts; }

    // Replaces every count. Unknown names or negative counts are rejected and
    // leave the registry untouched.
    bool Restore(const std::map<std::string, int>& counts, std::string* outError = nullptr);

private:
    const Catalog* m_catalog = nullptr;
    CountMap       m_counts;
};

} // namespace civ::sim
