#pragma once

#include "sim/BuildingRegistry.h"
#include "sim/Catalog.h"
#include "sim/ResourceLedger.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace civ::sim {

// Ordered ages with their advancement thresholds and unlock sets.
class ProgressionLadder
{
public:
    explicit ProgressionLadder(const Catalog& catalog);

    // Pure query: the next age when all of its thresholds are met, otherwise
    // currentAge. The last age and unknown ages are returned unchanged.
    [[nodiscard]] std::string CheckAdvancement(const ResourceLedger& ledger,
                                               const BuildingRegistry& buildings,
                                               std::string_view currentAge) const;

    [[nodiscard]] const std::vector<AgeDef>& Ages() const noexcept { return m_catalog->ages; }
    [[nodiscard]] std::optional<std::size_t> IndexOf(std::string_view age) const;
    [[nodiscard]] const AgeDef*              NextAge(std::string_view age) const;
    [[nodiscard]] const AgeDef*              Find(std::string_view age) const;

    // Unlocks accumulate: every age up to and including currentAge counts.
    [[nodiscard]] bool IsBuildingUnlocked(std::string_view building, std::string_view currentAge) const;
    [[nodiscard]] bool IsWorkerUnlocked(std::string_view type, std::string_view currentAge) const;
    [[nodiscard]] std::vector<std::string> UnlockedBuildings(std::string_view currentAge) const;

    // Human-readable lines for every unmet threshold of the next age.
    [[nodiscard]] std::vector<std::string> MissingRequirements(const ResourceLedger& ledger,
                                                               const BuildingRegistry& buildings,
                                                               std::string_view currentAge) const;

private:
    [[nodiscard]] bool MeetsRequirements(const AgeDef& age,
                                         const ResourceLedger& ledger,
                                         const BuildingRegistry& buildings) const;

    const Catalog* m_catalog = nullptr;
};

} // namespace civ::sim
