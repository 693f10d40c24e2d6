#pragma once

#include "sim/BuildingRegistry.h"
#include "sim/Catalog.h"
#include "sim/GameStats.h"
#include "sim/ResourceLedger.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace civ::sim {

// Population of one worker type. assignment always holds "idle" plus every
// eligible task, and its values sum to count.
struct WorkerGroup
{
    std::string                type;
    int                        count = 0;
    std::map<std::string, int> assignment;
};

class Workforce
{
public:
    explicit Workforce(const Catalog& catalog);

    [[nodiscard]] bool IsKnownType(std::string_view type) const;
    [[nodiscard]] bool CanPerform(std::string_view type, std::string_view task) const;

    // New hires start idle.
    bool Add(std::string_view type, int count);

    // Drains idle first, then tasks in the worker type's declared task order.
    bool Remove(std::string_view type, int count);

    bool Assign(std::string_view type, std::string_view task, int count);
    bool Unassign(std::string_view type, std::string_view task, int count);

    [[nodiscard]] double FoodUpkeep() const;
    [[nodiscard]] double UpkeepOf(std::string_view type) const;

    // One tick of gathering followed by food upkeep. Every gathered amount is
    // reported to stats (when given) once per task.
    void CollectAndTrack(ResourceLedger& ledger,
                         const BuildingRegistry& buildings,
                         GameStats* stats) const;

    // Amount a single task yields per tick for the given head count.
    [[nodiscard]] double TaskYield(std::string_view type,
                                   std::string_view task,
                                   int count,
                                   const ResourceLedger& ledger,
                                   const BuildingRegistry& buildings) const;

    [[nodiscard]] int Count(std::string_view type) const;
    [[nodiscard]] int Idle(std::string_view type) const;
    [[nodiscard]] int Assigned(std::string_view type, std::string_view task) const;
    [[nodiscard]] int TotalPopulation() const;

    // Groups in catalog order.
    [[nodiscard]] const std::vector<WorkerGroup>& Groups() const noexcept { return m_groups; }

    // Replaces every group. Each entry must name a known type, use eligible
    // tasks only and have assignments summing to its count; otherwise nothing
    // changes.
    bool Restore(const std::vector<WorkerGroup>& groups, std::string* outError = nullptr);

private:
    [[nodiscard]] WorkerGroup*       FindGroup(std::string_view type);
    [[nodiscard]] const WorkerGroup* FindGroup(std::string_view type) const;
    [[nodiscard]] double             TypeModifier(const WorkerTypeDef& def, std::string_view task) const;

    const Catalog*           m_catalog = nullptr;
    std::vector<WorkerGroup> m_groups;
};

} // namespace civ::sim
