#pragma once

#include <string>
#include <utility>
#include <vector>

namespace civ::sim {

// Pseudo-resource naming the aggregate of every food source.
inline constexpr const char* kFood = "food";

// Reserved task bucket every worker type starts in.
inline constexpr const char* kIdleTask = "idle";

// Ordered (key, value) lines. Order is the declaration order of the table.
using AmountList = std::vector<std::pair<std::string, double>>;
using CountList  = std::vector<std::pair<std::string, int>>;

struct ResourceDef
{
    std::string name;
    double      baseRate   = 0.0;   // units per worker per tick
    bool        isFood     = false; // counts towards the "food" aggregate

    // Extra food credited per worker on this task, as a share of baseRate.
    double      foodShare  = 0.0;
};

struct RateBonus
{
    std::string workerType;
    std::string resource;
    double      fraction = 0.0; // per building
};

struct BuildingDef
{
    std::string            name;
    AmountList             cost;
    AmountList             effects;     // flat per-tick production per building
    int                    capacity = 0; // housing added per building
    std::vector<RateBonus> bonuses;
};

struct WorkerTypeDef
{
    std::string              name;
    double                   upkeep = 0.0;     // food per individual per tick
    std::vector<std::string> tasks;            // eligible tasks, drain priority order
    AmountList               modifiers;        // task -> multiplier on the base rate
    bool                     alwaysAvailable = false;
};

struct AgeDef
{
    std::string              name;
    AmountList               requiredResources;
    CountList                requiredBuildings;
    std::vector<std::string> unlockBuildings;
    std::vector<std::string> unlockResources;
    std::vector<std::string> unlockWorkers;
};

struct TechDef
{
    std::string              key;          // "agriculture" for saves and commands
    std::string              name;         // "Agriculture"
    std::string              description;  // short UI text
    std::string              age;          // earliest age it can be researched in
    double                   cost = 0.0;   // research points required
    std::vector<std::string> prereqs;
    AmountList               effects;      // descriptor -> magnitude
};

// Static declarative tables driving every simulation component.
struct Catalog
{
    std::vector<ResourceDef>   resources;
    std::vector<BuildingDef>   buildings;
    std::vector<WorkerTypeDef> workers;
    std::vector<AgeDef>        ages;        // in progression order
    std::vector<TechDef>       techs;

    std::string primaryFood;                // where Add("food", x) lands
    int         baseCapacity = 1;

    // Session seed.
    AmountList  startingResources;
    CountList   startingWorkers;

    [[nodiscard]] const ResourceDef*   FindResource(const std::string& name) const;
    [[nodiscard]] const BuildingDef*   FindBuilding(const std::string& name) const;
    [[nodiscard]] const WorkerTypeDef* FindWorker(const std::string& name) const;
    [[nodiscard]] const AgeDef*        FindAge(const std::string& name) const;
    [[nodiscard]] const TechDef*       FindTech(const std::string& key) const;

    [[nodiscard]] const std::string& InitialAge() const { return ages.front().name; }
};

// The game's built-in tables.
[[nodiscard]] const Catalog& DefaultCatalog();

// Cross-reference check of every table. Returns false and describes the first
// problem found when outError is non-null.
[[nodiscard]] bool ValidateCatalog(const Catalog& catalog, std::string* outError = nullptr);

} // namespace civ::sim
