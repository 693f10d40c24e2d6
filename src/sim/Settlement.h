#pragma once

#include "sim/BuildingRegistry.h"
#include "sim/Catalog.h"
#include "sim/GameStats.h"
#include "sim/ResearchBoard.h"
#include "sim/ResourceLedger.h"
#include "sim/Workforce.h"

#include <cstdint>
#include <string>

namespace civ::sim {

// Everything a session mutates. Owned by the Simulation and only touched
// while its lock is held.
struct Settlement
{
    explicit Settlement(const Catalog& catalog)
        : ledger(catalog),
          buildings(catalog),
          workforce(catalog),
          research(catalog),
          age(catalog.InitialAge())
    {
    }

    ResourceLedger   ledger;
    BuildingRegistry buildings;
    Workforce        workforce;
    ResearchBoard    research;
    GameStats        stats;

    std::string      age;
    std::uint64_t    tick = 0;
};

} // namespace civ::sim
