#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace civ::sim {

struct WorkerSnapshot
{
    int                        count = 0;
    std::map<std::string, int> assignment; // includes "idle"
};

struct ResearchSnapshot
{
    std::string              current;  // empty when nothing is in progress
    double                   progress = 0.0;
    double                   cost     = 0.0;
    std::vector<std::string> researched;
};

// Immutable copy of the simulation state for rendering.
struct Snapshot
{
    bool                                  running = false;
    std::string                           age;
    std::uint64_t                         tick = 0;
    double                                tickSeconds = 1.0;

    std::map<std::string, double>         resources;
    double                                totalFood = 0.0;
    std::map<std::string, int>            buildings;
    std::map<std::string, WorkerSnapshot> workers;
    int                                   population = 0;
    int                                   capacity   = 0;
    double                                foodUpkeep = 0.0;

    ResearchSnapshot                      research;
};

} // namespace civ::sim
