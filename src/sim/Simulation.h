#pragma once

#include "civ/save/SaveGame.hpp"
#include "sim/Catalog.h"
#include "sim/IDisplay.h"
#include "sim/ProgressionLadder.h"
#include "sim/Settlement.h"
#include "sim/SimEvents.h"
#include "sim/Snapshot.h"
#include "sim/TickClock.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>

namespace civ::sim {

struct SimConfig
{
    double tickSeconds     = 1.0;
    int    maxCatchUpTicks = 100;
    double researchRate    = 0.1; // share of the knowledge stock fed to research each tick
};

// Owns the settlement and drives it. Every tick, command, snapshot read,
// save capture and load swap runs under one mutex; notifications raised
// meanwhile are delivered to the display after it is released.
class Simulation
{
public:
    using TimePoint = TickClock::TimePoint;

    enum class State : std::uint8_t
    {
        Idle,    // no session yet
        Running,
        Stopped, // quit; terminal
    };

    using Mutation = std::function<void(Settlement&, SimEventQueue&)>;

    Simulation(const Catalog& catalog, const SimConfig& config, IDisplay* display = nullptr);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Idle -> Running with the starting grants. False in any other state.
    bool StartSession(TimePoint now);

    // Runs the ticks owed since the last update (at least one, at most
    // maxCatchUpTicks) and returns how many ran. No-op unless running.
    int Update(TimePoint now);

    // True once a full tick interval has elapsed.
    [[nodiscard]] bool TickDue(TimePoint now) const;

    // Running -> Stopped and releases the display. Idempotent. The display
    // receives nothing once released.
    void Quit();

    [[nodiscard]] State GetState() const;
    [[nodiscard]] bool  IsRunning() const { return GetState() == State::Running; }

    // Runs fn with exclusive access to the settlement. False (fn not called)
    // unless the session is running.
    bool Apply(const Mutation& fn);

    [[nodiscard]] Snapshot TakeSnapshot() const;

    // Pushes a fresh snapshot to the display.
    void RefreshDisplay();

    // Direct message to the display for work done outside Apply().
    void Notify(const std::string& text, Severity severity = Severity::Info);

    bool SaveTo(const std::filesystem::path& file, save::SaveError* outError = nullptr);

    // All-or-nothing: the file is parsed and a complete settlement is built
    // before the live one is swapped out. Starts the session when idle.
    bool LoadFrom(const std::filesystem::path& file, TimePoint now, save::SaveError* outError = nullptr);

    [[nodiscard]] const Catalog&           GetCatalog() const noexcept { return *m_catalog; }
    [[nodiscard]] const ProgressionLadder& Ladder() const noexcept { return m_ladder; }
    [[nodiscard]] const SimConfig&         Config() const noexcept { return m_config; }

private:
    void RunTickLocked(SimEventQueue& out);
    void Deliver(SimEventQueue& events);

    [[nodiscard]] static std::int64_t ToUnixMs(TimePoint t);
    [[nodiscard]] static TimePoint    FromUnixMs(std::int64_t ms);

    const Catalog*              m_catalog = nullptr;
    SimConfig                   m_config;
    ProgressionLadder           m_ladder;
    IDisplay*                   m_display = nullptr;

    mutable std::mutex          m_mutex;
    std::unique_ptr<Settlement> m_world;
    TickClock                   m_clock;
    State                       m_state = State::Idle;

    std::mutex                  m_displayMutex; // serialises display calls with Release()
    bool                        m_released = false;
};

} // namespace civ::sim
