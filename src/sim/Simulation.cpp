#include "sim/Simulation.h"

#include "sim/SettlementSave.h"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

namespace civ::sim {

Simulation::Simulation(const Catalog& catalog, const SimConfig& config, IDisplay* display)
    : m_catalog(&catalog),
      m_config(config),
      m_ladder(catalog),
      m_display(display),
      m_world(std::make_unique<Settlement>(catalog)),
      m_clock(config.tickSeconds, config.maxCatchUpTicks)
{
}

std::int64_t Simulation::ToUnixMs(TimePoint t)
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

Simulation::TimePoint Simulation::FromUnixMs(std::int64_t ms)
{
    using namespace std::chrono;
    return TimePoint(duration_cast<TimePoint::duration>(milliseconds(ms)));
}

bool Simulation::StartSession(TimePoint now)
{
    SimEventQueue events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::Idle)
            return false;

        auto world = std::make_unique<Settlement>(*m_catalog);
        for (const auto& [res, amount] : m_catalog->startingResources)
            world->ledger.Add(res, amount);
        for (const auto& [type, count] : m_catalog->startingWorkers)
            world->workforce.Add(type, count);
        world->stats.AddAgeReached(world->age);

        m_world = std::move(world);
        m_clock.Reset(now);
        m_state = State::Running;

        events.PushMessage("Your settlement begins in the " + m_world->age + ".", Severity::Highlight);
    }

    spdlog::info("Session started ({}s ticks, catch-up cap {})", m_clock.Interval(), m_clock.MaxCatchUp());
    Deliver(events);
    return true;
}

int Simulation::Update(TimePoint now)
{
    SimEventQueue events;
    int ran = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::Running)
            return 0;

        ran = m_clock.TicksDue(now);
        for (int i = 0; i < ran; ++i)
            RunTickLocked(events);
        m_clock.Reset(now);
    }

    if (ran > 1)
        spdlog::debug("Caught up {} ticks", ran);

    Deliver(events);
    return ran;
}

bool Simulation::TickDue(TimePoint now) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == State::Running && m_clock.Due(now);
}

void Simulation::RunTickLocked(SimEventQueue& out)
{
    Settlement& w = *m_world;
    ++w.tick;

    w.workforce.CollectAndTrack(w.ledger, w.buildings, &w.stats);
    w.buildings.Update(w.ledger);

    const double points = m_config.researchRate * w.ledger.Get("knowledge");
    if (const auto done = w.research.ContinueResearch(points))
    {
        const TechDef* tech = w.research.Find(*done);
        const std::string name = tech ? tech->name : *done;
        out.PushMessage("Research completed: " + name, Severity::Success);
        w.stats.AddEvent(w.tick, "research_completed", "Completed research: " + name);
        spdlog::info("Research completed: {} (tick {})", *done, w.tick);
    }

    const std::string next = m_ladder.CheckAdvancement(w.ledger, w.buildings, w.age);
    if (next != w.age)
    {
        w.age = next;
        out.PushAgeAdvanced(next);
        w.stats.AddEvent(w.tick, "age_advancement", "Advanced to " + next);
        w.stats.AddAgeReached(next);
        spdlog::info("Advanced to {} (tick {})", next, w.tick);
    }
}

void Simulation::Quit()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Running)
            spdlog::info("Session stopped at tick {}", m_world->tick);
        m_state = State::Stopped;
    }

    std::lock_guard<std::mutex> lock(m_displayMutex);
    if (m_released)
        return;
    m_released = true;
    if (m_display)
    {
        m_display->ShowMessage("Goodbye! Thanks for playing CivIdle!", Severity::Highlight);
        m_display->Release();
    }
}

Simulation::State Simulation::GetState() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool Simulation::Apply(const Mutation& fn)
{
    SimEventQueue events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::Running)
            return false;
        fn(*m_world, events);
    }
    Deliver(events);
    return true;
}

Snapshot Simulation::TakeSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const Settlement& w = *m_world;

    Snapshot s;
    s.running     = m_state == State::Running;
    s.age         = w.age;
    s.tick        = w.tick;
    s.tickSeconds = m_clock.Interval();

    for (const auto& [name, amount] : w.ledger.Stocks())
        s.resources[name] = amount;
    s.totalFood = w.ledger.TotalFood();

    for (const auto& [name, count] : w.buildings.Counts())
        s.buildings[name] = count;

    for (const auto& g : w.workforce.Groups())
        s.workers[g.type] = WorkerSnapshot{g.count, g.assignment};
    s.population = w.workforce.TotalPopulation();
    s.capacity   = w.buildings.VillagerCapacity();
    s.foodUpkeep = w.workforce.FoodUpkeep();

    s.research.current  = w.research.Current().value_or(std::string{});
    s.research.progress = w.research.Progress();
    s.research.cost     = w.research.CurrentCost();
    s.research.researched.assign(w.research.Researched().begin(), w.research.Researched().end());
    return s;
}

void Simulation::RefreshDisplay()
{
    if (!m_display || !IsRunning())
        return;
    const Snapshot snapshot = TakeSnapshot();

    std::lock_guard<std::mutex> lock(m_displayMutex);
    if (!m_released)
        m_display->PushSnapshot(snapshot);
}

void Simulation::Notify(const std::string& text, Severity severity)
{
    if (!m_display)
        return;
    std::lock_guard<std::mutex> lock(m_displayMutex);
    if (!m_released)
        m_display->ShowMessage(text, severity);
}

bool Simulation::SaveTo(const std::filesystem::path& file, save::SaveError* outError)
{
    save::SaveGame record;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Idle)
        {
            if (outError) *outError = save::SaveError{save::SaveError::Code::InvalidValue, "No session to save"};
            return false;
        }
        record = CaptureSave(*m_world, ToUnixMs(m_clock.LastUpdate()));
    }

    save::SaveError err;
    if (!save::SaveSaveGame(record, file, &err))
    {
        spdlog::error("Save to {} failed [{}]: {}", file.string(), save::SaveErrorCodeName(err.code), err.message);
        if (outError) *outError = std::move(err);
        return false;
    }

    spdlog::info("Saved tick {} to {}", record.tick, file.string());
    return true;
}

bool Simulation::LoadFrom(const std::filesystem::path& file, TimePoint now, save::SaveError* outError)
{
    save::SaveGame record;
    save::SaveError err;
    if (!save::LoadSaveGame(file, record, &err))
    {
        spdlog::warn("Load from {} failed [{}]: {}", file.string(), save::SaveErrorCodeName(err.code), err.message);
        if (outError) *outError = std::move(err);
        return false;
    }

    std::string reason;
    std::unique_ptr<Settlement> world = RestoreSettlement(record, *m_catalog, &reason);
    if (!world)
    {
        spdlog::warn("Load from {} rejected: {}", file.string(), reason);
        if (outError) *outError = save::SaveError{save::SaveError::Code::InvalidValue, reason};
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Stopped)
        {
            if (outError) *outError = save::SaveError{save::SaveError::Code::InvalidValue, "Session has ended"};
            return false;
        }
        m_world = std::move(world);
        m_clock.Reset(record.last_update_unix_ms ? FromUnixMs(*record.last_update_unix_ms) : now);
        m_state = State::Running;
    }

    spdlog::info("Loaded {} (tick {}, {})", file.string(), record.tick, record.age);
    return true;
}

void Simulation::Deliver(SimEventQueue& events)
{
    if (!m_display)
        return;

    std::lock_guard<std::mutex> lock(m_displayMutex);
    if (m_released)
        return;

    events.AddHandler([this](const SimEvent& e) {
        switch (e.type)
        {
        case SimEventType::Message:
            m_display->ShowMessage(e.text, e.severity);
            break;
        case SimEventType::AgeAdvanced:
            m_display->ShowAgeAdvancement(e.text);
            break;
        }
    });
    events.DispatchAll();
}

} // namespace civ::sim
