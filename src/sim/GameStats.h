#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace civ::sim {

struct StatEvent
{
    std::uint64_t tick = 0;
    std::int64_t  timestamp = 0; // unix seconds
    std::string   type;          // "age_advancement", "building_built", ...
    std::string   message;
};

// Aggregate session statistics. Event history is bounded (oldest dropped).
class GameStats
{
public:
    static constexpr std::size_t kMaxEvents = 500;

    GameStats();
    explicit GameStats(std::int64_t startUnix);

    void AddEvent(std::uint64_t tick, std::string type, std::string message);
    void AddEvent(StatEvent e);
    void AddResourceGathered(std::string_view resource, double amount);
    void AddBuildingBuilt(std::string_view building, int count = 1);
    void AddWorkersRecruited(std::string_view type, int count);

    // Appends unless already recorded.
    void AddAgeReached(std::string_view age);

    [[nodiscard]] double TotalResourcesGathered() const;
    [[nodiscard]] int    TotalBuildingsBuilt() const;
    [[nodiscard]] int    TotalWorkersRecruited() const;

    // "2h 5m" of play since the session started.
    [[nodiscard]] std::string PlayTime(std::int64_t nowUnix) const;

    // Up to n most recent events, oldest first.
    [[nodiscard]] std::vector<StatEvent> RecentEvents(std::size_t n) const;

    [[nodiscard]] const std::deque<StatEvent>&              Events() const noexcept { return m_events; }
    [[nodiscard]] const std::map<std::string, double>&      ResourcesGathered() const noexcept { return m_gathered; }
    [[nodiscard]] const std::map<std::string, int>&         BuildingsBuilt() const noexcept { return m_built; }
    [[nodiscard]] const std::map<std::string, int>&         WorkersRecruited() const noexcept { return m_recruited; }
    [[nodiscard]] const std::vector<std::string>&           AgesReached() const noexcept { return m_ages; }
    [[nodiscard]] std::int64_t                              StartTime() const noexcept { return m_startUnix; }

    void SetStartTime(std::int64_t unixSeconds) noexcept { m_startUnix = unixSeconds; }

    [[nodiscard]] static std::int64_t NowUnix();

private:
    std::deque<StatEvent>          m_events;
    std::map<std::string, double>  m_gathered;
    std::map<std::string, int>     m_built;
    std::map<std::string, int>     m_recruited;
    std::vector<std::string>       m_ages;
    std::int64_t                   m_startUnix = 0;
};

} // namespace civ::sim
