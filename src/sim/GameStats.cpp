#include "sim/GameStats.h"

#include <algorithm>
#include <chrono>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace civ::sim {

GameStats::GameStats()
    : GameStats(NowUnix())
{
}

GameStats::GameStats(std::int64_t startUnix)
    : m_startUnix(startUnix)
{
}

std::int64_t GameStats::NowUnix()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

void GameStats::AddEvent(std::uint64_t tick, std::string type, std::string message)
{
    AddEvent(StatEvent{tick, NowUnix(), std::move(type), std::move(message)});
}

void GameStats::AddEvent(StatEvent e)
{
    m_events.push_back(std::move(e));
    while (m_events.size() > kMaxEvents)
        m_events.pop_front();
}

void GameStats::AddResourceGathered(std::string_view resource, double amount)
{
    if (amount <= 0.0)
        return;
    m_gathered[std::string(resource)] += amount;
}

void GameStats::AddBuildingBuilt(std::string_view building, int count)
{
    if (count <= 0)
        return;
    m_built[std::string(building)] += count;
}

void GameStats::AddWorkersRecruited(std::string_view type, int count)
{
    if (count <= 0)
        return;
    m_recruited[std::string(type)] += count;
}

void GameStats::AddAgeReached(std::string_view age)
{
    if (std::find(m_ages.begin(), m_ages.end(), age) != m_ages.end())
        return;
    m_ages.emplace_back(age);
}

double GameStats::TotalResourcesGathered() const
{
    double total = 0.0;
    for (const auto& [_, amount] : m_gathered)
        total += amount;
    return total;
}

int GameStats::TotalBuildingsBuilt() const
{
    int total = 0;
    for (const auto& [_, count] : m_built)
        total += count;
    return total;
}

int GameStats::TotalWorkersRecruited() const
{
    int total = 0;
    for (const auto& [_, count] : m_recruited)
        total += count;
    return total;
}

std::string GameStats::PlayTime(std::int64_t nowUnix) const
{
    const std::int64_t elapsed = std::max<std::int64_t>(0, nowUnix - m_startUnix);
    const std::int64_t hours   = elapsed / 3600;
    const std::int64_t minutes = (elapsed % 3600) / 60;
    return fmt::format("{}h {}m", hours, minutes);
}

std::vector<StatEvent> GameStats::RecentEvents(std::size_t n) const
{
    const std::size_t count = std::min(n, m_events.size());
    return std::vector<StatEvent>(m_events.end() - static_cast<std::ptrdiff_t>(count), m_events.end());
}

} // namespace civ::sim
