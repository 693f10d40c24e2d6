#include "app/ConsoleDisplay.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>

#include <spdlog/fmt/fmt.h>

namespace civ::app {

namespace {

constexpr float kAgeBannerSeconds = 10.0f;

[[nodiscard]] std::string DisplayName(std::string name)
{
    std::replace(name.begin(), name.end(), '_', ' ');
    if (!name.empty())
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

} // namespace

ConsoleDisplay::ConsoleDisplay(std::ostream& out, double refreshSeconds)
    : m_out(out)
    , m_refreshSeconds(static_cast<float>(refreshSeconds > 0.0 ? refreshSeconds : 1.0))
{
    m_log.setMaxLogEntries(200);
}

void ConsoleDisplay::ShowMessage(const std::string& text, sim::Severity severity)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_released)
        return;

    m_log.push(text, severity, m_lastTick);
    m_out << '[' << sim::SeverityName(severity) << "] " << text << '\n';
    m_out.flush();
}

void ConsoleDisplay::ShowAgeAdvancement(const std::string& age)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_released)
        return;

    m_log.push(fmt::format("Your civilization has advanced to the {}", age),
               sim::Severity::Highlight, m_lastTick, kAgeBannerSeconds);

    m_out << "\n"
          << "========================================\n"
          << "        CIVILIZATION ADVANCEMENT\n"
          << "  Congratulations! You have entered the\n"
          << "  " << age << "\n"
          << "  New buildings and workers await you.\n"
          << "========================================\n\n";
    m_out.flush();
}

void ConsoleDisplay::PushSnapshot(const sim::Snapshot& snapshot)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_released)
        return;

    m_lastTick = snapshot.tick;
    m_log.tick(m_refreshSeconds);

    if (snapshot.tick == m_lastDrawnTick)
        return;
    m_lastDrawnTick = snapshot.tick;

    m_out << RenderDashboard(snapshot, m_log);
    m_out.flush();
}

void ConsoleDisplay::Release()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_released)
        return;
    m_released = true;
    m_out.flush();
}

bool ConsoleDisplay::Released() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_released;
}

std::string ConsoleDisplay::ProgressBar(double fraction, int width)
{
    fraction = std::clamp(fraction, 0.0, 1.0);
    width = std::max(width, 1);

    const int filled = static_cast<int>(fraction * width);
    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(width - filled), '-');
    bar += fmt::format("] {:.1f}%", fraction * 100.0);
    return bar;
}

std::string ConsoleDisplay::RenderDashboard(const sim::Snapshot& s,
                                            const game::util::NotificationLog& log,
                                            std::size_t recentMessages)
{
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "\n---------------- {} | tick {} ({:.1f}s/tick) ----------------\n",
                   s.age, s.tick, s.tickSeconds);

    for (const auto& banner : log.banners())
        fmt::format_to(out, "*** {} ***\n", banner.entry.text);

    fmt::format_to(out, "Resources:\n");
    fmt::format_to(out, "  {:<12} {:>10.1f}  (upkeep {:.1f}/tick)\n", "food (all)", s.totalFood, s.foodUpkeep);
    for (const auto& [name, amount] : s.resources)
        fmt::format_to(out, "  {:<12} {:>10.1f}\n", name, amount);

    fmt::format_to(out, "Population: {}/{}{}\n", s.population, s.capacity,
                   s.population >= s.capacity ? " (housing full)" : "");
    for (const auto& [type, group] : s.workers)
    {
        fmt::format_to(out, "  {} x{}:", DisplayName(type), group.count);
        for (const auto& [task, count] : group.assignment)
        {
            if (count > 0)
                fmt::format_to(out, " {}={}", task, count);
        }
        fmt::format_to(out, "\n");
    }

    if (!s.buildings.empty())
    {
        fmt::format_to(out, "Buildings:");
        for (const auto& [name, count] : s.buildings)
            fmt::format_to(out, " {} x{}", DisplayName(name), count);
        fmt::format_to(out, "\n");
    }

    if (!s.research.current.empty())
    {
        const double fraction = s.research.cost > 0.0 ? s.research.progress / s.research.cost : 0.0;
        fmt::format_to(out, "Researching: {} {}\n", s.research.current, ProgressBar(fraction));
    }
    else
    {
        fmt::format_to(out, "No active research. Use 'research <technology>' to start.\n");
    }
    if (!s.research.researched.empty())
        fmt::format_to(out, "Completed: {} technologies\n", s.research.researched.size());

    const auto recent = log.recent(recentMessages);
    if (!recent.empty())
    {
        fmt::format_to(out, "Recent:\n");
        for (const auto& e : recent)
            fmt::format_to(out, "  [{}] {}\n", sim::SeverityName(e.severity), e.text);
    }

    return fmt::to_string(buf);
}

} // namespace civ::app
