#pragma once

#include "game/util/NotificationLog.h"
#include "sim/IDisplay.h"

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace civ::app {

// Line-oriented terminal front end. Messages are printed as they arrive and
// kept in a short history; each snapshot redraws the dashboard when the
// settlement has moved on since the last one.
class ConsoleDisplay final : public sim::IDisplay
{
public:
    ConsoleDisplay(std::ostream& out, double refreshSeconds);

    void ShowMessage(const std::string& text, sim::Severity severity) override;
    void ShowAgeAdvancement(const std::string& age) override;
    void PushSnapshot(const sim::Snapshot& snapshot) override;
    void Release() override;

    [[nodiscard]] bool Released() const;

    // "[####----------------] 20.0%"
    [[nodiscard]] static std::string ProgressBar(double fraction, int width = 20);

    [[nodiscard]] static std::string RenderDashboard(const sim::Snapshot& snapshot,
                                                     const game::util::NotificationLog& log,
                                                     std::size_t recentMessages = 5);

private:
    std::ostream&                 m_out;
    float                         m_refreshSeconds = 1.0f;

    mutable std::mutex            m_mutex;
    game::util::NotificationLog   m_log;
    std::uint64_t                 m_lastTick = 0;
    std::uint64_t                 m_lastDrawnTick = ~std::uint64_t{0};
    bool                          m_released = false;
};

} // namespace civ::app
