#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace civ::sim {

// Wall-clock tick accounting for an idle game.
//
// Unlike a frame accumulator, leftover fractions are not carried: after every
// update the reference point moves to "now" and any backlog past the catch-up
// cap is dropped.
class TickClock {
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    explicit TickClock(double intervalSeconds = 1.0, int maxCatchUp = 100)
        : m_interval(intervalSeconds > 0.0 ? intervalSeconds : 1.0),
          m_maxCatchUp(std::max(1, maxCatchUp)) {}

    // Whole intervals elapsed since the last update, clamped to
    // [1, maxCatchUp]. Time running backwards counts as no time at all.
    [[nodiscard]] int TicksDue(TimePoint now) const
    {
        const double elapsed = std::chrono::duration<double>(now - m_last).count();
        if (elapsed <= 0.0)
            return 1;
        const double whole = elapsed / m_interval;
        if (whole >= static_cast<double>(m_maxCatchUp))
            return m_maxCatchUp;
        return std::max(1, static_cast<int>(whole));
    }

    // True once at least one full interval has elapsed.
    [[nodiscard]] bool Due(TimePoint now) const
    {
        return std::chrono::duration<double>(now - m_last).count() >= m_interval;
    }

    void Reset(TimePoint now) noexcept { m_last = now; }

    [[nodiscard]] TimePoint LastUpdate() const noexcept { return m_last; }
    [[nodiscard]] double    Interval()   const noexcept { return m_interval; }
    [[nodiscard]] int       MaxCatchUp() const noexcept { return m_maxCatchUp; }

private:
    double    m_interval;
    int       m_maxCatchUp;
    TimePoint m_last{};
};

} // namespace civ::sim
