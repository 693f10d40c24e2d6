#pragma once

#include "sim/SimEvents.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace civ::game::util {

using sim::Severity;

struct NotificationEntry
{
    std::uint64_t tick = 0;
    Severity severity = Severity::Info;
    std::string text;
};

struct BannerEntry
{
    NotificationEntry entry;
    float ttlSeconds = 0.0f;
};

// Message history for the dashboard with optional expiring banners
// (age advancements and the like).
//
// Notes:
//  - The log is bounded (drop oldest on overflow).
//  - Banners are bounded and expire by TTL.
class NotificationLog
{
public:
    void setMaxLogEntries(std::size_t n) noexcept
    {
        m_maxLogEntries = std::max<std::size_t>(1u, n);
        trimLog();
    }

    void setMaxBanners(std::size_t n) noexcept
    {
        m_maxBanners = std::max<std::size_t>(1u, n);
        trimBanners();
    }

    [[nodiscard]] const std::vector<NotificationEntry>& log() const noexcept { return m_log; }
    [[nodiscard]] const std::vector<BannerEntry>& banners() const noexcept { return m_banners; }

    // Up to n most recent entries, oldest first.
    [[nodiscard]] std::vector<NotificationEntry> recent(std::size_t n) const
    {
        const std::size_t count = std::min(n, m_log.size());
        return std::vector<NotificationEntry>(m_log.end() - static_cast<std::ptrdiff_t>(count), m_log.end());
    }

    // Always logged; also raised as a banner when bannerTtlSeconds > 0.
    void push(std::string text,
              Severity severity,
              std::uint64_t tick,
              float bannerTtlSeconds = 0.0f)
    {
        NotificationEntry e{};
        e.tick = tick;
        e.severity = severity;
        e.text = std::move(text);
        m_log.emplace_back(std::move(e));
        trimLog();

        if (bannerTtlSeconds > 0.0f)
        {
            BannerEntry b{};
            b.entry = m_log.back();
            b.ttlSeconds = bannerTtlSeconds;
            m_banners.emplace_back(std::move(b));
            trimBanners();
        }
    }

    // Advance banner timers and delete expired ones.
    void tick(float dtSeconds) noexcept
    {
        if (!(dtSeconds > 0.0f))
            return;

        for (auto& b : m_banners)
            b.ttlSeconds -= dtSeconds;

        m_banners.erase(std::remove_if(m_banners.begin(), m_banners.end(),
                                       [](const BannerEntry& b) { return b.ttlSeconds <= 0.0f; }),
                        m_banners.end());
    }

private:
    void trimLog() noexcept
    {
        if (m_log.size() <= m_maxLogEntries)
            return;
        const std::size_t drop = m_log.size() - m_maxLogEntries;
        m_log.erase(m_log.begin(), m_log.begin() + static_cast<std::ptrdiff_t>(drop));
    }

    void trimBanners() noexcept
    {
        if (m_banners.size() <= m_maxBanners)
            return;
        const std::size_t drop = m_banners.size() - m_maxBanners;
        m_banners.erase(m_banners.begin(), m_banners.begin() + static_cast<std::ptrdiff_t>(drop));
    }

    std::size_t m_maxLogEntries = 100;
    std::size_t m_maxBanners    = 3;

    std::vector<NotificationEntry> m_log;
    std::vector<BannerEntry> m_banners;
};

} // namespace civ::game::util
