#pragma once

#include "sim/IDisplay.h"
#include "sim/Simulation.h"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace civ::test {

// IDisplay that remembers everything it was shown. With a simulation
// attached it reads a snapshot from inside every message callback, which
// would deadlock if notifications were delivered under the simulation lock.
// Anything shown after Release() is counted in callsAfterRelease.
class RecordingDisplay final : public sim::IDisplay
{
public:
    void Attach(sim::Simulation* simulation) { m_sim = simulation; }

    void ShowMessage(const std::string& text, sim::Severity severity) override
    {
        if (m_sim)
            (void)m_sim->TakeSnapshot();
        std::lock_guard<std::mutex> lock(m_mutex);
        if (releases > 0)
            ++callsAfterRelease;
        messages.emplace_back(text, severity);
    }

    void ShowAgeAdvancement(const std::string& age) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (releases > 0)
            ++callsAfterRelease;
        ages.push_back(age);
    }

    void PushSnapshot(const sim::Snapshot& snapshot) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (releases > 0)
            ++callsAfterRelease;
        snapshots.push_back(snapshot);
    }

    void Release() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++releases;
    }

    [[nodiscard]] bool Saw(const std::string& needle) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(messages.begin(), messages.end(),
                           [&](const auto& m) { return m.first.find(needle) != std::string::npos; });
    }

    [[nodiscard]] std::string Last() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return messages.empty() ? std::string{} : messages.back().first;
    }

    [[nodiscard]] sim::Severity LastSeverity() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return messages.empty() ? sim::Severity::Info : messages.back().second;
    }

    void Clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        messages.clear();
        ages.clear();
        snapshots.clear();
    }

    std::vector<std::pair<std::string, sim::Severity>> messages;
    std::vector<std::string>                           ages;
    std::vector<sim::Snapshot>                         snapshots;
    int                                                releases = 0;
    int                                                callsAfterRelease = 0;

private:
    sim::Simulation*   m_sim = nullptr;
    mutable std::mutex m_mutex;
};

} // namespace civ::test
