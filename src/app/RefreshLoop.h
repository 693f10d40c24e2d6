#pragma once

#include "sim/Simulation.h"

#include <taskflow/taskflow.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <future>
#include <mutex>

namespace civ::app {

// Pushes a fresh snapshot to the display every interval until stopped.
class RefreshLoop
{
public:
    RefreshLoop(sim::Simulation& simulation, std::chrono::milliseconds interval);
    ~RefreshLoop();

    RefreshLoop(const RefreshLoop&) = delete;
    RefreshLoop& operator=(const RefreshLoop&) = delete;

    void Start(tf::Executor& executor);
    void Stop();

    [[nodiscard]] std::uint64_t Refreshes() const noexcept { return m_refreshes.load(); }

private:
    void Run();

    sim::Simulation&           m_sim;
    std::chrono::milliseconds  m_interval;

    std::mutex                 m_mutex;
    std::condition_variable    m_cv;
    std::atomic<bool>          m_stop{false};
    std::atomic<std::uint64_t> m_refreshes{0};
    std::future<void>          m_task;
};

} // namespace civ::app
