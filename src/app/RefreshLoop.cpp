#include "app/RefreshLoop.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace civ::app {

RefreshLoop::RefreshLoop(sim::Simulation& simulation, std::chrono::milliseconds interval)
    : m_sim(simulation)
    , m_interval(std::max(interval, std::chrono::milliseconds(10)))
{
}

RefreshLoop::~RefreshLoop()
{
    Stop();
}

void RefreshLoop::Start(tf::Executor& executor)
{
    if (m_task.valid())
        return;
    m_stop.store(false);
    m_task = executor.async([this] { Run(); });
}

void RefreshLoop::Stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop.store(true);
    }
    m_cv.notify_all();
    if (m_task.valid())
        m_task.wait();
}

void RefreshLoop::Run()
{
    spdlog::debug("RefreshLoop: every {} ms", m_interval.count());

    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop.load())
    {
        if (m_cv.wait_for(lock, m_interval, [this] { return m_stop.load(); }))
            break;

        lock.unlock();
        if (m_sim.IsRunning())
        {
            m_sim.RefreshDisplay();
            m_refreshes.fetch_add(1);
        }
        lock.lock();
    }
}

} // namespace civ::app
