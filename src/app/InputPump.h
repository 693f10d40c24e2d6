#pragma once

#include <taskflow/taskflow.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace civ::app {

// Reads lines on an executor worker and hands them to the game thread.
// The descriptor form reads the fd directly, bypassing stdio buffering, and
// waits in short slices so Stop() is honoured while the player is idle.
class InputPump
{
public:
    explicit InputPump(std::istream& in);
    explicit InputPump(int fd);
    ~InputPump();

    InputPump(const InputPump&) = delete;
    InputPump& operator=(const InputPump&) = delete;

    void Start(tf::Executor& executor);
    void Stop();

    // Next line, waiting at most timeout for one to arrive.
    [[nodiscard]] std::optional<std::string> Poll(std::chrono::milliseconds timeout);

    // The stream hit EOF or failed and every line has been taken.
    [[nodiscard]] bool Closed() const;

private:
    void Run();
    void RunStream();
    void RunDescriptor();
    void PushLine(std::string line);
    void MarkEof();

    std::istream*           m_in = nullptr;
    int                     m_fd = -1;
    std::string             m_partial;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::deque<std::string> m_lines;
    bool                    m_eof = false;
    std::atomic<bool>       m_stop{false};
    std::future<void>       m_task;
};

} // namespace civ::app
