#include "app/InputPump.h"

#include <cerrno>
#include <istream>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace civ::app {

namespace {
constexpr int kReadSliceMs = 100;
}

InputPump::InputPump(std::istream& in)
    : m_in(&in)
{
}

InputPump::InputPump(int fd)
    : m_fd(fd)
{
}

InputPump::~InputPump()
{
    Stop();
}

void InputPump::Start(tf::Executor& executor)
{
    if (m_task.valid())
        return;
    m_stop.store(false);
    m_task = executor.async([this] { Run(); });
}

void InputPump::Stop()
{
    m_stop.store(true);
    m_cv.notify_all();
    if (m_task.valid())
        m_task.wait();
}

std::optional<std::string> InputPump::Poll(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_lines.empty() || m_eof || m_stop.load(); });

    if (m_lines.empty())
        return std::nullopt;

    std::string line = std::move(m_lines.front());
    m_lines.pop_front();
    return line;
}

bool InputPump::Closed() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_eof && m_lines.empty();
}

void InputPump::PushLine(std::string line)
{
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lines.push_back(std::move(line));
    }
    m_cv.notify_one();
}

void InputPump::MarkEof()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_eof = true;
}

void InputPump::Run()
{
    spdlog::debug("InputPump: reader started");

    if (m_fd >= 0)
        RunDescriptor();
    else
        RunStream();

    m_cv.notify_all();
    spdlog::debug("InputPump: reader finished");
}

void InputPump::RunStream()
{
    std::string line;
    while (!m_stop.load())
    {
        if (!std::getline(*m_in, line))
        {
            MarkEof();
            return;
        }
        PushLine(line);
    }
}

void InputPump::RunDescriptor()
{
    char buf[4096];
    while (!m_stop.load())
    {
        pollfd pfd{};
        pfd.fd = m_fd;
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, kReadSliceMs);
        if (rc == 0 || (rc < 0 && errno == EINTR))
            continue;
        if (rc < 0)
        {
            spdlog::warn("InputPump: poll on fd {} failed (errno {})", m_fd, errno);
            MarkEof();
            return;
        }

        const ssize_t n = ::read(m_fd, buf, sizeof(buf));
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            spdlog::warn("InputPump: read on fd {} failed (errno {})", m_fd, errno);
            MarkEof();
            return;
        }
        if (n == 0)
        {
            if (!m_partial.empty())
                PushLine(std::exchange(m_partial, {}));
            MarkEof();
            return;
        }

        m_partial.append(buf, static_cast<std::size_t>(n));
        std::size_t nl;
        while ((nl = m_partial.find('\n')) != std::string::npos)
        {
            PushLine(m_partial.substr(0, nl));
            m_partial.erase(0, nl + 1);
        }
    }
}

} // namespace civ::app
