#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace civ::sim {

enum class Severity : std::uint8_t
{
    Info = 0,
    Success,
    Warning,
    Error,
    Highlight,
};

[[nodiscard]] inline const char* SeverityName(Severity s) noexcept
{
    switch (s)
    {
    case Severity::Info: return "INFO";
    case Severity::Success: return "OK";
    case Severity::Warning: return "WARN";
    case Severity::Error: return "ERROR";
    case Severity::Highlight: return "NOTE";
    }
    return "?";
}

enum class SimEventType : std::uint8_t
{
    Message,
    AgeAdvanced,
};

struct SimEvent
{
    SimEventType type     = SimEventType::Message;
    Severity     severity = Severity::Info;
    std::string  text;     // message body, or the new age's name
};

// Notifications raised while the simulation lock is held. They are queued and
// handed to handlers by DispatchAll() once the lock has been released.
class SimEventQueue
{
public:
    using Handler = std::function<void(const SimEvent&)>;

    void Push(SimEvent&& e) { queue_.push_back(std::move(e)); }

    void PushMessage(std::string text, Severity severity = Severity::Info);
    void PushAgeAdvanced(std::string age);

    // Moves every pending event out, leaving the queue empty.
    [[nodiscard]] std::deque<SimEvent> Drain();

    // Handlers are called in registration order.
    void AddHandler(Handler h) { handlers_.push_back(std::move(h)); }

    void DispatchAll();

private:
    std::deque<SimEvent> queue_;
    std::vector<Handler> handlers_;
};

} // namespace civ::sim
