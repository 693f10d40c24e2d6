#include "sim/SimEvents.h"

#include <utility>

namespace civ::sim {

void SimEventQueue::PushMessage(std::string text, Severity severity)
{
    Push(SimEvent{SimEventType::Message, severity, std::move(text)});
}

void SimEventQueue::PushAgeAdvanced(std::string age)
{
    Push(SimEvent{SimEventType::AgeAdvanced, Severity::Highlight, std::move(age)});
}

std::deque<SimEvent> SimEventQueue::Drain()
{
    std::deque<SimEvent> out;
    out.swap(queue_);
    return out;
}

void SimEventQueue::DispatchAll()
{
    std::deque<SimEvent> pending = Drain();
    for (const auto& e : pending)
        for (const auto& h : handlers_)
            h(e);
}

} // namespace civ::sim
