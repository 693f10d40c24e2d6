#pragma once

#include "sim/SimEvents.h"
#include "sim/Snapshot.h"

#include <string>

namespace civ::sim {

// What the simulation needs from whatever renders it. Calls never happen
// with the simulation lock held, so implementations may call back into it.
class IDisplay
{
public:
    virtual ~IDisplay() = default;

    virtual void ShowMessage(const std::string& text, Severity severity) = 0;
    virtual void ShowAgeAdvancement(const std::string& age) = 0;
    virtual void PushSnapshot(const Snapshot& snapshot) = 0;

    // The session is over; no further calls follow.
    virtual void Release() = 0;
};

} // namespace civ::sim
