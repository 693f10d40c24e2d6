#pragma once

#include "civ/save/SaveGame.hpp"
#include "sim/Catalog.h"
#include "sim/Settlement.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace civ::sim {

// Flat save record of a settlement. lastUpdateUnixMs is the wall-clock time
// of the last processed tick.
[[nodiscard]] save::SaveGame CaptureSave(const Settlement& world, std::int64_t lastUpdateUnixMs);

// Builds a complete settlement from a save record without touching any live
// state. Returns nullptr on the first inconsistency (unknown age, negative
// stock, assignments not adding up, ...) and describes it in outError.
// Missing optional sections get fresh defaults.
[[nodiscard]] std::unique_ptr<Settlement> RestoreSettlement(const save::SaveGame& record,
                                                            const Catalog& catalog,
                                                            std::string* outError = nullptr);

} // namespace civ::sim
