#pragma once

#include "sim/Catalog.h"
#include "sim/ProgressionLadder.h"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace civ::sim {

// Technology tree with a single in-flight research slot.
class ResearchBoard
{
public:
    explicit ResearchBoard(const Catalog& catalog);

    [[nodiscard]] const TechDef* Find(std::string_view key) const;

    [[nodiscard]] bool IsResearched(std::string_view key) const;
    [[nodiscard]] bool PrerequisitesMet(const TechDef& tech) const;

    // Known, not yet researched, prerequisites met and nothing else in progress.
    [[nodiscard]] bool CanStart(std::string_view key) const;
    bool StartResearch(std::string_view key, double carryOver = 0.0);

    // Adds points to the current technology. Returns its key when that pushes
    // progress to or past the cost; the slot is then cleared.
    std::optional<std::string> ContinueResearch(double points);

    // Technologies whose age is at or before currentAge, not yet researched,
    // with every prerequisite researched.
    [[nodiscard]] std::vector<const TechDef*> AvailableTechnologies(const ProgressionLadder& ladder,
                                                                    std::string_view currentAge) const;

    [[nodiscard]] const std::optional<std::string>& Current() const noexcept { return m_current; }
    [[nodiscard]] double Progress() const noexcept { return m_progress; }
    [[nodiscard]] double CurrentCost() const;
    [[nodiscard]] const std::set<std::string>& Researched() const noexcept { return m_researched; }

    // Replaces the whole board state; unknown keys or an already researched
    // current technology are rejected without changes.
    bool Restore(const std::vector<std::string>& researched,
                 const std::optional<std::string>& current,
                 double progress,
                 std::string* outError = nullptr);

private:
    const Catalog*             m_catalog = nullptr;
    std::optional<std::string> m_current;
    double                     m_progress = 0.0;
    std::set<std::string>      m_researched;
};

} // namespace civ::sim
