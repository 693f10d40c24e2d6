#include "sim/ResearchBoard.h"

#include <cmath>
#include <utility>

namespace civ::sim {

ResearchBoard::ResearchBoard(const Catalog& catalog)
    : m_catalog(&catalog)
{
}

const TechDef* ResearchBoard::Find(std::string_view key) const
{
    return m_catalog->FindTech(std::string(key));
}

bool ResearchBoard::IsResearched(std::string_view key) const
{
    return m_researched.count(std::string(key)) != 0;
}

bool ResearchBoard::PrerequisitesMet(const TechDef& tech) const
{
    for (const auto& p : tech.prereqs)
        if (!IsResearched(p))
            return false;
    return true;
}

bool ResearchBoard::CanStart(std::string_view key) const
{
    if (m_current)
        return false;

    const TechDef* tech = Find(key);
    return tech && !IsResearched(key) && PrerequisitesMet(*tech);
}

bool ResearchBoard::StartResearch(std::string_view key, double carryOver)
{
    if (!CanStart(key) || !std::isfinite(carryOver) || carryOver < 0.0)
        return false;

    m_current  = std::string(key);
    m_progress = carryOver;
    return true;
}

std::optional<std::string> ResearchBoard::ContinueResearch(double points)
{
    if (!m_current)
        return std::nullopt;

    if (std::isfinite(points) && points > 0.0)
        m_progress += points;

    const TechDef* tech = Find(*m_current);
    if (!tech || m_progress < tech->cost)
        return std::nullopt;

    std::string done = std::move(*m_current);
    m_current.reset();
    m_progress = 0.0;
    m_researched.insert(done);
    return done;
}

double ResearchBoard::CurrentCost() const
{
    if (!m_current)
        return 0.0;
    const TechDef* tech = Find(*m_current);
    return tech ? tech->cost : 0.0;
}

std::vector<const TechDef*> ResearchBoard::AvailableTechnologies(const ProgressionLadder& ladder,
                                                                 std::string_view currentAge) const
{
    std::vector<const TechDef*> out;
    const auto ageIdx = ladder.IndexOf(currentAge);
    if (!ageIdx)
        return out;

    for (const auto& tech : m_catalog->techs)
    {
        const auto techAge = ladder.IndexOf(tech.age);
        if (!techAge || *techAge > *ageIdx)
            continue;
        if (IsResearched(tech.key) || !PrerequisitesMet(tech))
            continue;
        out.push_back(&tech);
    }
    return out;
}

bool ResearchBoard::Restore(const std::vector<std::string>& researched,
                            const std::optional<std::string>& current,
                            double progress,
                            std::string* outError)
{
    auto fail = [&](std::string msg) {
        if (outError) *outError = std::move(msg);
        return false;
    };

    std::set<std::string> done;
    for (const auto& key : researched)
    {
        if (!Find(key))
            return fail("unknown technology: " + key);
        done.insert(key);
    }

    if (current)
    {
        if (!Find(*current))
            return fail("unknown technology in progress: " + *current);
        if (done.count(*current))
            return fail("technology in progress is already researched: " + *current);
    }
    if (!std::isfinite(progress) || progress < 0.0)
        return fail("invalid research progress");

    m_researched = std::move(done);
    m_current    = current;
    m_progress   = current ? progress : 0.0;
    return true;
}

} // namespace civ::sim
