#include "sim/ResourceLedger.h"

#include <algorithm>
#include <cmath>

namespace civ::sim {

namespace {

// Remainders below this are snapped to zero after a proportional drain.
constexpr double kDrainEpsilon = 1e-5;

[[nodiscard]] bool ValidAmount(double amount) noexcept
{
    return std::isfinite(amount) && amount >= 0.0;
}

} // namespace

ResourceLedger::ResourceLedger(const Catalog& catalog)
    : m_catalog(&catalog)
{
    for (const auto& r : catalog.resources)
    {
        m_stocks[r.name] = 0.0;
        m_rates[r.name]  = r.baseRate;
    }
}

bool ResourceLedger::Add(std::string_view name, double amount)
{
    if (!ValidAmount(amount))
        return false;

    if (IsFoodKey(name))
        name = m_catalog->primaryFood;

    const auto it = m_stocks.find(name);
    if (it == m_stocks.end())
        return false;

    it->second += amount;
    return true;
}

bool ResourceLedger::Remove(std::string_view name, double amount)
{
    if (!ValidAmount(amount))
        return false;

    if (IsFoodKey(name))
    {
        const double total = TotalFood();
        if (total < amount)
            return false;
        DrainFood(amount, total);
        return true;
    }

    const auto it = m_stocks.find(name);
    if (it == m_stocks.end() || it->second < amount)
        return false;

    it->second -= amount;
    return true;
}

bool ResourceLedger::Has(std::string_view name, double amount) const
{
    if (!IsKnown(name))
        return false;
    return Get(name) >= amount;
}

double ResourceLedger::Get(std::string_view name) const
{
    if (IsFoodKey(name))
        return TotalFood();

    const auto it = m_stocks.find(name);
    return it != m_stocks.end() ? it->second : 0.0;
}

bool ResourceLedger::SetRate(std::string_view name, double rate)
{
    if (!ValidAmount(rate))
        return false;

    const auto it = m_rates.find(name);
    if (it == m_rates.end())
        return false;

    it->second = rate;
    return true;
}

double ResourceLedger::GetRate(std::string_view name) const
{
    if (IsFoodKey(name))
        name = m_catalog->primaryFood;

    const auto it = m_rates.find(name);
    return it != m_rates.end() ? it->second : 0.0;
}

double ResourceLedger::ConsumeFood(double amount)
{
    if (!ValidAmount(amount) || amount == 0.0)
        return 0.0;

    const double total = TotalFood();
    const double taken = std::min(amount, total);
    if (taken <= 0.0)
        return 0.0;

    DrainFood(taken, total);
    return taken;
}

double ResourceLedger::TotalFood() const
{
    double total = 0.0;
    for (const auto& r : m_catalog->resources)
    {
        if (!r.isFood)
            continue;
        const auto it = m_stocks.find(r.name);
        if (it != m_stocks.end())
            total += it->second;
    }
    return total;
}

bool ResourceLedger::IsKnown(std::string_view name) const
{
    return IsFoodKey(name) || m_stocks.find(name) != m_stocks.end();
}

void ResourceLedger::DrainFood(double amount, double total)
{
    if (amount <= 0.0 || total <= 0.0)
        return;

    for (const auto& r : m_catalog->resources)
    {
        if (!r.isFood)
            continue;

        double& stock = m_stocks[r.name];
        const double share = stock / total;
        stock -= amount * share;
        if (stock < kDrainEpsilon)
            stock = 0.0;
    }
}

} // namespace civ::sim
