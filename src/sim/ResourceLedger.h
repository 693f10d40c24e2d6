#pragma once

#include "sim/Catalog.h"

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace civ::sim {

using StockMap = std::map<std::string, double, std::less<>>;

// Named, non-negative resource stocks plus their base collection rates.
//
// "food" is a virtual resource: it reads as the sum of every food source,
// Add("food") credits the primary source and removals drain every source in
// proportion to its share of the total.
class ResourceLedger
{
public:
    explicit ResourceLedger(const Catalog& catalog);

    // False for unknown names and negative or non-finite amounts.
    bool Add(std::string_view name, double amount);

    // All-or-nothing: false and no mutation when the stock is insufficient.
    [[nodiscard]] bool Remove(std::string_view name, double amount);

    [[nodiscard]] bool   Has(std::string_view name, double amount) const;
    [[nodiscard]] double Get(std::string_view name) const;

    bool SetRate(std::string_view name, double rate);
    [[nodiscard]] double GetRate(std::string_view name) const;

    // Removes as much food as is available (up to amount) and returns it.
    double ConsumeFood(double amount);

    [[nodiscard]] double TotalFood() const;
    [[nodiscard]] bool   IsKnown(std::string_view name) const;

    // Real stocks only; the "food" aggregate is not stored.
    [[nodiscard]] const StockMap& Stocks() const noexcept { return m_stocks; }

private:
    [[nodiscard]] static bool IsFoodKey(std::string_view name) noexcept { return name == kFood; }
    void DrainFood(double amount, double total);

    const Catalog* m_catalog = nullptr;
    StockMap       m_stocks;
    StockMap       m_rates;
};

} // namespace civ::sim
