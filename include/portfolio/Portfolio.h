#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace rankfolio {
namespace portfolio {

// Holdings plus a cash balance. Positions with zero quantity are removed.
class Portfolio {
public:
    Portfolio() = default;
    explicit Portfolio(Amount cash) : cash_(cash) {}

    Amount cash() const { return cash_; }
    void deposit(Amount amount);

    const std::map<std::string, Holding>& holdings() const { return holdings_; }
    std::vector<std::string> heldSymbols() const;
    bool holds(const std::string& symbol) const { return holdings_.count(symbol) > 0; }
    Quantity quantity(const std::string& symbol) const;

    // Sets a position directly (live account sync, fixtures).
    void setHolding(const std::string& symbol, Quantity quantity, Price avg_cost);

    // Buy debits price * qty * (1 + cost), sell credits price * qty * (1 - cost).
    // Throws std::runtime_error when cash would go negative or the sell exceeds the position.
    void buy(const std::string& symbol, Quantity quantity, Price price, double cost_pct);
    void sell(const std::string& symbol, Quantity quantity, Price price, double cost_pct);

    // Cash plus holdings valued by `price_of`; holdings without a price count as zero.
    Amount totalValue(const std::function<std::optional<Price>(const std::string&)>& price_of) const;

private:
    std::map<std::string, Holding> holdings_;
    Amount cash_ = 0.0;
};

} // namespace portfolio
} // namespace rankfolio
