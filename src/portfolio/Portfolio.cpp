#include "portfolio/Portfolio.h"
#include <stdexcept>

namespace rankfolio {
namespace portfolio {

namespace {
// Rounding slack on cash checks.
constexpr double kCashEpsilon = 1e-6;
}

void Portfolio::deposit(Amount amount) {
    if (amount < 0.0) {
        throw std::invalid_argument("Deposit must be non-negative");
    }
    cash_ += amount;
}

std::vector<std::string> Portfolio::heldSymbols() const {
    std::vector<std::string> out;
    out.reserve(holdings_.size());
    for (const auto& [symbol, h] : holdings_) {
        out.push_back(symbol);
    }
    return out;
}

Quantity Portfolio::quantity(const std::string& symbol) const {
    auto it = holdings_.find(symbol);
    return it == holdings_.end() ? 0 : it->second.quantity;
}

void Portfolio::setHolding(const std::string& symbol, Quantity quantity, Price avg_cost) {
    if (quantity <= 0) {
        holdings_.erase(symbol);
        return;
    }
    Holding& h = holdings_[symbol];
    h.symbol = symbol;
    h.quantity = quantity;
    h.avg_cost = avg_cost;
}

void Portfolio::buy(const std::string& symbol, Quantity quantity, Price price, double cost_pct) {
    if (quantity <= 0 || price <= 0.0) {
        throw std::invalid_argument("Buy needs positive quantity and price for " + symbol);
    }
    const Amount debit = static_cast<double>(quantity) * price * (1.0 + cost_pct);
    if (debit > cash_ + kCashEpsilon) {
        throw std::runtime_error("Insufficient cash to buy " + symbol);
    }
    cash_ -= debit;
    if (cash_ < 0.0) cash_ = 0.0;

    Holding& h = holdings_[symbol];
    const double old_cost = h.avg_cost * static_cast<double>(h.quantity);
    h.symbol = symbol;
    h.quantity += quantity;
    h.avg_cost = (old_cost + static_cast<double>(quantity) * price) / static_cast<double>(h.quantity);
}

void Portfolio::sell(const std::string& symbol, Quantity quantity, Price price, double cost_pct) {
    auto it = holdings_.find(symbol);
    if (it == holdings_.end() || quantity <= 0 || quantity > it->second.quantity) {
        throw std::runtime_error("Cannot sell " + std::to_string(quantity) + " of " + symbol);
    }
    cash_ += static_cast<double>(quantity) * price * (1.0 - cost_pct);
    it->second.quantity -= quantity;
    if (it->second.quantity == 0) {
        holdings_.erase(it);
    }
}

Amount Portfolio::totalValue(const std::function<std::optional<Price>(const std::string&)>& price_of) const {
    Amount total = cash_;
    for (const auto& [symbol, h] : holdings_) {
        auto price = price_of(symbol);
        if (price) {
            total += static_cast<double>(h.quantity) * *price;
        }
    }
    return total;
}

} // namespace portfolio
} // namespace rankfolio
