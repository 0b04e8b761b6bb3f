#include "portfolio/OrderPlanner.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace rankfolio {
namespace portfolio {

OrderPlanner::OrderPlanner(double transaction_cost_pct)
    : cost_pct_(transaction_cost_pct)
{
    if (cost_pct_ < 0.0 || cost_pct_ >= 1.0) {
        throw ConfigError("transaction_cost_pct must be within [0, 1)");
    }
}

Quantity OrderPlanner::affordableQuantity(Amount amount, Price price, double cost_pct) {
    if (amount <= 0.0 || price <= 0.0) {
        return 0;
    }
    return static_cast<Quantity>(std::floor(amount / (price * (1.0 + cost_pct))));
}

std::map<std::string, Price> OrderPlanner::tradePrices(const data::PriceTable& prices,
                                                      const Date& date,
                                                      const Portfolio& portfolio,
                                                      RebalanceDecision& decision) {
    std::map<std::string, Price> out;
    for (const auto& symbol : portfolio.heldSymbols()) {
        auto close = prices.lastCloseOnOrBefore(symbol, date);
        if (close) out[symbol] = *close;
    }

    std::vector<BuyInstruction> tradable;
    for (auto& buy : decision.buys) {
        auto close = prices.closeOn(buy.symbol, date);
        if (!close) {
            std::string warning = fmt::format("No close for {} on {}, buy skipped", buy.symbol, date.toString());
            LOG_WARN("{}", warning);
            decision.warnings.push_back(std::move(warning));
            continue;
        }
        out[buy.symbol] = *close;
        tradable.push_back(std::move(buy));
    }
    decision.buys = std::move(tradable);
    return out;
}

OrderPlan OrderPlanner::plan(const RebalanceDecision& decision,
                             const Portfolio& portfolio,
                             const std::map<std::string, Price>& prices,
                             Amount additional_capital) const {
    OrderPlan plan;
    if (additional_capital < 0.0) {
        throw ConfigError("additional_capital must be >= 0");
    }

    auto priceOf = [&](const std::string& symbol) -> std::optional<Price> {
        auto it = prices.find(symbol);
        if (it == prices.end() || it->second <= 0.0) return std::nullopt;
        return it->second;
    };
    auto warn = [&](std::string message) {
        LOG_WARN("{}", message);
        plan.warnings.push_back(std::move(message));
    };

    Amount cash = portfolio.cash() + additional_capital;
    std::map<std::string, Quantity> positions;
    for (const auto& [symbol, h] : portfolio.holdings()) {
        positions[symbol] = h.quantity;
    }

    // 1. Full exits.
    for (const auto& sell : decision.sells) {
        auto pos = positions.find(sell.symbol);
        if (pos == positions.end() || pos->second <= 0) continue;
        auto price = priceOf(sell.symbol);
        if (!price) {
            warn(fmt::format("No price for {} on {}, sell deferred", sell.symbol, decision.date.toString()));
            continue;
        }
        plan.orders.push_back({sell.symbol, OrderSide::SELL, pos->second, *price, sell.reason});
        cash += static_cast<double>(pos->second) * *price * (1.0 - cost_pct_);
        positions.erase(pos);
    }

    // 2. Targets are weights of the post-sell total.
    auto positionValue = [&](const std::string& symbol) {
        auto pos = positions.find(symbol);
        if (pos == positions.end()) return 0.0;
        auto price = priceOf(symbol);
        return price ? static_cast<double>(pos->second) * *price : 0.0;
    };
    Amount total = cash;
    for (const auto& [symbol, qty] : positions) {
        total += positionValue(symbol);
    }

    auto placeBuy = [&](const BuyInstruction& buy, Amount amount, const std::string& reason) {
        auto price = priceOf(buy.symbol);
        if (!price) {
            warn(fmt::format("No price for {} on {}, buy skipped", buy.symbol, decision.date.toString()));
            return;
        }
        amount = std::min(amount, cash);
        Quantity qty = affordableQuantity(amount, *price, cost_pct_);
        if (qty <= 0) {
            warn(fmt::format("Allocation {:.2f} too small for one share of {} at {:.2f}",
                             amount, buy.symbol, *price));
            return;
        }
        plan.orders.push_back({buy.symbol, OrderSide::BUY, qty, *price, reason});
        cash -= static_cast<double>(qty) * *price * (1.0 + cost_pct_);
        if (cash < 0.0) cash = 0.0;
    };

    std::vector<const BuyInstruction*> entries, top_ups, placeholders;
    for (const auto& buy : decision.buys) {
        if (buy.placeholder) placeholders.push_back(&buy);
        else if (buy.top_up) top_ups.push_back(&buy);
        else entries.push_back(&buy);
    }

    // 3a. New entries share the cash evenly, capped at their target.
    size_t remaining = entries.size();
    for (const auto* buy : entries) {
        const Amount share = cash / static_cast<double>(remaining);
        placeBuy(*buy, std::min(total * buy->target_weight, share), "new entry");
        --remaining;
    }

    // 3b. Top-ups, lowest current value first.
    std::stable_sort(top_ups.begin(), top_ups.end(), [&](const BuyInstruction* a, const BuyInstruction* b) {
        const double va = positionValue(a->symbol);
        const double vb = positionValue(b->symbol);
        if (va != vb) return va < vb;
        return a->symbol < b->symbol;
    });
    for (const auto* buy : top_ups) {
        const Amount shortfall = total * buy->target_weight - positionValue(buy->symbol);
        if (shortfall <= 0.0) continue;
        auto price = priceOf(buy->symbol);
        if (price && affordableQuantity(std::min(shortfall, cash), *price, cost_pct_) == 0) {
            continue;
        }
        placeBuy(*buy, shortfall, "top-up");
    }

    // 3c. Placeholder gets its weight of the total.
    for (const auto* buy : placeholders) {
        const Amount want = total * buy->target_weight - positionValue(buy->symbol);
        if (want <= 0.0) continue;
        placeBuy(*buy, want, decision.defensive ? "defensive" : "cash equivalent");
    }

    plan.projected_cash = cash;
    return plan;
}

} // namespace portfolio
} // namespace rankfolio
