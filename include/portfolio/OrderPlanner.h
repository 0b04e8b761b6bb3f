#pragma once

#include <map>
#include <string>

#include "data/PriceTable.h"
#include "portfolio/Portfolio.h"
#include "portfolio/RebalanceDecision.h"

namespace rankfolio {
namespace portfolio {

// Turns a RebalanceDecision into whole-share orders.
//
// Sells are full exits and fund the buys. Targets are the instruction weight
// (1/top_n per slot) of the total value after sells; new entries split the available cash up
// to that target, top-ups fill their shortfall lowest-valued first, and the
// cash-equivalent placeholder gets its weight of the total. Orders that round
// to zero shares are dropped with a warning. Cash never goes negative.
class OrderPlanner {
public:
    explicit OrderPlanner(double transaction_cost_pct);

    OrderPlan plan(const RebalanceDecision& decision,
                   const Portfolio& portfolio,
                   const std::map<std::string, Price>& prices,
                   Amount additional_capital = 0.0) const;

    double transactionCostPct() const { return cost_pct_; }

    static Quantity affordableQuantity(Amount amount, Price price, double cost_pct);

    // Prices for trading on `date`. Holdings are marked at their last close on
    // or before `date`; buys fill only at the close on `date`. Buys without that
    // close are removed from `decision` with a warning.
    static std::map<std::string, Price> tradePrices(const data::PriceTable& prices,
                                                    const Date& date,
                                                    const Portfolio& portfolio,
                                                    RebalanceDecision& decision);

private:
    double cost_pct_;
};

} // namespace portfolio
} // namespace rankfolio
