#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "backtest/BacktestResult.h"
#include "data/IPriceHistoryProvider.h"
#include "data/IRestrictionListProvider.h"
#include "portfolio/OrderPlanner.h"
#include "portfolio/PortfolioReconciler.h"
#include "ranking/MarketRegimeFilter.h"
#include "ranking/MomentumScorer.h"
#include "ranking/UniverseFilter.h"

namespace rankfolio {
namespace backtest {

enum class RebalanceFrequency { WEEKLY, MONTHLY };

RebalanceFrequency parseFrequency(const std::string& text);

struct BacktestConfig {
    Date start;
    Date end;
    Weekday rebalance_day = Weekday::WEDNESDAY;
    RebalanceFrequency frequency = RebalanceFrequency::WEEKLY;
    double initial_capital = 1000000.0;
    double transaction_cost_pct = 0.0;
    double risk_free_rate = 0.05;
    // Calendar days of history loaded before `start` for the indicators.
    int warmup_calendar_days = 600;

    std::vector<std::string> universe;
    portfolio::PortfolioRules rules;
    ranking::FilterConfig filters;
    ranking::RegimeConfig regime;

    // Throws ConfigError.
    void validate() const;
};

// Replays the ranking and band rule over [start, end].
//
// States: WARMING_UP (cash only, before the first rebalance) -> REBALANCING
// <-> HOLDING -> FINALIZED. A rebalance date without any universe close is
// skipped and the portfolio carried forward. DataError is thrown when the
// universe has no closes in the range or every rebalance date was skipped.
class BacktestSimulator {
public:
    enum class State { WARMING_UP, REBALANCING, HOLDING, FINALIZED };

    BacktestSimulator(BacktestConfig config,
                      std::shared_ptr<const data::IPriceHistoryProvider> prices,
                      std::shared_ptr<const data::IRestrictionListProvider> restrictions,
                      ranking::WeightTriple weights);

    // Runs once; a second call throws std::logic_error.
    void run();

    State state() const { return state_; }
    // Only valid once FINALIZED.
    const BacktestResult& getResult() const;

    static std::vector<Date> rebalanceDates(const Date& start, const Date& end,
                                            Weekday weekday, RebalanceFrequency frequency);
    static std::string stateToString(State state);

private:
    void rebalance(const Date& date);
    void recordDay(const Date& date);
    std::vector<std::string> pricedSymbols() const;

    BacktestConfig config_;
    std::shared_ptr<const data::IPriceHistoryProvider> price_provider_;
    std::shared_ptr<const data::IRestrictionListProvider> restriction_provider_;
    ranking::WeightTriple weights_;

    ranking::MomentumScorer scorer_;
    ranking::UniverseFilter filter_;
    ranking::MarketRegimeFilter regime_filter_;
    portfolio::PortfolioReconciler reconciler_;
    portfolio::OrderPlanner planner_;

    State state_ = State::WARMING_UP;
    data::PriceTable prices_;
    portfolio::Portfolio portfolio_;
    BacktestResult result_;
    int trades_ = 0;
};

} // namespace backtest
} // namespace rankfolio
