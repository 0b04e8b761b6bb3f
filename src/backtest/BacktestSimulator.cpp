#include "backtest/BacktestSimulator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace rankfolio {
namespace backtest {

RebalanceFrequency parseFrequency(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "weekly" || lower == "w") return RebalanceFrequency::WEEKLY;
    if (lower == "monthly" || lower == "m") return RebalanceFrequency::MONTHLY;
    throw ConfigError("Unknown rebalance frequency: " + text);
}

void BacktestConfig::validate() const {
    if (start > end) {
        throw ConfigError("Backtest start " + start.toString() + " is after end " + end.toString());
    }
    if (initial_capital <= 0.0) {
        throw ConfigError("initial_capital must be positive");
    }
    if (transaction_cost_pct < 0.0 || transaction_cost_pct >= 1.0) {
        throw ConfigError("transaction_cost_pct must be within [0, 1)");
    }
    if (warmup_calendar_days < 0) {
        throw ConfigError("warmup_calendar_days must be >= 0");
    }
    if (universe.empty()) {
        throw ConfigError("Backtest universe is empty");
    }
    rules.validate();
    filters.validate();
    regime.validate();
}

BacktestSimulator::BacktestSimulator(BacktestConfig config,
                                     std::shared_ptr<const data::IPriceHistoryProvider> prices,
                                     std::shared_ptr<const data::IRestrictionListProvider> restrictions,
                                     ranking::WeightTriple weights)
    : config_(std::move(config))
    , price_provider_(std::move(prices))
    , restriction_provider_(std::move(restrictions))
    , weights_(weights)
    , filter_(config_.filters)
    , regime_filter_(config_.regime)
    , reconciler_(config_.rules)
    , planner_(config_.transaction_cost_pct)
    , portfolio_(config_.initial_capital)
{
    config_.validate();
    if (!price_provider_) {
        throw ConfigError("Backtest needs a price history provider");
    }
    if (!restriction_provider_) {
        restriction_provider_ = std::make_shared<data::StaticRestrictionProvider>();
    }
}

std::string BacktestSimulator::stateToString(State state) {
    switch (state) {
        case State::WARMING_UP: return "WARMING_UP";
        case State::REBALANCING: return "REBALANCING";
        case State::HOLDING: return "HOLDING";
        case State::FINALIZED: return "FINALIZED";
    }
    return "UNKNOWN";
}

std::vector<Date> BacktestSimulator::rebalanceDates(const Date& start, const Date& end,
                                                    Weekday weekday, RebalanceFrequency frequency) {
    std::vector<Date> dates;
    if (start > end) return dates;

    // First matching weekday on or after start.
    Date d = start;
    while (d.weekday() != weekday) {
        d = d.addDays(1);
    }

    unsigned last_month = 0;
    int last_year = 0;
    for (; d <= end; d = d.addDays(7)) {
        if (frequency == RebalanceFrequency::MONTHLY) {
            if (d.year() == last_year && d.month() == last_month) continue;
            last_year = d.year();
            last_month = d.month();
        }
        dates.push_back(d);
    }
    return dates;
}

std::vector<std::string> BacktestSimulator::pricedSymbols() const {
    std::set<std::string> symbols(config_.universe.begin(), config_.universe.end());
    if (!config_.rules.cash_symbol.empty()) symbols.insert(config_.rules.cash_symbol);
    if (config_.regime.enabled()) symbols.insert(config_.regime.benchmark_symbol);
    return std::vector<std::string>(symbols.begin(), symbols.end());
}

void BacktestSimulator::run() {
    if (state_ != State::WARMING_UP || !result_.daily.empty()) {
        throw std::logic_error("BacktestSimulator::run called twice");
    }

    LOG_INFO("Backtest {} -> {} weights {} top_n={} band={}",
             config_.start.toString(), config_.end.toString(), weights_.toString(),
             config_.rules.top_n, config_.rules.band);

    prices_ = price_provider_->getPrices(pricedSymbols(),
                                         config_.start.addDays(-config_.warmup_calendar_days),
                                         config_.end);

    const auto trading_days = prices_.tradingDays(config_.start, config_.end, config_.universe);
    if (trading_days.empty()) {
        throw DataError("No closes for the universe between " + config_.start.toString() +
                        " and " + config_.end.toString());
    }

    const auto schedule = rebalanceDates(config_.start, config_.end, config_.rebalance_day, config_.frequency);
    if (schedule.empty()) {
        result_.warnings.push_back("No rebalance date between " + config_.start.toString() +
                                   " and " + config_.end.toString());
    }

    // Walk the union of trading days and rebalance dates in order.
    std::set<Date> calendar(trading_days.begin(), trading_days.end());
    calendar.insert(schedule.begin(), schedule.end());
    const std::set<Date> trading(trading_days.begin(), trading_days.end());
    const std::set<Date> rebalance_set(schedule.begin(), schedule.end());

    for (const auto& date : calendar) {
        if (rebalance_set.count(date)) {
            if (!prices_.hasAnyClose(date, config_.universe)) {
                std::string warning = "No price data on rebalance date " + date.toString() +
                                      ", portfolio carried forward";
                LOG_WARN("{}", warning);
                result_.warnings.push_back(warning);
                RebalanceRecord record;
                record.date = date;
                record.skipped = true;
                record.warnings.push_back(std::move(warning));
                result_.rebalances.push_back(std::move(record));
                ++result_.skipped_rebalances;
            } else {
                State previous = state_;
                state_ = State::REBALANCING;
                rebalance(date);
                state_ = State::HOLDING;
                if (previous == State::WARMING_UP) {
                    LOG_DEBUG("Warm-up finished on {}", date.toString());
                }
            }
        }
        if (trading.count(date)) {
            recordDay(date);
        }
    }

    if (!schedule.empty() && result_.skipped_rebalances == static_cast<int>(schedule.size())) {
        throw DataError("Every rebalance date between " + config_.start.toString() + " and " +
                        config_.end.toString() + " lacks price data");
    }

    result_.metrics = PerformanceMetrics::compute(result_.dates(), result_.equity(), config_.risk_free_rate);
    result_.metrics.num_trades = trades_;

    if (config_.regime.enabled()) {
        std::vector<Date> bench_dates;
        std::vector<double> bench_values;
        for (const auto& date : trading_days) {
            auto close = prices_.closeOn(config_.regime.benchmark_symbol, date);
            if (close) {
                bench_dates.push_back(date);
                bench_values.push_back(*close);
            }
        }
        if (bench_values.size() >= 2) {
            result_.metrics.benchmark_cagr = PerformanceMetrics::cagr(bench_dates, bench_values);
            result_.metrics.alpha = result_.metrics.cagr - *result_.metrics.benchmark_cagr;
        }
    }

    state_ = State::FINALIZED;
    LOG_INFO("Backtest finished: CAGR {:.2f}%, max drawdown {:.2f}%, {} trades, {} skipped rebalances",
             result_.metrics.cagr * 100.0, result_.metrics.max_drawdown * 100.0,
             trades_, result_.skipped_rebalances);
}

void BacktestSimulator::rebalance(const Date& date) {
    RebalanceRecord record;
    record.date = date;

    const auto restrictions = restriction_provider_->getRestrictions(date);
    const auto universe = filter_.apply(config_.universe, date, restrictions, prices_);
    record.eligible_count = universe.symbols.size();

    bool defensive = false;
    if (regime_filter_.enabled()) {
        auto regime = regime_filter_.assess(prices_, date, config_.universe);
        defensive = regime.weak;
        if (defensive) {
            record.warnings.push_back("Defensive mode: " + regime.reason);
        }
    }

    ranking::ScoringResult scoring;
    scoring.as_of_date = date;
    if (!defensive) {
        scoring = scorer_.rank(prices_, date, universe.symbols, weights_, config_.rules.top_n);
    }
    record.ranked_count = scoring.ranked.size();

    record.decision = reconciler_.reconcile(date, portfolio_, scoring, defensive);
    const auto prices = portfolio::OrderPlanner::tradePrices(prices_, date, portfolio_, record.decision);
    record.warnings.insert(record.warnings.end(), record.decision.warnings.begin(), record.decision.warnings.end());

    auto plan = planner_.plan(record.decision, portfolio_, prices);
    record.warnings.insert(record.warnings.end(), plan.warnings.begin(), plan.warnings.end());

    const double cost = planner_.transactionCostPct();
    for (const auto& order : plan.orders) {
        if (order.side == OrderSide::SELL) {
            portfolio_.sell(order.symbol, order.quantity, order.price, cost);
        } else {
            portfolio_.buy(order.symbol, order.quantity, order.price, cost);
        }
        ++trades_;
        LOG_DEBUG("{} {} {} x{} @ {:.2f} ({})", date.toString(),
                  order.side == OrderSide::BUY ? "BUY" : "SELL",
                  order.symbol, order.quantity, order.price, order.reason);
    }
    record.orders = std::move(plan.orders);

    for (const auto& w : record.warnings) {
        result_.warnings.push_back(date.toString() + ": " + w);
    }
    result_.rebalances.push_back(std::move(record));
}

void BacktestSimulator::recordDay(const Date& date) {
    DailyPoint point;
    point.date = date;
    point.cash = portfolio_.cash();
    point.portfolio_value = portfolio_.totalValue([&](const std::string& symbol) {
        // Missing today: last known close.
        return prices_.lastCloseOnOrBefore(symbol, date);
    });
    for (const auto& [symbol, holding] : portfolio_.holdings()) {
        point.holdings[symbol] = holding.quantity;
    }
    result_.daily.push_back(std::move(point));
}

const BacktestResult& BacktestSimulator::getResult() const {
    if (state_ != State::FINALIZED) {
        throw std::logic_error("Backtest result requested before the run finished (state " +
                               stateToString(state_) + ")");
    }
    return result_;
}

} // namespace backtest
} // namespace rankfolio
