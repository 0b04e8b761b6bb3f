#include "backtest/BacktestSimulator.h"
#include "common/Errors.h"
#include "TestFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace rankfolio;
using backtest::BacktestConfig;
using backtest::BacktestSimulator;
using backtest::RebalanceFrequency;

namespace {
BacktestConfig baseConfig(const Date& start, const Date& end) {
    BacktestConfig config;
    config.start = start;
    config.end = end;
    config.initial_capital = 100000.0;
    config.universe = testing::momentumSymbols();
    config.rules.top_n = 3;
    config.rules.band = 1;
    return config;
}

const backtest::DailyPoint* pointOn(const backtest::BacktestResult& r, const Date& date) {
    for (const auto& p : r.daily) {
        if (p.date == date) return &p;
    }
    return nullptr;
}
}

int main() {
    const auto dates = testing::weekdays(Date::fromYmd(2022, 1, 3), 340);
    const Date start = Date::fromYmd(2023, 1, 2);
    const Date end = Date::fromYmd(2023, 3, 31);
    const Date gap = Date::fromYmd(2023, 2, 8);
    const ranking::WeightTriple weights(0.8, 0.1, 0.1);

    auto provider = std::make_shared<data::InMemoryPriceHistoryProvider>(testing::momentumUniverse(dates, gap));

    {
        const auto weekly = BacktestSimulator::rebalanceDates(start, end, Weekday::WEDNESDAY,
                                                              RebalanceFrequency::WEEKLY);
        assert(weekly.size() == 13);
        assert(weekly.front() == Date::fromYmd(2023, 1, 4));
        const auto monthly = BacktestSimulator::rebalanceDates(start, end, Weekday::WEDNESDAY,
                                                               RebalanceFrequency::MONTHLY);
        assert(monthly.size() == 3);
        assert(monthly[1] == Date::fromYmd(2023, 2, 1));
    }

    {
        // A rebalance date without any close is skipped and the book carried forward.
        BacktestSimulator sim(baseConfig(start, end), provider, nullptr, weights);
        assert(sim.state() == BacktestSimulator::State::WARMING_UP);

        bool threw = false;
        try { sim.getResult(); } catch (const std::logic_error&) { threw = true; }
        assert(threw);

        sim.run();
        assert(sim.state() == BacktestSimulator::State::FINALIZED);
        const auto& result = sim.getResult();

        assert(result.rebalances.size() == 13);
        assert(result.skipped_rebalances == 1);
        bool warned = false;
        for (const auto& w : result.warnings) {
            if (w.find("2023-02-08") != std::string::npos) warned = true;
        }
        assert(warned);

        const auto* before = pointOn(result, Date::fromYmd(2023, 2, 7));
        const auto* after = pointOn(result, Date::fromYmd(2023, 2, 9));
        assert(before && after);
        assert(before->holdings == after->holdings);
        assert(before->cash == after->cash);
        assert(!pointOn(result, gap));

        for (const auto& p : result.daily) {
            assert(p.cash >= 0.0);
            assert(p.holdings.size() <= 4);
            assert(p.date >= start && p.date <= end);
        }
        assert(result.metrics.num_trades > 0);
        assert(result.metrics.max_drawdown >= 0.0);
        assert(result.daily.front().portfolio_value > 0.0);

        threw = false;
        try { sim.run(); } catch (const std::logic_error&) { threw = true; }
        assert(threw);

        // Same inputs, same curve.
        BacktestSimulator again(baseConfig(start, end), provider, nullptr, weights);
        again.run();
        assert(again.getResult().equity() == result.equity());
    }

    {
        // Every scheduled date missing data aborts the run.
        BacktestSimulator sim(baseConfig(Date::fromYmd(2023, 2, 6), Date::fromYmd(2023, 2, 10)),
                              provider, nullptr, weights);
        bool threw = false;
        try { sim.run(); } catch (const DataError&) { threw = true; }
        assert(threw);
        assert(sim.state() != BacktestSimulator::State::FINALIZED);
    }

    {
        // No closes in range at all.
        BacktestSimulator sim(baseConfig(Date::fromYmd(2030, 1, 1), Date::fromYmd(2030, 3, 1)),
                              provider, nullptr, weights);
        bool threw = false;
        try { sim.run(); } catch (const DataError&) { threw = true; }
        assert(threw);
    }

    {
        // Monthly schedule with a placeholder and transaction costs.
        auto config = baseConfig(start, end);
        config.frequency = RebalanceFrequency::MONTHLY;
        config.transaction_cost_pct = 0.001;
        config.rules.cash_symbol = "CASHETF";
        config.universe = {"M1", "M2"};
        data::PriceTable table = testing::momentumUniverse(dates);
        testing::addSeries(table, "CASHETF", dates, [](size_t i) { return 1000.0 + 0.01 * i; });
        auto with_cash = std::make_shared<data::InMemoryPriceHistoryProvider>(table);

        BacktestSimulator sim(config, with_cash, nullptr, weights);
        sim.run();
        const auto& result = sim.getResult();
        assert(result.rebalances.size() == 3);
        assert(result.skipped_rebalances == 0);
        assert(result.rebalances.front().decision.buys.size() == 3);
        assert(result.daily.back().holdings.count("CASHETF") == 1);
    }

    {
        // A symbol that stops trading leaves the universe instead of being
        // ranked and bought on its last close.
        const Date last_trade = Date::fromYmd(2022, 12, 30);
        data::PriceTable table = testing::momentumUniverse(dates);
        std::vector<Date> listed;
        for (const auto& d : dates) {
            if (d <= last_trade) listed.push_back(d);
        }
        testing::addSeries(table, "DEAD", listed, [](size_t i) { return 50.0 * std::pow(1.01, i); });
        auto with_dead = std::make_shared<data::InMemoryPriceHistoryProvider>(table);

        // From 2023-01-09 its last close is more than five sessions old.
        auto config = baseConfig(Date::fromYmd(2023, 1, 9), end);
        config.universe = {"M1", "M2", "DEAD"};
        config.rules.top_n = 1;
        config.rules.band = 0;
        config.filters.min_history_bars = 100;
        const ranking::WeightTriple return_only(1.0, 0.0, 0.0);

        BacktestSimulator sim(config, with_dead, nullptr, return_only);
        sim.run();
        const auto& result = sim.getResult();
        assert(!result.rebalances.empty());
        assert(!result.rebalances.front().orders.empty());
        for (const auto& r : result.rebalances) {
            assert(r.eligible_count == 2);
            for (const auto& buy : r.decision.buys) {
                assert(buy.symbol != "DEAD");
            }
        }
        for (const auto& p : result.daily) {
            assert(p.holdings.count("DEAD") == 0);
        }
        assert(result.daily.back().portfolio_value != result.daily.front().portfolio_value);

        // Held while it still traded, sold once its last close falls behind.
        config.start = Date::fromYmd(2022, 12, 14);
        config.end = Date::fromYmd(2023, 2, 28);
        BacktestSimulator held(config, with_dead, nullptr, return_only);
        held.run();
        const auto& run = held.getResult();
        bool bought = false;
        for (const auto& o : run.rebalances.front().orders) {
            if (o.symbol == "DEAD" && o.side == OrderSide::BUY) bought = true;
        }
        assert(bought);

        Date sold_on;
        for (const auto& r : run.rebalances) {
            for (const auto& o : r.orders) {
                if (o.symbol == "DEAD" && o.side == OrderSide::SELL) sold_on = r.date;
            }
        }
        // 2023-01-04 is three sessions behind, 2023-01-11 eight.
        assert(sold_on == Date::fromYmd(2023, 1, 11));
        assert(run.daily.back().holdings.count("DEAD") == 0);
    }

    {
        bool threw = false;
        try {
            BacktestSimulator bad(baseConfig(end, start), provider, nullptr, weights);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        auto config = baseConfig(start, end);
        config.initial_capital = 0.0;
        try { BacktestSimulator bad(config, provider, nullptr, weights); } catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    std::cout << "[TEST] BacktestSimulator PASSED\n";
    return 0;
}
