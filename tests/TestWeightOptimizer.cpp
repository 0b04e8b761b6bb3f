#include "optimization/WeightOptimizer.h"
#include "optimization/InterruptGuard.h"
#include "backtest/BacktestSimulator.h"
#include "common/Errors.h"
#include "TestFixtures.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <csignal>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>

using namespace rankfolio;
using optimization::InterruptGuard;
using optimization::OptimizerConfig;
using optimization::WeightOptimizer;
using ranking::WeightTriple;

namespace {
// CAGR grows with the return weight, drawdown with the RSI weight.
backtest::BacktestResult linearRunner(const WeightTriple& w) {
    backtest::BacktestResult r;
    r.metrics.cagr = w.returnWeight();
    r.metrics.max_drawdown = w.rsiWeight() * 0.5;
    return r;
}

OptimizerConfig config(double step, int workers = 1) {
    OptimizerConfig c;
    c.step = step;
    c.workers = workers;
    return c;
}
}

int main() {
    {
        const auto grid = WeightOptimizer::enumerateSimplex(0.5);
        assert(grid.size() == 6);
        const std::set<WeightTriple> got(grid.begin(), grid.end());
        const std::set<WeightTriple> expected = {
            WeightTriple(1, 0, 0), WeightTriple(0, 1, 0), WeightTriple(0, 0, 1),
            WeightTriple(0.5, 0.5, 0), WeightTriple(0.5, 0, 0.5), WeightTriple(0, 0.5, 0.5)};
        assert(got == expected);

        assert(WeightOptimizer::enumerateSimplex(0.1).size() == 66);
        assert(WeightOptimizer::enumerateSimplex(1.0).size() == 3);

        bool threw = false;
        try { WeightOptimizer::enumerateSimplex(0.3); } catch (const ConfigError&) { threw = true; }
        assert(threw);
        assert(WeightOptimizer::defaultComparisonSet().size() == 12);
    }

    {
        // Ordering is exact, so near-equal triples still order transitively.
        const WeightTriple a(0.5, 0.25, 0.25);
        const WeightTriple b(0.5 + 6e-10, 0.25 - 6e-10, 0.25);
        const WeightTriple c(0.5 + 1.2e-9, 0.25 - 1.2e-9, 0.25);
        assert(a == b && b == c);
        assert(a < b && b < c && a < c);
        assert(!(b < a) && !(a < a));
        assert(std::set<WeightTriple>({c, a, b}).size() == 3);
    }

    {
        // Feasible candidates ranked by CAGR; drawdown breaches listed apart.
        WeightOptimizer optimizer(linearRunner, config(0.5));
        auto report = optimizer.gridSearch();
        assert(report.evaluated == 6);
        assert(report.ranked.size() == 3);
        assert(report.infeasible.size() == 3);
        assert(report.failed.empty());
        assert(report.best()->weights == WeightTriple(1, 0, 0));
        assert(report.ranked[1].weights == WeightTriple(0.5, 0, 0.5));
        assert(report.ranked[2].weights == WeightTriple(0, 0, 1));
        for (const auto& c : report.ranked) assert(c.feasible);
        for (const auto& c : report.infeasible) assert(!c.feasible && c.metrics.max_drawdown > 0.2);
    }

    {
        // Equal CAGR falls back to lower drawdown.
        std::vector<optimization::CandidateResult> candidates;
        optimization::CandidateResult a(WeightTriple(0.5, 0.5, 0));
        a.metrics.cagr = 0.1;
        a.metrics.max_drawdown = 0.15;
        optimization::CandidateResult b(WeightTriple(0.5, 0, 0.5));
        b.metrics.cagr = 0.1;
        b.metrics.max_drawdown = 0.05;
        candidates.push_back(a);
        candidates.push_back(b);
        auto report = WeightOptimizer::rankCandidates(candidates, 0.2);
        assert(report.ranked.size() == 2);
        assert(report.ranked[0].weights == WeightTriple(0.5, 0, 0.5));

        // Nothing feasible: no best.
        auto none = WeightOptimizer::rankCandidates(candidates, 0.01);
        assert(none.best() == nullptr);
        assert(none.infeasible.size() == 2);
    }

    {
        // A data failure marks one candidate and the search goes on.
        WeightOptimizer optimizer([](const WeightTriple& w) {
            if (w.proximityWeight() == 1.0) throw DataError("no closes");
            return linearRunner(w);
        }, config(0.5));
        auto report = optimizer.gridSearch();
        assert(report.evaluated == 6);
        assert(report.failed.size() == 1);
        assert(report.failed[0].status == optimization::CandidateStatus::FAILED);
        assert(report.failed[0].failure.find("no closes") != std::string::npos);
        assert(report.ranked.size() == 2);
    }

    {
        // Configuration errors abort the whole search.
        WeightOptimizer optimizer([](const WeightTriple&) -> backtest::BacktestResult {
            throw ConfigError("bad rules");
        }, config(0.5, 3));
        bool threw = false;
        try { optimizer.gridSearch(); } catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    {
        // Parallel evaluation matches sequential evaluation.
        auto runner = [](const WeightTriple& w) {
            backtest::BacktestResult r;
            r.metrics.cagr = std::sin(w.returnWeight() * 7.0) + w.rsiWeight() * 0.3;
            r.metrics.max_drawdown = std::abs(std::cos(w.proximityWeight() * 5.0)) * 0.3;
            return r;
        };
        WeightOptimizer sequential(runner, config(0.1, 1));
        WeightOptimizer parallel(runner, config(0.1, 4));
        auto a = sequential.gridSearch();
        auto b = parallel.gridSearch();
        assert(a.evaluated == 66 && b.evaluated == 66);
        assert(a.ranked.size() == b.ranked.size());
        for (size_t i = 0; i < a.ranked.size(); ++i) {
            assert(a.ranked[i].weights == b.ranked[i].weights);
            assert(a.ranked[i].metrics.cagr == b.ranked[i].metrics.cagr);
        }
        assert(a.infeasible.size() == b.infeasible.size());
    }

    {
        // Directed search climbs towards the optimum of a smooth surface.
        auto runner = [](const WeightTriple& w) {
            backtest::BacktestResult r;
            const double dx = w.returnWeight() - 0.6;
            const double dy = w.rsiWeight() - 0.2;
            r.metrics.cagr = 0.5 - dx * dx - dy * dy;
            r.metrics.max_drawdown = 0.1;
            return r;
        };
        OptimizerConfig c = config(0.1);
        c.max_iterations = 200;
        WeightOptimizer optimizer(runner, c);
        auto report = optimizer.directedSearch(WeightTriple(0.8, 0.1, 0.1));
        assert(report.best());
        const auto& best = report.best()->weights;
        assert(std::abs(best.returnWeight() - 0.6) < 0.05);
        assert(std::abs(best.rsiWeight() - 0.2) < 0.05);
        assert(report.evaluated >= 3);
    }

    {
        // A stop before the search skips every candidate.
        WeightOptimizer optimizer(linearRunner, config(0.5));
        optimizer.requestStop();
        auto report = optimizer.gridSearch();
        assert(report.stopped);
        assert(report.evaluated == 0);
    }

    {
        // End to end over the simulator.
        const auto dates = testing::weekdays(Date::fromYmd(2022, 1, 3), 340);
        auto provider = std::make_shared<data::InMemoryPriceHistoryProvider>(testing::momentumUniverse(dates));
        backtest::BacktestConfig bt;
        bt.start = Date::fromYmd(2023, 1, 2);
        bt.end = Date::fromYmd(2023, 3, 31);
        bt.universe = testing::momentumSymbols();
        bt.rules.top_n = 3;
        bt.rules.band = 1;

        OptimizerConfig c = config(0.5, 2);
        c.max_drawdown = 1.0;
        WeightOptimizer optimizer([bt, provider](const WeightTriple& w) {
            backtest::BacktestSimulator sim(bt, provider, nullptr, w);
            sim.run();
            return sim.getResult();
        }, c);
        auto report = optimizer.compareCombinations({WeightTriple(0.8, 0.1, 0.1), WeightTriple(0.2, 0.6, 0.2)});
        assert(report.evaluated == 2);
        assert(report.ranked.size() == 2);
        assert(report.ranked[0].metrics.cagr >= report.ranked[1].metrics.cagr);
    }

    {
        bool threw = false;
        OptimizerConfig bad = config(0.1);
        bad.workers = 0;
        try { WeightOptimizer optimizer(linearRunner, bad); } catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    {
        // Ctrl+C reaches the optimizer only while a search is guarded.
        WeightOptimizer optimizer(linearRunner, config(0.5));
        assert(InterruptGuard::attached() == nullptr);
        {
            InterruptGuard guard(optimizer);
            assert(InterruptGuard::attached() == &optimizer);
            std::raise(SIGINT);
            assert(optimizer.stopRequested());
        }
        assert(InterruptGuard::attached() == nullptr);

        WeightOptimizer other(linearRunner, config(0.5));
        bool threw = false;
        try {
            InterruptGuard guard(other);
            throw ConfigError("unknown method");
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw);
        assert(InterruptGuard::attached() == nullptr);
        assert(!other.stopRequested());
    }

    std::cout << "[TEST] WeightOptimizer PASSED\n";
    return 0;
}
