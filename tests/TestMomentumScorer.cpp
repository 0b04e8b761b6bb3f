#include "ranking/MomentumScorer.h"
#include "common/Errors.h"
#include "TestFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace rankfolio;
using ranking::MomentumScorer;
using ranking::WeightTriple;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

// A: saw-tooth uptrend (+3/-1) ending on a down day, so it has the best
//    returns but the worst RSI and sits below its high.
// B, C: tiny monotone rises (RSI 100, at the high), B rising faster.
data::PriceTable scenarioPrices(const std::vector<Date>& dates) {
    data::PriceTable table;
    double a = 100.0;
    for (size_t i = 0; i < dates.size(); ++i) {
        if (i > 0) a += (i % 2 == 0) ? 3.0 : -1.0;
        table.addBar(dates[i], "A", a);
    }
    testing::addSeries(table, "B", dates, [](size_t i) { return 100.0 + 0.01 * i; });
    testing::addSeries(table, "C", dates, [](size_t i) { return 100.0 + 0.005 * i; });
    return table;
}
}

int main() {
    const auto dates = testing::weekdays(Date::fromYmd(2022, 1, 3), 260);
    const Date as_of = dates.back();
    const auto prices = scenarioPrices(dates);
    MomentumScorer scorer;

    {
        // Heavy return weight puts the return leader first despite the other factors.
        auto result = scorer.rank(prices, as_of, {"A", "B", "C"}, WeightTriple(0.8, 0.1, 0.1));
        assert(result.ranked.size() == 3);
        assert(result.excluded.empty());

        const auto& first = result.ranked[0];
        assert(first.symbol == "A");
        assert(first.rank == 1);
        assert(near(first.composite_score, 0.8));
        assert(near(first.return_subrank, 1.0));
        assert(near(first.rsi_subrank, 0.0));
        assert(near(first.proximity_subrank, 0.0));

        // B and C tie on RSI and proximity: both share rank 1.5 -> 0.75.
        assert(result.ranked[1].symbol == "B");
        assert(near(result.ranked[1].rsi_subrank, 0.75));
        assert(near(result.ranked[1].composite_score, 0.8 * 0.5 + 0.1 * 0.75 + 0.1 * 0.75));
        assert(result.ranked[2].symbol == "C");
    }

    {
        // RSI-only weighting: A drops to last.
        auto result = scorer.rank(prices, as_of, {"A", "B", "C"}, WeightTriple(0.0, 1.0, 0.0));
        assert(result.ranked.back().symbol == "A");
        // B and C tie exactly; lexical order breaks it.
        assert(result.ranked[0].symbol == "B");
        assert(result.ranked[1].symbol == "C");
        assert(near(result.ranked[0].composite_score, result.ranked[1].composite_score));
    }

    {
        // Same inputs, same output, regardless of the eligible order.
        auto first = scorer.rank(prices, as_of, {"C", "A", "B"}, WeightTriple(0.5, 0.3, 0.2));
        auto second = scorer.rank(prices, as_of, {"B", "C", "A"}, WeightTriple(0.5, 0.3, 0.2));
        assert(first.ranked.size() == second.ranked.size());
        for (size_t i = 0; i < first.ranked.size(); ++i) {
            assert(first.ranked[i].symbol == second.ranked[i].symbol);
            assert(first.ranked[i].composite_score == second.ranked[i].composite_score);
            assert(first.ranked[i].rank == static_cast<int>(i + 1));
        }
    }

    {
        // Short history: excluded with a reason, coverage warning raised.
        data::PriceTable table = prices;
        const auto short_dates = std::vector<Date>(dates.end() - 30, dates.end());
        testing::addSeries(table, "NEW", short_dates, [](size_t i) { return 50.0 + i; });

        auto result = scorer.rank(table, as_of, {"A", "B", "C", "NEW", "NONE"}, WeightTriple(0.8, 0.1, 0.1), 5);
        assert(result.ranked.size() == 3);
        assert(result.excluded.size() == 2);
        assert(result.find("NEW") == nullptr);
        assert(result.excluded[0].symbol == "NEW");
        assert(result.excluded[1].reason == "no price data");
        assert(result.warnings.size() == 1);
    }

    {
        // A factor with zero weight does not need history.
        data::PriceTable table;
        const auto short_dates = std::vector<Date>(dates.end() - 70, dates.end());
        testing::addSeries(table, "X", short_dates, [](size_t i) { return 10.0 + i; });
        testing::addSeries(table, "Y", short_dates, [](size_t i) { return 10.0 + 0.5 * i; });

        auto result = scorer.rank(table, as_of, {"X", "Y"}, WeightTriple(0.5, 0.5, 0.0));
        assert(result.ranked.size() == 2);
        assert(result.ranked[0].symbol == "X");

        result = scorer.rank(table, as_of, {"X", "Y"}, WeightTriple(0.5, 0.0, 0.5));
        assert(result.ranked.empty());
        assert(result.excluded.size() == 2);
    }

    {
        // Single scorable symbol gets sub-rank 1 everywhere.
        auto result = scorer.rank(prices, as_of, {"B"}, WeightTriple(0.2, 0.3, 0.5));
        assert(result.ranked.size() == 1);
        assert(near(result.ranked[0].composite_score, 1.0));
    }

    {
        auto ranks = MomentumScorer::averageRanks({5.0, 7.0, 5.0, 1.0}, true);
        assert(near(ranks[1], 1.0));
        assert(near(ranks[0], 2.5));
        assert(near(ranks[2], 2.5));
        assert(near(ranks[3], 4.0));
        assert(near(MomentumScorer::normaliseRank(1.0, 4), 1.0));
        assert(near(MomentumScorer::normaliseRank(4.0, 4), 0.0));
    }

    {
        bool threw = false;
        try { WeightTriple(0.5, 0.5, 0.5); } catch (const ConfigError&) { threw = true; }
        assert(threw);
        threw = false;
        try { WeightTriple(1.2, -0.1, -0.1); } catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    std::cout << "[TEST] MomentumScorer PASSED\n";
    return 0;
}
