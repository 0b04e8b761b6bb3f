#include "ranking/MomentumScorer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <numeric>

namespace rankfolio {
namespace ranking {

namespace {

using analytics::TechnicalIndicators;

double mean3(const std::optional<double>& a, const std::optional<double>& b, const std::optional<double>& c) {
    return (*a + *b + *c) / 3.0;
}

struct Candidate {
    SymbolSnapshot snapshot;
    double return_score = 0.0;
    double rsi_score = 0.0;
    double distance_from_high = 0.0;
};

} // namespace

SymbolSnapshot MomentumScorer::buildSnapshot(const data::PriceTable& prices,
                                             const std::string& symbol,
                                             const Date& as_of) {
    SymbolSnapshot snap;
    snap.symbol = symbol;
    snap.as_of_date = as_of;

    // RSI over the long window needs one extra close for the first change.
    const auto closes = prices.closesUpTo(symbol, as_of, kRequiredBars + 1);
    if (closes.empty()) {
        return snap;
    }

    snap.close_price = closes.back();
    snap.return_22d = TechnicalIndicators::calculateReturn(closes, kShortWindow);
    snap.return_44d = TechnicalIndicators::calculateReturn(closes, kMediumWindow);
    snap.return_66d = TechnicalIndicators::calculateReturn(closes, kLongWindow);
    snap.rsi_22d = TechnicalIndicators::calculateRSI(closes, kShortWindow);
    snap.rsi_44d = TechnicalIndicators::calculateRSI(closes, kMediumWindow);
    snap.rsi_66d = TechnicalIndicators::calculateRSI(closes, kLongWindow);

    auto proximity = TechnicalIndicators::calculateHighProximity(closes, kHighLookback);
    if (proximity) {
        snap.pct_from_52w_high = 100.0 - *proximity;
    }
    snap.daily_return = TechnicalIndicators::calculateDailyReturn(closes);
    return snap;
}

std::vector<double> MomentumScorer::averageRanks(const std::vector<double>& values, bool higher_is_better) {
    const size_t n = values.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return higher_is_better ? values[a] > values[b] : values[a] < values[b];
    });

    std::vector<double> ranks(n, 0.0);
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && values[order[j + 1]] == values[order[i]]) {
            ++j;
        }
        // Positions i..j (0-based) share the mean of ranks i+1..j+1.
        const double avg = (static_cast<double>(i + 1) + static_cast<double>(j + 1)) / 2.0;
        for (size_t k = i; k <= j; ++k) {
            ranks[order[k]] = avg;
        }
        i = j + 1;
    }
    return ranks;
}

double MomentumScorer::normaliseRank(double rank, size_t count) {
    if (count <= 1) {
        return 1.0;
    }
    const double m = static_cast<double>(count);
    return (m - rank) / (m - 1.0);
}

ScoringResult MomentumScorer::rank(const data::PriceTable& prices,
                                   const Date& as_of,
                                   const std::vector<std::string>& eligible,
                                   const WeightTriple& weights,
                                   int top_n) const {
    ScoringResult result;
    result.as_of_date = as_of;

    const bool use_return = weights.returnWeight() > 0.0;
    const bool use_rsi = weights.rsiWeight() > 0.0;
    const bool use_proximity = weights.proximityWeight() > 0.0;

    std::vector<Candidate> candidates;
    candidates.reserve(eligible.size());

    for (const auto& symbol : eligible) {
        SymbolSnapshot snap = buildSnapshot(prices, symbol, as_of);
        const size_t bars = prices.historyLength(symbol, as_of);

        std::string reason;
        if (bars == 0) {
            reason = "no price data";
        } else if (use_return && !snap.hasReturns()) {
            reason = "insufficient history for returns (" + std::to_string(bars) + " bars)";
        } else if (use_rsi && !snap.hasRsi()) {
            reason = "insufficient history for RSI (" + std::to_string(bars) + " bars)";
        } else if (use_proximity && !snap.pct_from_52w_high) {
            reason = "insufficient history for 52-week high (" + std::to_string(bars) + " bars)";
        }
        if (!reason.empty()) {
            LOG_DEBUG("{} excluded from ranking on {}: {}", symbol, as_of.toString(), reason);
            result.excluded.push_back({symbol, reason});
            continue;
        }

        Candidate c;
        if (use_return) c.return_score = mean3(snap.return_22d, snap.return_44d, snap.return_66d);
        if (use_rsi) c.rsi_score = mean3(snap.rsi_22d, snap.rsi_44d, snap.rsi_66d);
        if (use_proximity) c.distance_from_high = *snap.pct_from_52w_high;
        c.snapshot = std::move(snap);
        candidates.push_back(std::move(c));
    }

    const size_t m = candidates.size();
    std::vector<double> return_values, rsi_values, distance_values;
    return_values.reserve(m);
    rsi_values.reserve(m);
    distance_values.reserve(m);
    for (const auto& c : candidates) {
        return_values.push_back(c.return_score);
        rsi_values.push_back(c.rsi_score);
        distance_values.push_back(c.distance_from_high);
    }

    const auto return_ranks = averageRanks(return_values, true);
    const auto rsi_ranks = averageRanks(rsi_values, true);
    const auto distance_ranks = averageRanks(distance_values, false);

    result.ranked.reserve(m);
    for (size_t i = 0; i < m; ++i) {
        RankedSymbol r;
        r.symbol = candidates[i].snapshot.symbol;
        r.return_subrank = use_return ? normaliseRank(return_ranks[i], m) : 0.0;
        r.rsi_subrank = use_rsi ? normaliseRank(rsi_ranks[i], m) : 0.0;
        r.proximity_subrank = use_proximity ? normaliseRank(distance_ranks[i], m) : 0.0;
        r.composite_score = weights.returnWeight() * r.return_subrank +
                            weights.rsiWeight() * r.rsi_subrank +
                            weights.proximityWeight() * r.proximity_subrank;
        r.snapshot = std::move(candidates[i].snapshot);
        result.ranked.push_back(std::move(r));
    }

    std::sort(result.ranked.begin(), result.ranked.end(), [](const RankedSymbol& a, const RankedSymbol& b) {
        if (a.composite_score != b.composite_score) {
            return a.composite_score > b.composite_score;
        }
        return a.symbol < b.symbol;
    });
    for (size_t i = 0; i < result.ranked.size(); ++i) {
        result.ranked[i].rank = static_cast<int>(i + 1);
    }

    if (top_n > 0 && result.ranked.size() < static_cast<size_t>(top_n)) {
        std::string warning = "Only " + std::to_string(result.ranked.size()) + " scorable symbols on " +
                              as_of.toString() + " for top " + std::to_string(top_n);
        LOG_WARN("{}", warning);
        result.warnings.push_back(std::move(warning));
    }

    LOG_DEBUG("Ranked {} symbols on {} ({} excluded)", result.ranked.size(), as_of.toString(), result.excluded.size());
    return result;
}

} // namespace ranking
} // namespace rankfolio
