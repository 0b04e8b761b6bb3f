#pragma once

#include <string>
#include <vector>

#include "data/PriceTable.h"
#include "ranking/RankingTypes.h"
#include "ranking/WeightTriple.h"

namespace rankfolio {
namespace ranking {

// Composite momentum ranking over an eligible universe.
//
// Each factor (mean 22/44/66-bar return, mean 22/44/66-bar RSI, distance from
// the 252-bar high) is ranked on its own, ties sharing the average rank. Rank r
// among M symbols becomes the sub-rank (M - r) / (M - 1), 1 being best. The
// composite score is the weighted sum of sub-ranks; symbols are ordered by
// composite descending, ties by symbol.
class MomentumScorer {
public:
    static constexpr int kShortWindow = 22;
    static constexpr int kMediumWindow = 44;
    static constexpr int kLongWindow = 66;
    static constexpr int kHighLookback = 252;

    // Closes needed for every factor to exist.
    static constexpr size_t kRequiredBars = kHighLookback;

    ScoringResult rank(const data::PriceTable& prices,
                       const Date& as_of,
                       const std::vector<std::string>& eligible,
                       const WeightTriple& weights,
                       int top_n = 0) const;

    static SymbolSnapshot buildSnapshot(const data::PriceTable& prices,
                                        const std::string& symbol,
                                        const Date& as_of);

    // Average ranks (1-based) of `values`; higher values rank first when
    // `higher_is_better`.
    static std::vector<double> averageRanks(const std::vector<double>& values, bool higher_is_better);

    static double normaliseRank(double rank, size_t count);
};

} // namespace ranking
} // namespace rankfolio
