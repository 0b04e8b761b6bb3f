#pragma once

#include <string>
#include <vector>

#include "data/PriceTable.h"

namespace rankfolio {
namespace ranking {

struct RegimeConfig {
    // Empty disables the filter.
    std::string benchmark_symbol;
    std::vector<int> ema_periods = {22, 44, 66};
    int breadth_dma_period = 44;
    double breadth_threshold = 0.4;

    bool enabled() const { return !benchmark_symbol.empty(); }
    void validate() const;
};

struct RegimeAssessment {
    bool weak = false;
    double breadth = 0.0;
    std::string reason;
};

// Weak market: benchmark below every EMA, too short a benchmark history, or
// fewer than `breadth_threshold` of the universe above their DMA.
class MarketRegimeFilter {
public:
    explicit MarketRegimeFilter(RegimeConfig config);

    bool enabled() const { return config_.enabled(); }

    RegimeAssessment assess(const data::PriceTable& prices,
                            const Date& as_of,
                            const std::vector<std::string>& universe) const;

    // Share of symbols (with enough history) whose close is above their DMA. 0 when none qualify.
    double breadthRatio(const data::PriceTable& prices,
                        const Date& as_of,
                        const std::vector<std::string>& universe) const;

private:
    RegimeConfig config_;
};

} // namespace ranking
} // namespace rankfolio
