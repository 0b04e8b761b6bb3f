#pragma once

#include <string>
#include <vector>

#include "data/PriceTable.h"
#include "data/RestrictionList.h"
#include "ranking/RankingTypes.h"

namespace rankfolio {
namespace ranking {

struct FilterConfig {
    size_t min_history_bars = 252;
    // Short-term surveillance at or above this stage excludes the symbol.
    int short_term_exclusion_stage = 2;
    // A symbol whose last close trails the universe's latest session by more
    // than this many sessions is treated as suspended or delisted.
    int max_stale_sessions = 5;

    // Price / liquidity screens; 0 disables each one.
    double min_price = 0.0;
    double max_price = 0.0;
    double min_median_traded_value = 0.0;
    double min_avg_volume = 0.0;
    int liquidity_window = 22;

    // Throws ConfigError.
    void validate() const;
};

// Pure function of (base universe, date, restrictions, prices).
class UniverseFilter {
public:
    explicit UniverseFilter(FilterConfig config);

    EligibleUniverse apply(const std::vector<std::string>& base_universe,
                           const Date& date,
                           const data::RestrictionList& restrictions,
                           const data::PriceTable& prices) const;

    const FilterConfig& config() const { return config_; }

private:
    // Empty string when the symbol passes.
    // `sessions` are the universe's trading days in the staleness window, ascending.
    std::string exclusionReason(const std::string& symbol,
                                const Date& date,
                                const data::RestrictionList& restrictions,
                                const data::PriceTable& prices,
                                const std::vector<Date>& sessions) const;

    FilterConfig config_;
};

} // namespace ranking
} // namespace rankfolio
