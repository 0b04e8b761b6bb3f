#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Date.h"

namespace rankfolio {
namespace ranking {

// Factor values for one symbol as of one date. A factor is empty when the
// history is shorter than its lookback window.
struct SymbolSnapshot {
    std::string symbol;
    Date as_of_date;
    double close_price = 0.0;

    std::optional<double> return_22d;
    std::optional<double> return_44d;
    std::optional<double> return_66d;
    std::optional<double> rsi_22d;
    std::optional<double> rsi_44d;
    std::optional<double> rsi_66d;
    // Percent below the 252-bar high (0 = at the high).
    std::optional<double> pct_from_52w_high;

    std::optional<double> daily_return;

    bool hasReturns() const { return return_22d && return_44d && return_66d; }
    bool hasRsi() const { return rsi_22d && rsi_44d && rsi_66d; }
};

struct RankedSymbol {
    std::string symbol;
    double composite_score = 0.0;
    int rank = 0;

    double return_subrank = 0.0;
    double rsi_subrank = 0.0;
    double proximity_subrank = 0.0;

    SymbolSnapshot snapshot;
};

struct ExcludedSymbol {
    std::string symbol;
    std::string reason;
};

struct ScoringResult {
    Date as_of_date;
    // Ordered by rank.
    std::vector<RankedSymbol> ranked;
    std::vector<ExcludedSymbol> excluded;
    std::vector<std::string> warnings;

    const RankedSymbol* find(const std::string& symbol) const {
        for (const auto& r : ranked) {
            if (r.symbol == symbol) return &r;
        }
        return nullptr;
    }
};

struct EligibleUniverse {
    Date date;
    std::vector<std::string> symbols;
    std::vector<ExcludedSymbol> excluded;
};

} // namespace ranking
} // namespace rankfolio
