#pragma once

#include <string>

#include "portfolio/Portfolio.h"
#include "portfolio/RebalanceDecision.h"
#include "ranking/RankingTypes.h"

namespace rankfolio {
namespace portfolio {

struct PortfolioRules {
    int top_n = 15;
    int band = 5;
    // Cash-equivalent instrument parked in unfilled slots; empty keeps plain cash.
    std::string cash_symbol;
    // New entries whose last daily return exceeds this are skipped. <= 0 disables.
    double entry_jump_threshold = 0.0;

    // Throws ConfigError.
    void validate() const;
};

// Band rule: a holding is retained while its rank stays within top_n + band,
// new entries come from the top_n only.
class PortfolioReconciler {
public:
    explicit PortfolioReconciler(PortfolioRules rules);

    RebalanceDecision reconcile(const Date& date,
                                const Portfolio& current,
                                const ranking::ScoringResult& ranking,
                                bool defensive = false) const;

    const PortfolioRules& rules() const { return rules_; }

private:
    RebalanceDecision defensiveDecision(const Date& date, const Portfolio& current) const;

    PortfolioRules rules_;
};

} // namespace portfolio
} // namespace rankfolio
