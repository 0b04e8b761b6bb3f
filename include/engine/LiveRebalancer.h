#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/contracts/IRebalanceJournal.h"
#include "data/IPriceHistoryProvider.h"
#include "data/IRestrictionListProvider.h"
#include "engine/EngineConfig.h"
#include "engine/IBrokerAccount.h"
#include "execution/IOrderExecutor.h"
#include "portfolio/OrderPlanner.h"
#include "portfolio/PortfolioReconciler.h"
#include "ranking/MarketRegimeFilter.h"
#include "ranking/MomentumScorer.h"
#include "ranking/UniverseFilter.h"

namespace rankfolio {
namespace engine {

struct RebalancerSettings {
    std::vector<std::string> universe;
    int warmup_calendar_days = 600;
    portfolio::PortfolioRules rules;
    ranking::FilterConfig filters;
    ranking::RegimeConfig regime;
    EngineConfig engine;

    // Throws ConfigError.
    void validate() const;
};

struct RankingSnapshot {
    ranking::EligibleUniverse universe;
    ranking::ScoringResult scoring;
    bool defensive = false;
    std::string regime_reason;
};

struct LiveRebalanceResult {
    Date as_of;
    RankingSnapshot ranking;
    portfolio::RebalanceDecision decision;
    portfolio::OrderPlan plan;
    std::vector<execution::OrderReport> reports;
    std::vector<std::string> warnings;
};

// One live decision: rank as of a date, reconcile against the broker's
// holdings, plan with the account cash plus additional capital, then hand
// sells followed by buys to the executor. Every report is recorded as-is;
// nothing is retried.
class LiveRebalancer {
public:
    LiveRebalancer(RebalancerSettings settings,
                   ranking::WeightTriple weights,
                   std::shared_ptr<const data::IPriceHistoryProvider> prices,
                   std::shared_ptr<const data::IRestrictionListProvider> restrictions,
                   std::shared_ptr<IBrokerAccount> account,
                   std::shared_ptr<execution::IOrderExecutor> executor,
                   std::shared_ptr<core::IRebalanceJournal> journal = nullptr);

    // Ranking only. Throws DataError when no universe close exists up to `as_of`.
    RankingSnapshot rank(const Date& as_of) const;

    LiveRebalanceResult rebalance(const Date& as_of);

private:
    data::PriceTable loadPrices(const Date& as_of) const;
    RankingSnapshot rank(const data::PriceTable& prices, const Date& as_of) const;
    void journal(core::JournalEventType type, const Date& as_of,
                 const std::string& entity_id, nlohmann::json payload);

    RebalancerSettings settings_;
    ranking::WeightTriple weights_;
    std::shared_ptr<const data::IPriceHistoryProvider> price_provider_;
    std::shared_ptr<const data::IRestrictionListProvider> restriction_provider_;
    std::shared_ptr<IBrokerAccount> account_;
    std::shared_ptr<execution::IOrderExecutor> executor_;
    std::shared_ptr<core::IRebalanceJournal> journal_;

    ranking::MomentumScorer scorer_;
    ranking::UniverseFilter filter_;
    ranking::MarketRegimeFilter regime_filter_;
    portfolio::PortfolioReconciler reconciler_;
    portfolio::OrderPlanner planner_;
};

nlohmann::json decisionToJson(const portfolio::RebalanceDecision& decision);

} // namespace engine
} // namespace rankfolio
