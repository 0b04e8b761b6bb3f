#include "engine/LiveRebalancer.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <chrono>
#include <set>

namespace rankfolio {
namespace engine {

namespace {

long long getCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

nlohmann::json orderToJson(const portfolio::PlannedOrder& order) {
    nlohmann::json j;
    j["symbol"] = order.symbol;
    j["side"] = execution::orderSideToString(order.side);
    j["quantity"] = order.quantity;
    j["price"] = order.price;
    j["reason"] = order.reason;
    return j;
}

} // namespace

void RebalancerSettings::validate() const {
    if (universe.empty()) {
        throw ConfigError("Universe is empty");
    }
    if (warmup_calendar_days < 0) {
        throw ConfigError("warmup_calendar_days must be >= 0");
    }
    rules.validate();
    filters.validate();
    regime.validate();
    engine.validate();
}

nlohmann::json decisionToJson(const portfolio::RebalanceDecision& decision) {
    nlohmann::json j;
    j["date"] = decision.date.toString();
    j["defensive"] = decision.defensive;
    j["sells"] = nlohmann::json::array();
    for (const auto& s : decision.sells) {
        j["sells"].push_back({{"symbol", s.symbol}, {"rank", s.rank}, {"reason", s.reason}});
    }
    j["buys"] = nlohmann::json::array();
    for (const auto& b : decision.buys) {
        j["buys"].push_back({{"symbol", b.symbol}, {"target_weight", b.target_weight},
                             {"top_up", b.top_up}, {"placeholder", b.placeholder}, {"rank", b.rank}});
    }
    j["holds"] = decision.holds;
    j["warnings"] = decision.warnings;
    return j;
}

LiveRebalancer::LiveRebalancer(RebalancerSettings settings,
                               ranking::WeightTriple weights,
                               std::shared_ptr<const data::IPriceHistoryProvider> prices,
                               std::shared_ptr<const data::IRestrictionListProvider> restrictions,
                               std::shared_ptr<IBrokerAccount> account,
                               std::shared_ptr<execution::IOrderExecutor> executor,
                               std::shared_ptr<core::IRebalanceJournal> journal)
    : settings_(std::move(settings))
    , weights_(weights)
    , price_provider_(std::move(prices))
    , restriction_provider_(std::move(restrictions))
    , account_(std::move(account))
    , executor_(std::move(executor))
    , journal_(std::move(journal))
    , filter_(settings_.filters)
    , regime_filter_(settings_.regime)
    , reconciler_(settings_.rules)
    , planner_(settings_.engine.transaction_cost_pct)
{
    settings_.validate();
    if (!price_provider_) {
        throw ConfigError("LiveRebalancer needs a price history provider");
    }
    if (!restriction_provider_) {
        restriction_provider_ = std::make_shared<data::StaticRestrictionProvider>();
    }
}

data::PriceTable LiveRebalancer::loadPrices(const Date& as_of) const {
    std::set<std::string> symbols(settings_.universe.begin(), settings_.universe.end());
    if (!settings_.rules.cash_symbol.empty()) symbols.insert(settings_.rules.cash_symbol);
    if (settings_.regime.enabled()) symbols.insert(settings_.regime.benchmark_symbol);

    auto prices = price_provider_->getPrices(std::vector<std::string>(symbols.begin(), symbols.end()),
                                             as_of.addDays(-settings_.warmup_calendar_days), as_of);
    bool any = false;
    for (const auto& symbol : settings_.universe) {
        if (prices.historyLength(symbol, as_of) > 0) {
            any = true;
            break;
        }
    }
    if (!any) {
        throw DataError("No universe prices up to " + as_of.toString());
    }
    return prices;
}

RankingSnapshot LiveRebalancer::rank(const Date& as_of) const {
    return rank(loadPrices(as_of), as_of);
}

RankingSnapshot LiveRebalancer::rank(const data::PriceTable& prices, const Date& as_of) const {
    RankingSnapshot snapshot;
    const auto restrictions = restriction_provider_->getRestrictions(as_of);
    snapshot.universe = filter_.apply(settings_.universe, as_of, restrictions, prices);

    if (regime_filter_.enabled()) {
        auto regime = regime_filter_.assess(prices, as_of, settings_.universe);
        snapshot.defensive = regime.weak;
        snapshot.regime_reason = regime.reason;
    }

    if (snapshot.defensive) {
        snapshot.scoring.as_of_date = as_of;
    } else {
        snapshot.scoring = scorer_.rank(prices, as_of, snapshot.universe.symbols, weights_, settings_.rules.top_n);
    }
    LOG_INFO("Ranking {}: {} eligible, {} ranked{}", as_of.toString(), snapshot.universe.symbols.size(),
             snapshot.scoring.ranked.size(), snapshot.defensive ? " (defensive)" : "");
    return snapshot;
}

void LiveRebalancer::journal(core::JournalEventType type, const Date& as_of,
                             const std::string& entity_id, nlohmann::json payload) {
    if (!journal_) return;
    core::JournalEvent event;
    event.ts_ms = getCurrentTimeMs();
    event.type = type;
    event.as_of = as_of.toString();
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed for {}", entity_id);
    }
}

LiveRebalanceResult LiveRebalancer::rebalance(const Date& as_of) {
    if (!account_ || !executor_) {
        throw ConfigError("Live rebalance needs a broker account and an order executor");
    }

    LiveRebalanceResult result;
    result.as_of = as_of;

    const auto prices = loadPrices(as_of);
    result.ranking = rank(prices, as_of);

    portfolio::Portfolio current(account_->getAvailableCash());
    for (const auto& [symbol, h] : account_->getHoldings()) {
        current.setHolding(symbol, h.quantity, h.avg_cost);
    }

    result.decision = reconciler_.reconcile(as_of, current, result.ranking.scoring, result.ranking.defensive);
    if (result.ranking.defensive) {
        result.decision.warnings.push_back("Defensive mode: " + result.ranking.regime_reason);
    }
    // Orders fill at the universe's latest session, which trails `as_of` on
    // holidays or before the day's close is published.
    const auto sessions = prices.tradingDays(as_of.addDays(-settings_.warmup_calendar_days), as_of,
                                             settings_.universe);
    const Date session = sessions.empty() ? as_of : sessions.back();
    const auto latest = portfolio::OrderPlanner::tradePrices(prices, session, current, result.decision);
    result.warnings = result.decision.warnings;

    result.plan = planner_.plan(result.decision, current, latest, settings_.engine.additional_capital);
    result.warnings.insert(result.warnings.end(), result.plan.warnings.begin(), result.plan.warnings.end());

    nlohmann::json decision_json = decisionToJson(result.decision);
    decision_json["orders"] = nlohmann::json::array();
    for (const auto& order : result.plan.orders) {
        decision_json["orders"].push_back(orderToJson(order));
    }
    journal(core::JournalEventType::DECISION_MADE, as_of, "decision-" + as_of.toString(), decision_json);

    if (settings_.engine.dry_run) {
        for (const auto& order : result.plan.orders) {
            LOG_INFO("[dry-run] {} {} x{} @ {:.2f} ({})", execution::orderSideToString(order.side),
                     order.symbol, order.quantity, order.price, order.reason);
        }
        LOG_INFO("Dry run: {} orders planned, none sent", result.plan.orders.size());
        return result;
    }

    // The plan lists sells before buys.
    int failures = 0;
    for (const auto& order : result.plan.orders) {
        journal(core::JournalEventType::ORDER_SUBMITTED, as_of, order.symbol, orderToJson(order));

        execution::OrderReport report;
        try {
            report = executor_->execute(order);
        } catch (const std::runtime_error& e) {
            LOG_ERROR("Executor error on {} {}: {}", execution::orderSideToString(order.side), order.symbol, e.what());
            report.symbol = order.symbol;
            report.side = order.side;
            report.requested_quantity = order.quantity;
            report.status = OrderStatus::FAILED;
            report.terminal = true;
            report.message = e.what();
        }
        if (report.status != OrderStatus::FILLED) {
            ++failures;
            LOG_WARN("Order {} {} x{} ended {}: {}", execution::orderSideToString(order.side), order.symbol,
                     order.quantity, execution::orderStatusToString(report.status), report.message);
        }
        journal(core::JournalEventType::ORDER_UPDATED, as_of,
                report.order_id.empty() ? order.symbol : report.order_id, execution::toJson(report));
        result.reports.push_back(std::move(report));
    }

    nlohmann::json summary;
    summary["orders"] = result.reports.size();
    summary["not_filled"] = failures;
    summary["warnings"] = result.warnings;
    journal(core::JournalEventType::REBALANCE_COMPLETED, as_of, "rebalance-" + as_of.toString(), summary);

    LOG_INFO("Rebalance {} done: {} orders, {} not filled", as_of.toString(), result.reports.size(), failures);
    return result;
}

} // namespace engine
} // namespace rankfolio
