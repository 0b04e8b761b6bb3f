#include "ranking/UniverseFilter.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <set>

namespace rankfolio {
namespace ranking {

void FilterConfig::validate() const {
    if (short_term_exclusion_stage < 1) {
        throw ConfigError("short_term_exclusion_stage must be >= 1");
    }
    if (min_price < 0.0 || max_price < 0.0) {
        throw ConfigError("Price filters must be >= 0");
    }
    if (max_price > 0.0 && max_price <= min_price) {
        throw ConfigError("max_price must be greater than min_price");
    }
    if (min_median_traded_value < 0.0 || min_avg_volume < 0.0) {
        throw ConfigError("Liquidity filters must be >= 0");
    }
    if (max_stale_sessions < 0) {
        throw ConfigError("max_stale_sessions must be >= 0");
    }
    if (liquidity_window <= 0) {
        throw ConfigError("liquidity_window must be positive");
    }
}

UniverseFilter::UniverseFilter(FilterConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

EligibleUniverse UniverseFilter::apply(const std::vector<std::string>& base_universe,
                                       const Date& date,
                                       const data::RestrictionList& restrictions,
                                       const data::PriceTable& prices) const {
    EligibleUniverse universe;
    universe.date = date;

    // Wide enough to hold max_stale_sessions + 1 weekday sessions across holidays.
    const int window_days = 2 * config_.max_stale_sessions + 14;
    const auto sessions = prices.tradingDays(date.addDays(-window_days), date, base_universe);

    std::set<std::string> seen;
    for (const auto& symbol : base_universe) {
        if (!seen.insert(symbol).second) {
            continue;
        }
        std::string reason = exclusionReason(symbol, date, restrictions, prices, sessions);
        if (reason.empty()) {
            universe.symbols.push_back(symbol);
        } else {
            universe.excluded.push_back({symbol, std::move(reason)});
        }
    }

    LOG_DEBUG("Universe on {}: {} eligible, {} excluded",
              date.toString(), universe.symbols.size(), universe.excluded.size());
    return universe;
}

std::string UniverseFilter::exclusionReason(const std::string& symbol,
                                            const Date& date,
                                            const data::RestrictionList& restrictions,
                                            const data::PriceTable& prices,
                                            const std::vector<Date>& sessions) const {
    using analytics::TechnicalIndicators;

    if (restrictions.isLongTermRestricted(symbol, date)) {
        return "long-term restriction";
    }
    auto stage = restrictions.shortTermStage(symbol, date);
    if (stage && *stage >= config_.short_term_exclusion_stage) {
        return "short-term restriction stage " + std::to_string(*stage);
    }

    const size_t bars = prices.historyLength(symbol, date);
    if (bars == 0) {
        return "no price data";
    }

    const auto last_bar = prices.lastBarOnOrBefore(symbol, date);
    if (last_bar && !sessions.empty()) {
        const auto newer = std::upper_bound(sessions.begin(), sessions.end(), *last_bar);
        const auto behind = static_cast<int>(sessions.end() - newer);
        if (*last_bar < sessions.front() || behind > config_.max_stale_sessions) {
            return "stale price data (last close " + last_bar->toString() + ")";
        }
    }
    if (bars < config_.min_history_bars) {
        return "insufficient history (" + std::to_string(bars) + " < " +
               std::to_string(config_.min_history_bars) + " bars)";
    }

    const auto close = prices.lastCloseOnOrBefore(symbol, date);
    if (config_.min_price > 0.0 && close && *close < config_.min_price) {
        return "price below minimum";
    }
    if (config_.max_price > 0.0 && close && *close >= config_.max_price) {
        return "price at or above maximum";
    }

    if (config_.min_median_traded_value > 0.0 || config_.min_avg_volume > 0.0) {
        const size_t window = static_cast<size_t>(config_.liquidity_window);
        const auto closes = prices.closesUpTo(symbol, date, window);
        const auto volumes = prices.volumesUpTo(symbol, date, window);

        if (config_.min_median_traded_value > 0.0) {
            auto traded = TechnicalIndicators::calculateMedianTradedValue(closes, volumes, config_.liquidity_window);
            if (!traded || *traded < config_.min_median_traded_value) {
                return "median traded value below minimum";
            }
        }
        if (config_.min_avg_volume > 0.0) {
            auto avg_volume = TechnicalIndicators::calculateTrailingMean(volumes, config_.liquidity_window);
            if (!avg_volume || *avg_volume < config_.min_avg_volume) {
                return "average volume below minimum";
            }
        }
    }

    return {};
}

} // namespace ranking
} // namespace rankfolio
