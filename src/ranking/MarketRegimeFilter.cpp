#include "ranking/MarketRegimeFilter.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace rankfolio {
namespace ranking {

void RegimeConfig::validate() const {
    if (!enabled()) return;
    if (ema_periods.empty()) {
        throw ConfigError("Regime filter needs at least one EMA period");
    }
    for (int p : ema_periods) {
        if (p <= 0) throw ConfigError("EMA periods must be positive");
    }
    if (breadth_dma_period <= 0) {
        throw ConfigError("breadth_dma_period must be positive");
    }
    if (breadth_threshold < 0.0 || breadth_threshold > 1.0) {
        throw ConfigError("breadth_threshold must be within [0, 1]");
    }
}

MarketRegimeFilter::MarketRegimeFilter(RegimeConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

RegimeAssessment MarketRegimeFilter::assess(const data::PriceTable& prices,
                                            const Date& as_of,
                                            const std::vector<std::string>& universe) const {
    using analytics::TechnicalIndicators;

    RegimeAssessment out;
    if (!enabled()) {
        out.breadth = 1.0;
        return out;
    }

    const auto closes = prices.closesUpTo(config_.benchmark_symbol, as_of);
    const int longest = *std::max_element(config_.ema_periods.begin(), config_.ema_periods.end());
    if (closes.size() < static_cast<size_t>(longest)) {
        out.weak = true;
        out.reason = fmt::format("benchmark {} has {} bars, {} required",
                                 config_.benchmark_symbol, closes.size(), longest);
        LOG_WARN("Market weak on {}: {}", as_of.toString(), out.reason);
        return out;
    }

    const double latest = closes.back();
    size_t below = 0;
    for (int period : config_.ema_periods) {
        auto ema = TechnicalIndicators::calculateEMA(closes, period);
        if (ema && latest < *ema) {
            ++below;
        }
    }
    if (below == config_.ema_periods.size()) {
        out.weak = true;
        out.reason = "benchmark below all EMAs";
        LOG_WARN("Market weak on {}: {}", as_of.toString(), out.reason);
        return out;
    }

    out.breadth = breadthRatio(prices, as_of, universe);
    if (out.breadth < config_.breadth_threshold) {
        out.weak = true;
        out.reason = fmt::format("breadth {:.2f}% below {:.0f}%",
                                 out.breadth * 100.0, config_.breadth_threshold * 100.0);
        LOG_WARN("Market weak on {}: {}", as_of.toString(), out.reason);
        return out;
    }

    LOG_DEBUG("Market strong on {}: breadth {:.2f}%", as_of.toString(), out.breadth * 100.0);
    return out;
}

double MarketRegimeFilter::breadthRatio(const data::PriceTable& prices,
                                        const Date& as_of,
                                        const std::vector<std::string>& universe) const {
    using analytics::TechnicalIndicators;

    size_t counted = 0;
    size_t above = 0;
    const size_t window = static_cast<size_t>(config_.breadth_dma_period);
    for (const auto& symbol : universe) {
        if (symbol == config_.benchmark_symbol) continue;
        const auto closes = prices.closesUpTo(symbol, as_of, window);
        auto dma = TechnicalIndicators::calculateSMA(closes, config_.breadth_dma_period);
        if (!dma) continue;
        ++counted;
        if (closes.back() > *dma) {
            ++above;
        }
    }
    return counted == 0 ? 0.0 : static_cast<double>(above) / static_cast<double>(counted);
}

} // namespace ranking
} // namespace rankfolio
