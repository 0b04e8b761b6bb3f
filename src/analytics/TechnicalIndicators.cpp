#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace rankfolio {
namespace analytics {

std::optional<double> TechnicalIndicators::calculateReturn(const std::vector<double>& prices, int days) {
    if (days <= 0 || prices.size() < static_cast<size_t>(days)) {
        return std::nullopt;
    }
    const double recent = prices.back();
    const double past = prices[prices.size() - static_cast<size_t>(days)];
    if (past <= 0.0) {
        return std::nullopt;
    }
    return ((recent - past) / past) * 100.0;
}

// Cutler's RSI: plain rolling means instead of Wilder smoothing, so the value
// depends only on the last `period` changes.
std::optional<double> TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return std::nullopt;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (size_t i = prices.size() - static_cast<size_t>(period); i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    avg_gain /= period;
    avg_loss /= period;

    if (avg_loss == 0.0) return 100.0;

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::optional<double> TechnicalIndicators::calculateHighProximity(const std::vector<double>& prices, int lookback) {
    if (lookback <= 0 || prices.size() < static_cast<size_t>(lookback)) {
        return std::nullopt;
    }
    const double highest = *std::max_element(prices.end() - lookback, prices.end());
    if (highest <= 0.0) {
        return std::nullopt;
    }
    return (prices.back() / highest) * 100.0;
}

std::optional<double> TechnicalIndicators::calculateDailyReturn(const std::vector<double>& prices) {
    if (prices.size() < 2) {
        return std::nullopt;
    }
    const double prev = prices[prices.size() - 2];
    if (prev <= 0.0) {
        return std::nullopt;
    }
    return (prices.back() / prev) - 1.0;
}

std::optional<double> TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    return calculateTrailingMean(prices, period);
}

std::optional<double> TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }

    const double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += prices[i];
    }
    ema /= period;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema;
}

std::optional<double> TechnicalIndicators::calculateTrailingMean(const std::vector<double>& values, int window) {
    if (window <= 0 || values.size() < static_cast<size_t>(window)) {
        return std::nullopt;
    }
    const double sum = std::accumulate(values.end() - window, values.end(), 0.0);
    return sum / window;
}

std::optional<double> TechnicalIndicators::calculateTrailingMedian(const std::vector<double>& values, int window) {
    if (window <= 0 || values.size() < static_cast<size_t>(window)) {
        return std::nullopt;
    }
    std::vector<double> tail(values.end() - window, values.end());
    std::sort(tail.begin(), tail.end());
    const size_t mid = tail.size() / 2;
    if (tail.size() % 2 == 0) {
        return (tail[mid - 1] + tail[mid]) / 2.0;
    }
    return tail[mid];
}

std::optional<double> TechnicalIndicators::calculateMedianTradedValue(const std::vector<double>& closes,
                                                                      const std::vector<double>& volumes,
                                                                      int window) {
    if (closes.size() != volumes.size()) {
        return std::nullopt;
    }
    std::vector<double> traded;
    traded.reserve(closes.size());
    for (size_t i = 0; i < closes.size(); ++i) {
        traded.push_back(closes[i] * volumes[i]);
    }
    return calculateTrailingMedian(traded, window);
}

double TechnicalIndicators::calculateAnnualizedVolatility(const std::vector<double>& equity, double periods_per_year) {
    if (equity.size() < 3) {
        return 0.0;
    }
    std::vector<double> returns;
    returns.reserve(equity.size() - 1);
    for (size_t i = 1; i < equity.size(); ++i) {
        if (equity[i - 1] > 0.0) {
            returns.push_back(equity[i] / equity[i - 1] - 1.0);
        }
    }
    if (returns.size() < 2) {
        return 0.0;
    }
    const double mean = calculateMean(returns);
    return calculateStandardDeviation(returns, mean) * std::sqrt(periods_per_year);
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Sample standard deviation (n - 1).
double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.size() < 2) return 0.0;
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

} // namespace analytics
} // namespace rankfolio
