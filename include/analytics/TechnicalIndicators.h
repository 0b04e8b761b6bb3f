#pragma once

#include <vector>
#include <optional>

namespace rankfolio {
namespace analytics {

// Indicators over a close series ordered oldest -> newest.
// Every function returns nullopt when the series is too short for the window.
class TechnicalIndicators {
public:
    // Percent change from the close `days` bars back (inclusive of today) to the latest close.
    static std::optional<double> calculateReturn(const std::vector<double>& prices, int days);

    // RSI from simple averages of the last `period` close-to-close gains and losses.
    // 100 when there was no loss in the window.
    static std::optional<double> calculateRSI(const std::vector<double>& prices, int period = 14);

    // Latest close as a percentage of the highest close over `lookback` bars (100 = at the high).
    static std::optional<double> calculateHighProximity(const std::vector<double>& prices, int lookback = 252);

    // Last bar's close-to-close change as a fraction.
    static std::optional<double> calculateDailyReturn(const std::vector<double>& prices);

    static std::optional<double> calculateSMA(const std::vector<double>& prices, int period);

    // EMA seeded with the SMA of the first `period` values.
    static std::optional<double> calculateEMA(const std::vector<double>& prices, int period);

    // Mean / median of the trailing `window` values.
    static std::optional<double> calculateTrailingMean(const std::vector<double>& values, int window);
    static std::optional<double> calculateTrailingMedian(const std::vector<double>& values, int window);

    // Median of close * volume over the trailing `window` bars.
    static std::optional<double> calculateMedianTradedValue(const std::vector<double>& closes,
                                                            const std::vector<double>& volumes,
                                                            int window = 22);

    // Annualised standard deviation of simple returns of an equity series.
    static double calculateAnnualizedVolatility(const std::vector<double>& equity, double periods_per_year = 252.0);

private:
    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace rankfolio
