#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using rankfolio::analytics::TechnicalIndicators;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    {
        // 22-bar return compares the latest close with the one 21 bars earlier.
        std::vector<double> prices;
        for (int i = 0; i < 22; ++i) prices.push_back(100.0 + i);
        auto r = TechnicalIndicators::calculateReturn(prices, 22);
        assert(r);
        assert(near(*r, 21.0));
        assert(!TechnicalIndicators::calculateReturn(prices, 23));
    }

    {
        std::vector<double> rising = {1, 2, 3, 4, 5};
        auto rsi = TechnicalIndicators::calculateRSI(rising, 4);
        assert(rsi && near(*rsi, 100.0));

        // Two gains of 2, two losses of 1: RS = 2, RSI = 66.67.
        std::vector<double> mixed = {10, 12, 11, 13, 12};
        rsi = TechnicalIndicators::calculateRSI(mixed, 4);
        assert(rsi && near(*rsi, 100.0 - 100.0 / 3.0));

        std::vector<double> falling = {5, 4, 3, 2, 1};
        rsi = TechnicalIndicators::calculateRSI(falling, 4);
        assert(rsi && near(*rsi, 0.0));

        assert(!TechnicalIndicators::calculateRSI(falling, 5));
    }

    {
        std::vector<double> prices = {50, 100, 80};
        auto prox = TechnicalIndicators::calculateHighProximity(prices, 3);
        assert(prox && near(*prox, 80.0));
        assert(!TechnicalIndicators::calculateHighProximity(prices, 4));

        auto daily = TechnicalIndicators::calculateDailyReturn(prices);
        assert(daily && near(*daily, -0.2));
    }

    {
        std::vector<double> prices = {1, 2, 3, 4, 5, 6};
        auto sma = TechnicalIndicators::calculateSMA(prices, 3);
        assert(sma && near(*sma, 5.0));

        // Seeded with SMA(1,2,3) = 2, multiplier 0.5: 3, 4, 5.
        auto ema = TechnicalIndicators::calculateEMA(prices, 3);
        assert(ema && near(*ema, 5.0));
        assert(!TechnicalIndicators::calculateEMA(prices, 7));
    }

    {
        std::vector<double> values = {5, 1, 3, 100};
        auto median = TechnicalIndicators::calculateTrailingMedian(values, 3);
        assert(median && near(*median, 3.0));
        auto mean = TechnicalIndicators::calculateTrailingMean(values, 2);
        assert(mean && near(*mean, 51.5));

        std::vector<double> closes = {10, 10, 20};
        std::vector<double> volumes = {100, 300, 100};
        auto traded = TechnicalIndicators::calculateMedianTradedValue(closes, volumes, 3);
        assert(traded && near(*traded, 2000.0));
    }

    {
        std::vector<double> flat = {100, 100, 100, 100};
        assert(near(TechnicalIndicators::calculateAnnualizedVolatility(flat), 0.0));
        std::vector<double> moving = {100, 110, 99, 108.9};
        assert(TechnicalIndicators::calculateAnnualizedVolatility(moving) > 0.0);
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}
