#pragma once

#include <optional>
#include <vector>

#include "common/Date.h"

namespace rankfolio {
namespace backtest {

struct PerformanceSummary {
    double cagr = 0.0;
    double total_return = 0.0;
    // Largest peak-to-trough loss as a positive fraction.
    double max_drawdown = 0.0;
    double volatility = 0.0;
    double sharpe = 0.0;
    double sortino = 0.0;
    int num_trades = 0;

    std::optional<double> benchmark_cagr;
    std::optional<double> alpha;
};

// Summary statistics of a daily equity curve. Returns are simple daily
// returns annualised with 252 periods; CAGR uses calendar years of 365.25 days.
class PerformanceMetrics {
public:
    static constexpr double kPeriodsPerYear = 252.0;
    static constexpr double kDaysPerYear = 365.25;

    static PerformanceSummary compute(const std::vector<Date>& dates,
                                      const std::vector<double>& equity,
                                      double risk_free_rate = 0.05);

    static double cagr(const std::vector<Date>& dates, const std::vector<double>& equity);
    static double totalReturn(const std::vector<double>& equity);
    static double maxDrawdown(const std::vector<double>& equity);
    static double sharpe(const std::vector<double>& equity, double risk_free_rate);
    // 0 when there are fewer than two losing days.
    static double sortino(const std::vector<double>& equity, double risk_free_rate);

private:
    static std::vector<double> dailyReturns(const std::vector<double>& equity);
    static double mean(const std::vector<double>& values);
    static double sampleStdDev(const std::vector<double>& values);
};

} // namespace backtest
} // namespace rankfolio
