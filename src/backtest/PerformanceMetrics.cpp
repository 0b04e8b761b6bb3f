#include "backtest/PerformanceMetrics.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace rankfolio {
namespace backtest {

PerformanceSummary PerformanceMetrics::compute(const std::vector<Date>& dates,
                                               const std::vector<double>& equity,
                                               double risk_free_rate) {
    PerformanceSummary s;
    s.cagr = cagr(dates, equity);
    s.total_return = totalReturn(equity);
    s.max_drawdown = maxDrawdown(equity);
    s.volatility = analytics::TechnicalIndicators::calculateAnnualizedVolatility(equity, kPeriodsPerYear);
    s.sharpe = sharpe(equity, risk_free_rate);
    s.sortino = sortino(equity, risk_free_rate);
    return s;
}

double PerformanceMetrics::cagr(const std::vector<Date>& dates, const std::vector<double>& equity) {
    if (equity.size() < 2 || dates.size() != equity.size() || equity.front() <= 0.0) {
        return 0.0;
    }
    const double years = static_cast<double>(dates.front().daysUntil(dates.back())) / kDaysPerYear;
    if (years <= 0.0) {
        return 0.0;
    }
    const double growth = equity.back() / equity.front();
    if (growth <= 0.0) {
        return -1.0;
    }
    return std::pow(growth, 1.0 / years) - 1.0;
}

double PerformanceMetrics::totalReturn(const std::vector<double>& equity) {
    if (equity.empty() || equity.front() <= 0.0) {
        return 0.0;
    }
    return equity.back() / equity.front() - 1.0;
}

double PerformanceMetrics::maxDrawdown(const std::vector<double>& equity) {
    double peak = 0.0;
    double worst = 0.0;
    for (double value : equity) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            worst = std::max(worst, (peak - value) / peak);
        }
    }
    return worst;
}

double PerformanceMetrics::sharpe(const std::vector<double>& equity, double risk_free_rate) {
    auto returns = dailyReturns(equity);
    if (returns.size() < 2) return 0.0;
    const double rf = risk_free_rate / kPeriodsPerYear;
    for (double& r : returns) r -= rf;
    const double sd = sampleStdDev(returns);
    if (sd <= 0.0) return 0.0;
    return mean(returns) / sd * std::sqrt(kPeriodsPerYear);
}

double PerformanceMetrics::sortino(const std::vector<double>& equity, double risk_free_rate) {
    const auto returns = dailyReturns(equity);
    std::vector<double> downside;
    for (double r : returns) {
        if (r < 0.0) downside.push_back(r);
    }
    const double downside_sd = sampleStdDev(downside);
    if (downside.size() < 2 || downside_sd <= 0.0) return 0.0;

    const double rf = risk_free_rate / kPeriodsPerYear;
    return (mean(returns) - rf) / downside_sd * std::sqrt(kPeriodsPerYear);
}

std::vector<double> PerformanceMetrics::dailyReturns(const std::vector<double>& equity) {
    std::vector<double> out;
    if (equity.size() < 2) return out;
    out.reserve(equity.size() - 1);
    for (size_t i = 1; i < equity.size(); ++i) {
        if (equity[i - 1] > 0.0) {
            out.push_back(equity[i] / equity[i - 1] - 1.0);
        }
    }
    return out;
}

double PerformanceMetrics::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double PerformanceMetrics::sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double sq = 0.0;
    for (double v : values) sq += (v - m) * (v - m);
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

} // namespace backtest
} // namespace rankfolio
