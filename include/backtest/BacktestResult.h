#pragma once

#include <map>
#include <string>
#include <vector>

#include "backtest/PerformanceMetrics.h"
#include "portfolio/RebalanceDecision.h"

namespace rankfolio {
namespace backtest {

struct DailyPoint {
    Date date;
    double portfolio_value = 0.0;
    double cash = 0.0;
    std::map<std::string, Quantity> holdings;
};

struct RebalanceRecord {
    Date date;
    bool skipped = false;
    portfolio::RebalanceDecision decision;
    std::vector<portfolio::PlannedOrder> orders;
    std::vector<std::string> warnings;
    // Eligible / ranked counts for the log.
    size_t eligible_count = 0;
    size_t ranked_count = 0;
};

struct BacktestResult {
    std::vector<DailyPoint> daily;
    std::vector<RebalanceRecord> rebalances;
    std::vector<std::string> warnings;
    PerformanceSummary metrics;
    int skipped_rebalances = 0;

    std::vector<Date> dates() const {
        std::vector<Date> out;
        out.reserve(daily.size());
        for (const auto& p : daily) out.push_back(p.date);
        return out;
    }

    std::vector<double> equity() const {
        std::vector<double> out;
        out.reserve(daily.size());
        for (const auto& p : daily) out.push_back(p.portfolio_value);
        return out;
    }
};

} // namespace backtest
} // namespace rankfolio
