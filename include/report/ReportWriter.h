#pragma once

#include <ostream>
#include <string>

#include "backtest/BacktestResult.h"
#include "optimization/WeightOptimizer.h"
#include "ranking/RankingTypes.h"

namespace rankfolio {
namespace report {

// CSV renderings of the engine's results. The stream overloads write the
// table only; the path overloads create parent directories and throw
// std::runtime_error when the file cannot be written.
class ReportWriter {
public:
    static void writeRanking(std::ostream& out, const ranking::ScoringResult& result);
    static void writeEquityCurve(std::ostream& out, const backtest::BacktestResult& result);
    static void writeRebalanceLog(std::ostream& out, const backtest::BacktestResult& result);
    static void writeOptimization(std::ostream& out, const optimization::OptimizationReport& report);
    static void writeSummary(std::ostream& out, const backtest::PerformanceSummary& summary);

    static void writeRanking(const std::string& path, const ranking::ScoringResult& result);
    static void writeEquityCurve(const std::string& path, const backtest::BacktestResult& result);
    static void writeRebalanceLog(const std::string& path, const backtest::BacktestResult& result);
    static void writeOptimization(const std::string& path, const optimization::OptimizationReport& report);

    // Quotes a field when it contains a separator, quote or newline.
    static std::string escapeField(const std::string& field);
};

} // namespace report
} // namespace rankfolio
