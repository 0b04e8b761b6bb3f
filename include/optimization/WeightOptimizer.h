#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestResult.h"
#include "ranking/WeightTriple.h"

namespace rankfolio {
namespace optimization {

struct OptimizerConfig {
    double step = 0.1;
    // Feasible candidates have max drawdown <= this fraction.
    double max_drawdown = 0.20;
    int workers = 1;
    // Directed search only.
    int max_iterations = 100;
    double tolerance = 1e-4;

    // Throws ConfigError.
    void validate() const;
};

enum class CandidateStatus { OK, FAILED };

struct CandidateResult {
    explicit CandidateResult(const ranking::WeightTriple& w) : weights(w) {}

    ranking::WeightTriple weights;
    CandidateStatus status = CandidateStatus::OK;
    std::string failure;
    backtest::PerformanceSummary metrics;
    bool feasible = false;
};

struct OptimizationReport {
    // Feasible candidates, best first.
    std::vector<CandidateResult> ranked;
    std::vector<CandidateResult> infeasible;
    std::vector<CandidateResult> failed;
    size_t evaluated = 0;
    bool stopped = false;

    const CandidateResult* best() const { return ranked.empty() ? nullptr : &ranked.front(); }
};

// Searches the weight simplex by running one backtest per candidate.
//
// A DataError from a run marks that candidate FAILED and the search goes on;
// ConfigError aborts the search. Feasibility (max drawdown <= limit) and
// ranking (CAGR desc, drawdown asc, weights asc) are applied after evaluation,
// the same way for every method.
class WeightOptimizer {
public:
    using Runner = std::function<backtest::BacktestResult(const ranking::WeightTriple&)>;

    WeightOptimizer(Runner runner, OptimizerConfig config);

    // All triples on the simplex at the given step; 1/step must be an integer.
    static std::vector<ranking::WeightTriple> enumerateSimplex(double step);

    static std::vector<ranking::WeightTriple> defaultComparisonSet();

    OptimizationReport gridSearch();

    // Nelder-Mead over (return, rsi) with proximity = 1 - both.
    OptimizationReport directedSearch(const ranking::WeightTriple& initial);

    OptimizationReport compareCombinations(const std::vector<ranking::WeightTriple>& candidates);

    // Candidates not yet started are skipped once a stop is requested.
    void requestStop() { stop_requested_ = true; }
    bool stopRequested() const { return stop_requested_; }

    static OptimizationReport rankCandidates(std::vector<CandidateResult> candidates, double max_drawdown);

    const OptimizerConfig& config() const { return config_; }

private:
    CandidateResult evaluate(const ranking::WeightTriple& weights) const;
    std::vector<CandidateResult> evaluateAll(const std::vector<ranking::WeightTriple>& candidates);

    double objective(const CandidateResult& candidate) const;
    static ranking::WeightTriple projectToSimplex(double return_weight, double rsi_weight);

    Runner runner_;
    OptimizerConfig config_;
    std::atomic<bool> stop_requested_{false};
};

std::string candidateStatusToString(CandidateStatus status);

} // namespace optimization
} // namespace rankfolio
