#include "optimization/WeightOptimizer.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <mutex>
#include <thread>

namespace rankfolio {
namespace optimization {

using ranking::WeightTriple;

namespace {

constexpr double kFailedObjective = 1000.0;
constexpr double kDrawdownPenalty = 100.0;

bool betterCandidate(const CandidateResult& a, const CandidateResult& b) {
    if (a.metrics.cagr != b.metrics.cagr) return a.metrics.cagr > b.metrics.cagr;
    if (a.metrics.max_drawdown != b.metrics.max_drawdown) return a.metrics.max_drawdown < b.metrics.max_drawdown;
    return a.weights < b.weights;
}

} // namespace

std::string candidateStatusToString(CandidateStatus status) {
    return status == CandidateStatus::OK ? "OK" : "FAILED";
}

void OptimizerConfig::validate() const {
    if (!(step > 0.0) || step > 1.0) {
        throw ConfigError("Optimizer step must be within (0, 1]");
    }
    if (max_drawdown < 0.0) {
        throw ConfigError("max_drawdown must be >= 0");
    }
    if (workers < 1) {
        throw ConfigError("workers must be >= 1");
    }
    if (max_iterations < 1) {
        throw ConfigError("max_iterations must be >= 1");
    }
    if (!(tolerance > 0.0)) {
        throw ConfigError("tolerance must be positive");
    }
}

WeightOptimizer::WeightOptimizer(Runner runner, OptimizerConfig config)
    : runner_(std::move(runner))
    , config_(std::move(config))
{
    config_.validate();
    if (!runner_) {
        throw ConfigError("WeightOptimizer needs a backtest runner");
    }
}

std::vector<WeightTriple> WeightOptimizer::enumerateSimplex(double step) {
    if (!(step > 0.0) || step > 1.0) {
        throw ConfigError("Grid step must be within (0, 1]");
    }
    const double divisions = 1.0 / step;
    const long long k = std::llround(divisions);
    if (std::abs(divisions - static_cast<double>(k)) > 1e-9) {
        throw ConfigError("Grid step must divide 1.0 evenly");
    }

    std::vector<WeightTriple> out;
    const double kd = static_cast<double>(k);
    for (long long i = 0; i <= k; ++i) {
        for (long long j = 0; j <= k - i; ++j) {
            out.emplace_back(static_cast<double>(i) / kd,
                             static_cast<double>(j) / kd,
                             static_cast<double>(k - i - j) / kd);
        }
    }
    return out;
}

std::vector<WeightTriple> WeightOptimizer::defaultComparisonSet() {
    return {
        WeightTriple(0.8, 0.1, 0.1),
        WeightTriple(0.7, 0.2, 0.1),
        WeightTriple(0.6, 0.3, 0.1),
        WeightTriple(0.6, 0.2, 0.2),
        WeightTriple(0.5, 0.4, 0.1),
        WeightTriple(0.5, 0.3, 0.2),
        WeightTriple(0.4, 0.4, 0.2),
        WeightTriple(0.33, 0.33, 0.34),
        WeightTriple(0.3, 0.5, 0.2),
        WeightTriple(0.2, 0.6, 0.2),
        WeightTriple(0.9, 0.05, 0.05),
        WeightTriple(0.5, 0.25, 0.25),
    };
}

CandidateResult WeightOptimizer::evaluate(const WeightTriple& weights) const {
    CandidateResult candidate(weights);
    try {
        auto result = runner_(weights);
        candidate.metrics = result.metrics;
        candidate.status = CandidateStatus::OK;
        candidate.feasible = candidate.metrics.max_drawdown <= config_.max_drawdown;
        LOG_INFO("Weights {}: CAGR {:.2f}%, max drawdown {:.2f}%{}",
                 weights.toString(), candidate.metrics.cagr * 100.0,
                 candidate.metrics.max_drawdown * 100.0, candidate.feasible ? "" : " (drawdown exceeded)");
    } catch (const DataError& e) {
        candidate.status = CandidateStatus::FAILED;
        candidate.failure = std::string("data error: ") + e.what();
        LOG_WARN("Weights {} failed: {}", weights.toString(), candidate.failure);
    }
    return candidate;
}

std::vector<CandidateResult> WeightOptimizer::evaluateAll(const std::vector<WeightTriple>& candidates) {
    std::vector<std::optional<CandidateResult>> slots(candidates.size());
    const size_t worker_count = std::min<size_t>(static_cast<size_t>(config_.workers),
                                                 std::max<size_t>(candidates.size(), 1));

    std::atomic<size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;
    std::atomic<bool> aborted{false};

    auto work = [&]() {
        while (!stop_requested_ && !aborted) {
            const size_t idx = next.fetch_add(1);
            if (idx >= candidates.size()) break;
            try {
                slots[idx] = evaluate(candidates[idx]);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                aborted = true;
            }
        }
    };

    if (worker_count <= 1) {
        work();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            threads.emplace_back(work);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    std::vector<CandidateResult> out;
    out.reserve(candidates.size());
    for (auto& slot : slots) {
        if (slot) out.push_back(std::move(*slot));
    }
    return out;
}

OptimizationReport WeightOptimizer::rankCandidates(std::vector<CandidateResult> candidates, double max_drawdown) {
    OptimizationReport report;
    report.evaluated = candidates.size();
    for (auto& c : candidates) {
        if (c.status == CandidateStatus::FAILED) {
            c.feasible = false;
            report.failed.push_back(std::move(c));
            continue;
        }
        c.feasible = c.metrics.max_drawdown <= max_drawdown;
        if (c.feasible) {
            report.ranked.push_back(std::move(c));
        } else {
            report.infeasible.push_back(std::move(c));
        }
    }
    std::sort(report.ranked.begin(), report.ranked.end(), betterCandidate);
    std::sort(report.infeasible.begin(), report.infeasible.end(), betterCandidate);
    return report;
}

OptimizationReport WeightOptimizer::gridSearch() {
    const auto grid = enumerateSimplex(config_.step);
    LOG_INFO("Grid search: {} combinations (step {}), {} worker(s)", grid.size(), config_.step, config_.workers);

    auto results = evaluateAll(grid);
    const bool stopped = results.size() < grid.size();
    auto report = rankCandidates(std::move(results), config_.max_drawdown);
    report.stopped = stopped;

    LOG_INFO("Grid search done: {} feasible, {} infeasible, {} failed{}",
             report.ranked.size(), report.infeasible.size(), report.failed.size(),
             stopped ? " (stopped early)" : "");
    return report;
}

OptimizationReport WeightOptimizer::compareCombinations(const std::vector<WeightTriple>& candidates) {
    LOG_INFO("Comparing {} weight combinations", candidates.size());
    auto results = evaluateAll(candidates);
    const bool stopped = results.size() < candidates.size();
    auto report = rankCandidates(std::move(results), config_.max_drawdown);
    report.stopped = stopped;
    return report;
}

double WeightOptimizer::objective(const CandidateResult& candidate) const {
    if (candidate.status == CandidateStatus::FAILED) {
        return kFailedObjective;
    }
    double value = -candidate.metrics.cagr;
    if (candidate.metrics.max_drawdown > config_.max_drawdown) {
        value += kDrawdownPenalty * (candidate.metrics.max_drawdown - config_.max_drawdown);
    }
    return value;
}

WeightTriple WeightOptimizer::projectToSimplex(double return_weight, double rsi_weight) {
    double x = std::max(0.0, return_weight);
    double y = std::max(0.0, rsi_weight);
    if (x + y > 1.0) {
        const double s = x + y;
        x /= s;
        y /= s;
    }
    const double z = std::max(0.0, 1.0 - x - y);
    return WeightTriple(x, y, z);
}

OptimizationReport WeightOptimizer::directedSearch(const WeightTriple& initial) {
    LOG_INFO("Directed search from {} (max {} iterations)", initial.toString(), config_.max_iterations);

    // Every distinct projected triple evaluated so far, keyed on its exact
    // weights. This is the only state kept beyond the simplex itself; projected
    // points repeat along the simplex edges and each one is run and reported once.
    std::map<std::array<double, 3>, CandidateResult> cache;
    auto f = [&](const std::array<double, 2>& p) {
        WeightTriple w = projectToSimplex(p[0], p[1]);
        const std::array<double, 3> key = {w.returnWeight(), w.rsiWeight(), w.proximityWeight()};
        auto it = cache.find(key);
        if (it == cache.end()) {
            it = cache.emplace(key, evaluate(w)).first;
        }
        return objective(it->second);
    };

    struct Vertex {
        std::array<double, 2> p;
        double value;
    };

    const double x0 = initial.returnWeight();
    const double y0 = initial.rsiWeight();
    const double delta = 0.1;
    std::array<std::array<double, 2>, 3> start = {{
        {x0, y0},
        {x0 + delta <= 1.0 - y0 ? x0 + delta : x0 - delta, y0},
        {x0, y0 + delta <= 1.0 - x0 ? y0 + delta : y0 - delta},
    }};

    std::vector<Vertex> simplex;
    for (const auto& p : start) {
        if (stop_requested_) break;
        simplex.push_back({p, f(p)});
    }

    int iteration = 0;
    while (simplex.size() == 3 && iteration < config_.max_iterations && !stop_requested_) {
        ++iteration;
        std::sort(simplex.begin(), simplex.end(), [](const Vertex& a, const Vertex& b) { return a.value < b.value; });

        const double spread = simplex[2].value - simplex[0].value;
        const double size = std::max(std::abs(simplex[2].p[0] - simplex[0].p[0]) + std::abs(simplex[2].p[1] - simplex[0].p[1]),
                                     std::abs(simplex[1].p[0] - simplex[0].p[0]) + std::abs(simplex[1].p[1] - simplex[0].p[1]));
        if (spread < config_.tolerance && size < config_.tolerance) {
            break;
        }

        const std::array<double, 2> centroid = {
            (simplex[0].p[0] + simplex[1].p[0]) / 2.0,
            (simplex[0].p[1] + simplex[1].p[1]) / 2.0,
        };
        auto along = [&](double t) {
            return std::array<double, 2>{
                centroid[0] + t * (simplex[2].p[0] - centroid[0]),
                centroid[1] + t * (simplex[2].p[1] - centroid[1]),
            };
        };

        const auto reflected = along(-1.0);
        const double fr = f(reflected);
        if (fr < simplex[0].value) {
            const auto expanded = along(-2.0);
            const double fe = f(expanded);
            simplex[2] = fe < fr ? Vertex{expanded, fe} : Vertex{reflected, fr};
            continue;
        }
        if (fr < simplex[1].value) {
            simplex[2] = {reflected, fr};
            continue;
        }

        const auto contracted = fr < simplex[2].value ? along(-0.5) : along(0.5);
        const double fc = f(contracted);
        if (fc < std::min(fr, simplex[2].value)) {
            simplex[2] = {contracted, fc};
            continue;
        }

        // Shrink toward the best vertex.
        for (size_t i = 1; i < simplex.size(); ++i) {
            simplex[i].p[0] = simplex[0].p[0] + 0.5 * (simplex[i].p[0] - simplex[0].p[0]);
            simplex[i].p[1] = simplex[0].p[1] + 0.5 * (simplex[i].p[1] - simplex[0].p[1]);
            simplex[i].value = f(simplex[i].p);
        }
    }

    std::vector<CandidateResult> evaluated;
    evaluated.reserve(cache.size());
    for (auto& [w, c] : cache) {
        evaluated.push_back(std::move(c));
    }
    auto report = rankCandidates(std::move(evaluated), config_.max_drawdown);
    report.stopped = stop_requested_;

    LOG_INFO("Directed search done after {} iterations, {} distinct candidates", iteration, report.evaluated);
    return report;
}

} // namespace optimization
} // namespace rankfolio
