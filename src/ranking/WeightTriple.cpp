#include "ranking/WeightTriple.h"
#include "common/Errors.h"
#include <cmath>
#include <tuple>
#include <spdlog/fmt/fmt.h>

namespace rankfolio {
namespace ranking {

WeightTriple::WeightTriple(double return_weight, double rsi_weight, double proximity_weight)
    : return_weight_(return_weight)
    , rsi_weight_(rsi_weight)
    , proximity_weight_(proximity_weight)
{
    if (!std::isfinite(return_weight) || !std::isfinite(rsi_weight) || !std::isfinite(proximity_weight)) {
        throw ConfigError("Weights must be finite numbers");
    }
    if (return_weight < 0.0 || rsi_weight < 0.0 || proximity_weight < 0.0) {
        throw ConfigError("Weights must be non-negative: " + toString());
    }
    const double sum = return_weight + rsi_weight + proximity_weight;
    if (std::abs(sum - 1.0) > kTolerance) {
        throw ConfigError(fmt::format("Weights must sum to 1.0, got {:.12f} for {}", sum, toString()));
    }
}

std::string WeightTriple::toString() const {
    return fmt::format("({:.4g}, {:.4g}, {:.4g})", return_weight_, rsi_weight_, proximity_weight_);
}

bool WeightTriple::operator==(const WeightTriple& o) const {
    return std::abs(return_weight_ - o.return_weight_) <= kTolerance &&
           std::abs(rsi_weight_ - o.rsi_weight_) <= kTolerance &&
           std::abs(proximity_weight_ - o.proximity_weight_) <= kTolerance;
}

bool WeightTriple::operator<(const WeightTriple& o) const {
    return std::tie(return_weight_, rsi_weight_, proximity_weight_) <
           std::tie(o.return_weight_, o.rsi_weight_, o.proximity_weight_);
}

} // namespace ranking
} // namespace rankfolio
