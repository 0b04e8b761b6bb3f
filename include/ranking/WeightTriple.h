#pragma once

#include <string>

namespace rankfolio {
namespace ranking {

// (return, rsi, proximity) weights. All >= 0 and summing to 1.0;
// the constructor throws ConfigError otherwise.
class WeightTriple {
public:
    static constexpr double kTolerance = 1e-9;

    WeightTriple(double return_weight, double rsi_weight, double proximity_weight);

    double returnWeight() const { return return_weight_; }
    double rsiWeight() const { return rsi_weight_; }
    double proximityWeight() const { return proximity_weight_; }

    std::string toString() const;

    bool operator==(const WeightTriple& o) const;
    bool operator!=(const WeightTriple& o) const { return !(*this == o); }
    // Exact lexicographic order on (return, rsi, proximity); a strict weak
    // ordering, unlike the tolerant operator==.
    bool operator<(const WeightTriple& o) const;

private:
    double return_weight_;
    double rsi_weight_;
    double proximity_weight_;
};

} // namespace ranking
} // namespace rankfolio
