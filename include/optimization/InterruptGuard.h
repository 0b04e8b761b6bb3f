#pragma once

#include <csignal>

#include "optimization/WeightOptimizer.h"

namespace rankfolio {
namespace optimization {

// Routes SIGINT to WeightOptimizer::requestStop for the guard's lifetime.
// The destructor detaches the optimizer and restores the previous handler,
// also when the search throws. One guard at a time.
class InterruptGuard {
public:
    explicit InterruptGuard(WeightOptimizer& optimizer);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    // Optimizer currently receiving SIGINT, nullptr when none.
    static WeightOptimizer* attached();

private:
    using Handler = void (*)(int);
    Handler previous_;
};

} // namespace optimization
} // namespace rankfolio
