#include "optimization/InterruptGuard.h"
#include "common/Logger.h"

#include <atomic>

namespace rankfolio {
namespace optimization {

namespace {
std::atomic<WeightOptimizer*> g_attached{nullptr};

void onInterrupt(int signal) {
    WeightOptimizer* optimizer = g_attached.load();
    if (signal == SIGINT && optimizer) {
        optimizer->requestStop();
    }
}
} // namespace

InterruptGuard::InterruptGuard(WeightOptimizer& optimizer) {
    g_attached.store(&optimizer);
    previous_ = std::signal(SIGINT, onInterrupt);
    if (previous_ == SIG_ERR) {
        LOG_WARN("Could not install the SIGINT handler; Ctrl+C will not stop the search");
        previous_ = SIG_DFL;
    }
}

InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, previous_);
    g_attached.store(nullptr);
}

WeightOptimizer* InterruptGuard::attached() {
    return g_attached.load();
}

} // namespace optimization
} // namespace rankfolio
