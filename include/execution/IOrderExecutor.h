#pragma once

#include "execution/OrderReport.h"
#include "portfolio/RebalanceDecision.h"

namespace rankfolio {
namespace execution {

// Places one order. Implementations report failures in the returned report;
// the caller never retries.
class IOrderExecutor {
public:
    virtual ~IOrderExecutor() = default;

    virtual OrderReport execute(const portfolio::PlannedOrder& order) = 0;
};

} // namespace execution
} // namespace rankfolio
