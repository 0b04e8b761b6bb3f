#pragma once

#include <string>

#include "execution/IOrderExecutor.h"

namespace rankfolio {
namespace execution {

// Fills every order in full at its planned price.
class PaperOrderExecutor : public IOrderExecutor {
public:
    explicit PaperOrderExecutor(std::string trade_date = {});

    OrderReport execute(const portfolio::PlannedOrder& order) override;

private:
    std::string trade_date_;
    long long order_seq_ = 0;
};

} // namespace execution
} // namespace rankfolio
