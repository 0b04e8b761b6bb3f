#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace rankfolio {
namespace portfolio {

struct SellInstruction {
    std::string symbol;
    // 0 when the symbol is not ranked.
    int rank = 0;
    std::string reason;
};

struct BuyInstruction {
    std::string symbol;
    double target_weight = 0.0;
    // Retained holding brought up to target, never trimmed.
    bool top_up = false;
    bool placeholder = false;
    int rank = 0;
};

struct RebalanceDecision {
    Date date;
    std::vector<SellInstruction> sells;
    std::vector<BuyInstruction> buys;
    std::vector<std::string> holds;
    std::vector<std::string> warnings;
    bool defensive = false;

    bool isEmpty() const { return sells.empty() && buys.empty(); }
};

struct PlannedOrder {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Quantity quantity = 0;
    Price price = 0.0;
    std::string reason;
};

struct OrderPlan {
    std::vector<PlannedOrder> orders;
    std::vector<std::string> warnings;
    Amount projected_cash = 0.0;
};

} // namespace portfolio
} // namespace rankfolio
