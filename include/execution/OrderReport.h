#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace rankfolio {
namespace execution {

// Outcome of one order handed to an executor.
struct OrderReport {
    std::string order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderStatus status = OrderStatus::PENDING;
    Quantity requested_quantity = 0;
    Quantity filled_quantity = 0;
    Price avg_price = 0.0;
    std::string message;
    bool terminal = false;
};

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::REJECTED: return "REJECTED";
        case OrderStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "BUY" : "SELL";
}

inline nlohmann::json toJson(const OrderReport& report) {
    nlohmann::json line;
    line["order_id"] = report.order_id;
    line["symbol"] = report.symbol;
    line["side"] = orderSideToString(report.side);
    line["status"] = orderStatusToString(report.status);
    line["requested_quantity"] = report.requested_quantity;
    line["filled_quantity"] = report.filled_quantity;
    line["avg_price"] = report.avg_price;
    line["message"] = report.message;
    line["terminal"] = report.terminal;
    return line;
}

} // namespace execution
} // namespace rankfolio
