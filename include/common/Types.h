#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>

#include "common/Date.h"

namespace rankfolio {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Quantity = long long;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderStatus { PENDING, FILLED, REJECTED, FAILED };

// One daily bar for one symbol. Only close is required by the ranking core;
// volume feeds the optional liquidity filters.
struct PriceBar {
    Date date;
    std::string symbol;
    double close;
    double volume;

    PriceBar() : close(0), volume(0) {}

    PriceBar(Date d, std::string s, double c, double v = 0.0)
        : date(d), symbol(std::move(s)), close(c), volume(v) {}
};

struct Holding {
    std::string symbol;
    Quantity quantity = 0;
    Price avg_cost = 0.0;
};

} // namespace rankfolio
