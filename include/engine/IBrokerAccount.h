#pragma once

#include <map>
#include <string>

#include "common/Types.h"

namespace rankfolio {
namespace engine {

// Read side of a live account.
class IBrokerAccount {
public:
    virtual ~IBrokerAccount() = default;

    virtual std::map<std::string, Holding> getHoldings() = 0;
    virtual Amount getAvailableCash() = 0;
};

// Account snapshot from a JSON file:
// {"cash": 1000.0, "holdings": [{"symbol": "ABC", "quantity": 10, "avg_cost": 95.5}]}
class JsonFileBrokerAccount : public IBrokerAccount {
public:
    explicit JsonFileBrokerAccount(std::string file_path);

    std::map<std::string, Holding> getHoldings() override { return holdings_; }
    Amount getAvailableCash() override { return cash_; }

private:
    std::map<std::string, Holding> holdings_;
    Amount cash_ = 0.0;
};

} // namespace engine
} // namespace rankfolio
