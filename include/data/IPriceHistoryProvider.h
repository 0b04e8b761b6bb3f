#pragma once

#include <string>
#include <vector>

#include "data/PriceTable.h"

namespace rankfolio {
namespace data {

// Source of daily closes. Implementations are read-only after construction,
// so one provider may serve several simulator runs concurrently.
class IPriceHistoryProvider {
public:
    virtual ~IPriceHistoryProvider() = default;

    virtual PriceTable getPrices(const std::vector<std::string>& symbols,
                                 const Date& start, const Date& end) const = 0;
};

class InMemoryPriceHistoryProvider : public IPriceHistoryProvider {
public:
    explicit InMemoryPriceHistoryProvider(PriceTable table) : table_(std::move(table)) {}

    PriceTable getPrices(const std::vector<std::string>& symbols,
                         const Date& start, const Date& end) const override {
        return table_.slice(symbols, start, end);
    }

private:
    PriceTable table_;
};

} // namespace data
} // namespace rankfolio
