#pragma once

#include <string>

#include "data/IPriceHistoryProvider.h"

namespace rankfolio {
namespace data {

// Long-format CSV: date,symbol,close[,volume]. Header rows and malformed rows are skipped.
// The whole file is loaded at construction; throws std::runtime_error when it cannot be opened.
class CsvPriceHistoryProvider : public IPriceHistoryProvider {
public:
    explicit CsvPriceHistoryProvider(const std::string& file_path);

    PriceTable getPrices(const std::vector<std::string>& symbols,
                         const Date& start, const Date& end) const override;

    static PriceTable loadCSV(const std::string& file_path);

private:
    PriceTable table_;
};

} // namespace data
} // namespace rankfolio
