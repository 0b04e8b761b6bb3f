#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/Types.h"

namespace rankfolio {
namespace data {

// Read-only (date, symbol, close, volume) table. Each symbol's series is kept
// sorted by date; a second bar for an existing (symbol, date) replaces it.
class PriceTable {
public:
    void addBar(const PriceBar& bar);
    void addBar(const Date& date, const std::string& symbol, double close, double volume = 0.0);

    bool empty() const { return series_.empty(); }
    size_t barCount() const;
    std::vector<std::string> symbols() const;
    bool hasSymbol(const std::string& symbol) const { return series_.count(symbol) > 0; }

    // Closes up to and including `as_of`, oldest first. max_bars > 0 keeps only the trailing bars.
    std::vector<double> closesUpTo(const std::string& symbol, const Date& as_of, size_t max_bars = 0) const;
    std::vector<double> volumesUpTo(const std::string& symbol, const Date& as_of, size_t max_bars = 0) const;

    // Number of bars up to and including `as_of`.
    size_t historyLength(const std::string& symbol, const Date& as_of) const;

    std::optional<double> closeOn(const std::string& symbol, const Date& date) const;
    std::optional<double> lastCloseOnOrBefore(const std::string& symbol, const Date& date) const;
    // Date of the bar lastCloseOnOrBefore would return.
    std::optional<Date> lastBarOnOrBefore(const std::string& symbol, const Date& date) const;

    // True when at least one of `symbols` has a close on `date`.
    bool hasAnyClose(const Date& date, const std::vector<std::string>& symbols) const;

    // Dates in [start, end] on which any of `symbols` has a close, ascending.
    std::vector<Date> tradingDays(const Date& start, const Date& end,
                                  const std::vector<std::string>& symbols) const;

    // Sub-table restricted to `symbols` and [start, end]. An empty symbol list keeps all symbols.
    PriceTable slice(const std::vector<std::string>& symbols, const Date& start, const Date& end) const;

private:
    struct Series {
        std::vector<Date> dates;
        std::vector<double> closes;
        std::vector<double> volumes;

        // Index one past the last bar dated <= as_of.
        size_t endIndex(const Date& as_of) const;
        std::optional<size_t> indexOf(const Date& date) const;
    };

    const Series* find(const std::string& symbol) const;

    std::map<std::string, Series> series_;
};

} // namespace data
} // namespace rankfolio
