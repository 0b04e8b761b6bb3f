#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/Date.h"

namespace rankfolio {
namespace data {

enum class RestrictionKind { LONG_TERM, SHORT_TERM };

// One surveillance entry. Missing from/to means open-ended on that side.
struct Restriction {
    std::string symbol;
    RestrictionKind kind = RestrictionKind::LONG_TERM;
    int stage = 1;
    std::optional<Date> from;
    std::optional<Date> to;

    bool activeOn(const Date& date) const {
        if (from && date < *from) return false;
        if (to && date > *to) return false;
        return true;
    }
};

class RestrictionList {
public:
    void add(Restriction restriction) { entries_.push_back(std::move(restriction)); }

    const std::vector<Restriction>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    bool isLongTermRestricted(const std::string& symbol, const Date& date) const;

    // Highest active short-term stage for the symbol on the date.
    std::optional<int> shortTermStage(const std::string& symbol, const Date& date) const;

    // Symbols excluded on `date`: every active long-term entry plus short-term
    // entries at or above `min_short_term_stage`.
    std::set<std::string> restrictedSymbols(const Date& date, int min_short_term_stage = 2) const;

private:
    std::vector<Restriction> entries_;
};

} // namespace data
} // namespace rankfolio
