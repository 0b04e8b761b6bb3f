#pragma once

#include <set>
#include <string>

#include "data/RestrictionList.h"

namespace rankfolio {
namespace data {

class IRestrictionListProvider {
public:
    virtual ~IRestrictionListProvider() = default;

    virtual RestrictionList getRestrictions(const Date& date) const = 0;

    std::set<std::string> restrictedSymbols(const Date& date, int min_short_term_stage = 2) const {
        return getRestrictions(date).restrictedSymbols(date, min_short_term_stage);
    }
};

// Fixed list, used for backtests with dated entries and in tests.
class StaticRestrictionProvider : public IRestrictionListProvider {
public:
    StaticRestrictionProvider() = default;
    explicit StaticRestrictionProvider(RestrictionList list) : list_(std::move(list)) {}

    RestrictionList getRestrictions(const Date&) const override { return list_; }

private:
    RestrictionList list_;
};

} // namespace data
} // namespace rankfolio
