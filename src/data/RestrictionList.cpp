#include "data/RestrictionList.h"
#include <algorithm>

namespace rankfolio {
namespace data {

bool RestrictionList::isLongTermRestricted(const std::string& symbol, const Date& date) const {
    return std::any_of(entries_.begin(), entries_.end(), [&](const Restriction& r) {
        return r.kind == RestrictionKind::LONG_TERM && r.symbol == symbol && r.activeOn(date);
    });
}

std::optional<int> RestrictionList::shortTermStage(const std::string& symbol, const Date& date) const {
    std::optional<int> stage;
    for (const auto& r : entries_) {
        if (r.kind != RestrictionKind::SHORT_TERM || r.symbol != symbol || !r.activeOn(date)) {
            continue;
        }
        if (!stage || r.stage > *stage) {
            stage = r.stage;
        }
    }
    return stage;
}

std::set<std::string> RestrictionList::restrictedSymbols(const Date& date, int min_short_term_stage) const {
    std::set<std::string> result;
    for (const auto& r : entries_) {
        if (!r.activeOn(date)) continue;
        if (r.kind == RestrictionKind::LONG_TERM || r.stage >= min_short_term_stage) {
            result.insert(r.symbol);
        }
    }
    return result;
}

} // namespace data
} // namespace rankfolio
