#include "data/PriceTable.h"
#include <algorithm>

namespace rankfolio {
namespace data {

size_t PriceTable::Series::endIndex(const Date& as_of) const {
    return static_cast<size_t>(std::upper_bound(dates.begin(), dates.end(), as_of) - dates.begin());
}

std::optional<size_t> PriceTable::Series::indexOf(const Date& date) const {
    auto it = std::lower_bound(dates.begin(), dates.end(), date);
    if (it == dates.end() || *it != date) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - dates.begin());
}

void PriceTable::addBar(const PriceBar& bar) {
    addBar(bar.date, bar.symbol, bar.close, bar.volume);
}

void PriceTable::addBar(const Date& date, const std::string& symbol, double close, double volume) {
    Series& s = series_[symbol];

    // Loaders mostly append in date order.
    if (s.dates.empty() || s.dates.back() < date) {
        s.dates.push_back(date);
        s.closes.push_back(close);
        s.volumes.push_back(volume);
        return;
    }

    auto it = std::lower_bound(s.dates.begin(), s.dates.end(), date);
    size_t idx = static_cast<size_t>(it - s.dates.begin());
    if (it != s.dates.end() && *it == date) {
        s.closes[idx] = close;
        s.volumes[idx] = volume;
        return;
    }
    s.dates.insert(it, date);
    s.closes.insert(s.closes.begin() + static_cast<long>(idx), close);
    s.volumes.insert(s.volumes.begin() + static_cast<long>(idx), volume);
}

size_t PriceTable::barCount() const {
    size_t total = 0;
    for (const auto& [symbol, s] : series_) {
        total += s.dates.size();
    }
    return total;
}

std::vector<std::string> PriceTable::symbols() const {
    std::vector<std::string> result;
    result.reserve(series_.size());
    for (const auto& [symbol, s] : series_) {
        result.push_back(symbol);
    }
    return result;
}

const PriceTable::Series* PriceTable::find(const std::string& symbol) const {
    auto it = series_.find(symbol);
    return it == series_.end() ? nullptr : &it->second;
}

std::vector<double> PriceTable::closesUpTo(const std::string& symbol, const Date& as_of, size_t max_bars) const {
    const Series* s = find(symbol);
    if (!s) return {};
    size_t end = s->endIndex(as_of);
    size_t begin = (max_bars > 0 && end > max_bars) ? end - max_bars : 0;
    return std::vector<double>(s->closes.begin() + static_cast<long>(begin),
                               s->closes.begin() + static_cast<long>(end));
}

std::vector<double> PriceTable::volumesUpTo(const std::string& symbol, const Date& as_of, size_t max_bars) const {
    const Series* s = find(symbol);
    if (!s) return {};
    size_t end = s->endIndex(as_of);
    size_t begin = (max_bars > 0 && end > max_bars) ? end - max_bars : 0;
    return std::vector<double>(s->volumes.begin() + static_cast<long>(begin),
                               s->volumes.begin() + static_cast<long>(end));
}

size_t PriceTable::historyLength(const std::string& symbol, const Date& as_of) const {
    const Series* s = find(symbol);
    return s ? s->endIndex(as_of) : 0;
}

std::optional<double> PriceTable::closeOn(const std::string& symbol, const Date& date) const {
    const Series* s = find(symbol);
    if (!s) return std::nullopt;
    auto idx = s->indexOf(date);
    if (!idx) return std::nullopt;
    return s->closes[*idx];
}

std::optional<double> PriceTable::lastCloseOnOrBefore(const std::string& symbol, const Date& date) const {
    const Series* s = find(symbol);
    if (!s) return std::nullopt;
    size_t end = s->endIndex(date);
    if (end == 0) return std::nullopt;
    return s->closes[end - 1];
}

std::optional<Date> PriceTable::lastBarOnOrBefore(const std::string& symbol, const Date& date) const {
    const Series* s = find(symbol);
    if (!s) return std::nullopt;
    size_t end = s->endIndex(date);
    if (end == 0) return std::nullopt;
    return s->dates[end - 1];
}

bool PriceTable::hasAnyClose(const Date& date, const std::vector<std::string>& symbols) const {
    for (const auto& symbol : symbols) {
        const Series* s = find(symbol);
        if (s && s->indexOf(date)) {
            return true;
        }
    }
    return false;
}

std::vector<Date> PriceTable::tradingDays(const Date& start, const Date& end,
                                          const std::vector<std::string>& symbols) const {
    std::set<Date> days;
    for (const auto& symbol : symbols) {
        const Series* s = find(symbol);
        if (!s) continue;
        auto first = std::lower_bound(s->dates.begin(), s->dates.end(), start);
        auto last = std::upper_bound(s->dates.begin(), s->dates.end(), end);
        days.insert(first, last);
    }
    return std::vector<Date>(days.begin(), days.end());
}

PriceTable PriceTable::slice(const std::vector<std::string>& symbols, const Date& start, const Date& end) const {
    PriceTable out;
    auto copySeries = [&](const std::string& symbol, const Series& s) {
        auto first = std::lower_bound(s.dates.begin(), s.dates.end(), start);
        auto last = std::upper_bound(s.dates.begin(), s.dates.end(), end);
        if (first >= last) return;
        size_t b = static_cast<size_t>(first - s.dates.begin());
        size_t e = static_cast<size_t>(last - s.dates.begin());
        Series& dst = out.series_[symbol];
        dst.dates.assign(first, last);
        dst.closes.assign(s.closes.begin() + static_cast<long>(b), s.closes.begin() + static_cast<long>(e));
        dst.volumes.assign(s.volumes.begin() + static_cast<long>(b), s.volumes.begin() + static_cast<long>(e));
    };

    if (symbols.empty()) {
        for (const auto& [symbol, s] : series_) {
            copySeries(symbol, s);
        }
    } else {
        for (const auto& symbol : symbols) {
            const Series* s = find(symbol);
            if (s) copySeries(symbol, *s);
        }
    }
    return out;
}

} // namespace data
} // namespace rankfolio
