#include "common/Date.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace rankfolio {

namespace {
// Howard Hinnant's days_from_civil / civil_from_days.
long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

void civilFromDays(long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<long>(yoe) + era * 400) + (m <= 2);
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) {
        return 29;
    }
    return kDays[m - 1];
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

Date Date::fromYmd(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    return Date(daysFromCivil(year, month, day));
}

Date Date::parse(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Expected YYYY-MM-DD, got '" + text + "'");
    }
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Expected YYYY-MM-DD, got '" + text + "'");
        }
    }
    const int y = std::stoi(text.substr(0, 4));
    const unsigned m = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    const unsigned d = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    return fromYmd(y, m, d);
}

int Date::year() const {
    int y; unsigned m, d;
    civilFromDays(days_, y, m, d);
    return y;
}

unsigned Date::month() const {
    int y; unsigned m, d;
    civilFromDays(days_, y, m, d);
    return m;
}

unsigned Date::day() const {
    int y; unsigned m, d;
    civilFromDays(days_, y, m, d);
    return d;
}

Weekday Date::weekday() const {
    // 1970-01-01 was a Thursday.
    long idx = (days_ + 3) % 7;
    if (idx < 0) {
        idx += 7;
    }
    return static_cast<Weekday>(idx);
}

std::string Date::toString() const {
    int y; unsigned m, d;
    civilFromDays(days_, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

Weekday parseWeekday(const std::string& name) {
    const std::string lower = toLowerCopy(name);
    if (lower == "monday" || lower == "mon") return Weekday::MONDAY;
    if (lower == "tuesday" || lower == "tue") return Weekday::TUESDAY;
    if (lower == "wednesday" || lower == "wed") return Weekday::WEDNESDAY;
    if (lower == "thursday" || lower == "thu") return Weekday::THURSDAY;
    if (lower == "friday" || lower == "fri") return Weekday::FRIDAY;
    if (lower == "saturday" || lower == "sat") return Weekday::SATURDAY;
    if (lower == "sunday" || lower == "sun") return Weekday::SUNDAY;
    throw std::invalid_argument("Unknown weekday: " + name);
}

std::string weekdayName(Weekday day) {
    switch (day) {
        case Weekday::MONDAY: return "Monday";
        case Weekday::TUESDAY: return "Tuesday";
        case Weekday::WEDNESDAY: return "Wednesday";
        case Weekday::THURSDAY: return "Thursday";
        case Weekday::FRIDAY: return "Friday";
        case Weekday::SATURDAY: return "Saturday";
        case Weekday::SUNDAY: return "Sunday";
    }
    return "Unknown";
}

} // namespace rankfolio
