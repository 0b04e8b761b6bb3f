#pragma once

#include <string>
#include <functional>

namespace rankfolio {

enum class Weekday { MONDAY, TUESDAY, WEDNESDAY, THURSDAY, FRIDAY, SATURDAY, SUNDAY };

// Civil calendar date stored as days since 1970-01-01.
class Date {
public:
    Date() : days_(0) {}

    static Date fromYmd(int year, unsigned month, unsigned day);
    static Date fromDays(long days) { return Date(days); }

    // Accepts YYYY-MM-DD (the first 10 characters of an ISO timestamp also work).
    // Throws std::invalid_argument on malformed input.
    static Date parse(const std::string& text);

    int year() const;
    unsigned month() const;
    unsigned day() const;
    Weekday weekday() const;

    long daysSinceEpoch() const { return days_; }
    Date addDays(long n) const { return Date(days_ + n); }
    long daysUntil(const Date& other) const { return other.days_ - days_; }

    std::string toString() const;

    bool operator==(const Date& o) const { return days_ == o.days_; }
    bool operator!=(const Date& o) const { return days_ != o.days_; }
    bool operator<(const Date& o) const { return days_ < o.days_; }
    bool operator<=(const Date& o) const { return days_ <= o.days_; }
    bool operator>(const Date& o) const { return days_ > o.days_; }
    bool operator>=(const Date& o) const { return days_ >= o.days_; }

private:
    explicit Date(long days) : days_(days) {}
    long days_;
};

Weekday parseWeekday(const std::string& name);
std::string weekdayName(Weekday day);

} // namespace rankfolio

namespace std {
template<>
struct hash<rankfolio::Date> {
    std::size_t operator()(const rankfolio::Date& d) const {
        return std::hash<long>{}(d.daysSinceEpoch());
    }
};
} // namespace std
