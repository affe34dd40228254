#pragma once

#include <string>

namespace ustw {

// Calendar date (proleptic Gregorian), day resolution only.
class Date {
public:
    Date() : year_(1970), month_(1), day_(1) {}
    Date(int year, int month, int day);

    // "YYYY-MM-DD" -> Date, throws std::invalid_argument on malformed text
    static Date parse(const std::string& text);
    static Date fromDayNumber(long long days);

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    // Days since 1970-01-01
    long long dayNumber() const;

    Date addDays(long long days) const { return fromDayNumber(dayNumber() + days); }
    long long daysUntil(const Date& other) const { return other.dayNumber() - dayNumber(); }

    std::string toString() const;

    bool operator==(const Date& o) const { return year_ == o.year_ && month_ == o.month_ && day_ == o.day_; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const { return dayNumber() < o.dayNumber(); }
    bool operator<=(const Date& o) const { return !(o < *this); }
    bool operator>(const Date& o) const { return o < *this; }
    bool operator>=(const Date& o) const { return !(*this < o); }

    static bool isValid(int year, int month, int day);

private:
    int year_;
    int month_;
    int day_;
};

// Inclusive date range [start, end]
struct DateRange {
    Date start;
    Date end;

    DateRange() = default;
    DateRange(const Date& s, const Date& e) : start(s), end(e) {}

    bool contains(const Date& d) const { return start <= d && d <= end; }
    bool empty() const { return end < start; }
    std::string toString() const { return start.toString() + " ~ " + end.toString(); }
};

} // namespace ustw
