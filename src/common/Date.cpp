#include "common/Date.h"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace ustw {

namespace {
bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int daysInMonth(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return kDays[m - 1];
}
}

Date::Date(int year, int month, int day)
    : year_(year), month_(month), day_(day) {
    if (!isValid(year, month, day)) {
        throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
}

bool Date::isValid(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= daysInMonth(year, month);
}

Date Date::parse(const std::string& text) {
    // Accept "YYYY-MM-DD" optionally followed by a time part ("2025-01-02 00:00:00")
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid date text: '" + text + "'");
    }
    for (size_t i = 0; i < 10; ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid date text: '" + text + "'");
        }
    }
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
        throw std::invalid_argument("Invalid date text: '" + text + "'");
    }

    const int y = std::stoi(text.substr(0, 4));
    const int m = std::stoi(text.substr(5, 2));
    const int d = std::stoi(text.substr(8, 2));
    return Date(y, m, d);
}

// Howard Hinnant's days_from_civil / civil_from_days
long long Date::dayNumber() const {
    const long long y = static_cast<long long>(year_) - (month_ <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month_ + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day_ - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::fromDayNumber(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const long long doe = days - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    return Date(y, m, d);
}

std::string Date::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year_, month_, day_);
    return buffer;
}

} // namespace ustw
