#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tradelog {

// Civil calendar date (no time of day, no zone).
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    // Accepts "YYYY/MM/DD" and "YYYY-MM-DD"; rejects dates that do not exist.
    static std::optional<Date> parse(std::string_view text);
    static Date from_days(int64_t days_since_epoch);

    int64_t days_since_epoch() const;

    // Monday = 1 ... Sunday = 7
    int weekday() const;

    Date add_days(int64_t days) const;
    Date first_of_month() const { return Date{year, month, 1}; }

    std::string to_string() const;   // YYYY/MM/DD
    std::string to_iso() const;      // YYYY-MM-DD

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

} // namespace tradelog
