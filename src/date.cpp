#include "tradelog/date.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tradelog {

namespace {

constexpr int64_t kSecondsPerDay = 24 * 60 * 60;

int64_t to_epoch_seconds(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;  // keep well away from day boundaries
    return static_cast<int64_t>(timegm(&tm));
}

std::tm from_epoch_seconds(int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::string format(const Date& date, char separator) {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << date.year << separator
        << std::setw(2) << date.month << separator
        << std::setw(2) << date.day;
    return out.str();
}

} // namespace

std::optional<Date> Date::parse(std::string_view text) {
    std::string value(text);
    for (auto& c : value) {
        if (c == '-') c = '/';
    }

    std::tm tm{};
    std::istringstream stream(value);
    stream >> std::get_time(&tm, "%Y/%m/%d");
    if (stream.fail()) {
        return std::nullopt;
    }
    // Trailing garbage such as "2025/01/01x" is not a date
    stream >> std::ws;
    if (!stream.eof()) {
        return std::nullopt;
    }

    Date date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        return std::nullopt;
    }
    // timegm normalizes 2025/02/30 into March; a changed date means it never existed
    if (from_days(date.days_since_epoch()) != date) {
        return std::nullopt;
    }
    return date;
}

Date Date::from_days(int64_t days_since_epoch) {
    std::tm tm = from_epoch_seconds(days_since_epoch * kSecondsPerDay + kSecondsPerDay / 2);
    return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

int64_t Date::days_since_epoch() const {
    int64_t seconds = to_epoch_seconds(year, month, day);
    // Floor division so dates before 1970 still land on the right day
    int64_t days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) {
        --days;
    }
    return days;
}

int Date::weekday() const {
    std::tm tm = from_epoch_seconds(to_epoch_seconds(year, month, day));
    return tm.tm_wday == 0 ? 7 : tm.tm_wday;
}

Date Date::add_days(int64_t days) const {
    return from_days(days_since_epoch() + days);
}

std::string Date::to_string() const {
    return format(*this, '/');
}

std::string Date::to_iso() const {
    return format(*this, '-');
}

} // namespace tradelog
