#include "tradelog/types.hpp"
#include <algorithm>
#include <cctype>

namespace tradelog {

namespace {

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

const char* to_string(Side side) {
    return side == Side::Buy ? "BUY" : "SELL";
}

const char* to_string(Country country) {
    return country == Country::JP ? "JP" : "US";
}

const char* to_string(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::Day:
            return "DAY";
        case Timeframe::Week:
            return "WEEK";
        case Timeframe::Month:
            return "MONTH";
    }
    return "DAY";
}

std::optional<Side> parse_side(std::string_view text) {
    std::string value = upper(text);
    if (value == "BUY") return Side::Buy;
    if (value == "SELL") return Side::Sell;
    return std::nullopt;
}

std::optional<Country> parse_country(std::string_view text) {
    std::string value = upper(text);
    if (value == "JP") return Country::JP;
    if (value == "US") return Country::US;
    return std::nullopt;
}

std::optional<Timeframe> parse_timeframe(std::string_view text) {
    std::string value = upper(text);
    if (value == "DAY" || value == "DAILY" || value == "D") return Timeframe::Day;
    if (value == "WEEK" || value == "WEEKLY" || value == "W") return Timeframe::Week;
    if (value == "MONTH" || value == "MONTHLY" || value == "M") return Timeframe::Month;
    return std::nullopt;
}

} // namespace tradelog
