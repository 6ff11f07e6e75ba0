#pragma once

#include "tradelog/date.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
// nlohmann/json is only pulled in by tradelog/json.hpp

namespace tradelog {

using ExecutionId = int64_t;
using TradeId = int64_t;

enum class Side {
    Buy,
    Sell
};

enum class Country {
    JP,
    US
};

enum class Timeframe {
    Day,
    Week,
    Month
};

// One broker fill
struct ExecutionRecord {
    std::optional<ExecutionId> id;  // assigned by the store on insert
    Date date;
    std::string symbol;
    std::string name;
    Side side = Side::Buy;
    double quantity = 0.0;
    double price = 0.0;
    Country country = Country::JP;
};

// Buy fills matched against a single sell fill
struct RoundTripTrade {
    std::optional<TradeId> id;
    std::string symbol;
    std::string name;
    Country country = Country::JP;

    // Entry
    Date entry_date;
    double avg_entry_price = 0.0;
    double total_quantity = 0.0;
    double total_entry_cost = 0.0;

    // Exit
    Date exit_date;
    double avg_exit_price = 0.0;
    double total_exit_revenue = 0.0;

    // Result
    double profit_loss = 0.0;
    double profit_loss_percent = 0.0;
    int64_t holding_days = 0;

    std::vector<ExecutionId> entry_execution_ids;
    std::vector<ExecutionId> exit_execution_ids;

    bool is_win() const {
        return profit_loss > 0.0;
    }
};

// OHLCV bar; for resampled bars the date is the bucket start
struct Bar {
    Date date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

// Statistics over one market's closed trades, in that market's currency
struct PerformanceStats {
    size_t trade_count = 0;
    size_t win_count = 0;
    double win_rate = 0.0;
    double total_pl = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double profit_factor = 0.0;
    double avg_holding_days = 0.0;
};

// Trades whose P/L% falls in [lower_percent, upper_percent)
struct PlBucket {
    double lower_percent = 0.0;
    double upper_percent = 0.0;
    size_t trade_count = 0;
    double profit_loss = 0.0;
};

struct MarketSummary {
    PerformanceStats stats;
    std::vector<PlBucket> distribution;
};

// Yen and dollar results are kept apart; there is no cross-market total
struct TradeSummary {
    std::map<Country, MarketSummary> markets;
};

const char* to_string(Side side);
const char* to_string(Country country);
const char* to_string(Timeframe timeframe);

// Case-insensitive; nullopt for anything unrecognized
std::optional<Side> parse_side(std::string_view text);
std::optional<Country> parse_country(std::string_view text);
std::optional<Timeframe> parse_timeframe(std::string_view text);

} // namespace tradelog
