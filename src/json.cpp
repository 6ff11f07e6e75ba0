#include "tradelog/json.hpp"
#include <stdexcept>

namespace tradelog {

namespace {

Date parse_date_value(const nlohmann::json& j) {
    std::string text = j.get<std::string>();
    auto date = Date::parse(text);
    if (!date) {
        throw std::invalid_argument("Invalid date: " + text);
    }
    return *date;
}

template <typename T>
void read_optional_id(const nlohmann::json& j, std::optional<T>& id) {
    if (j.contains("id") && !j["id"].is_null()) {
        id = j["id"].get<T>();
    } else {
        id.reset();
    }
}

} // namespace

void to_json(nlohmann::json& j, const Date& date) {
    j = date.to_string();
}

void from_json(const nlohmann::json& j, Date& date) {
    date = parse_date_value(j);
}

void to_json(nlohmann::json& j, Side side) {
    j = to_string(side);
}

void from_json(const nlohmann::json& j, Side& side) {
    auto text = j.get<std::string>();
    auto parsed = parse_side(text);
    if (!parsed) {
        throw std::invalid_argument("Invalid side: " + text);
    }
    side = *parsed;
}

void to_json(nlohmann::json& j, Country country) {
    j = to_string(country);
}

void from_json(const nlohmann::json& j, Country& country) {
    auto text = j.get<std::string>();
    auto parsed = parse_country(text);
    if (!parsed) {
        throw std::invalid_argument("Invalid country: " + text);
    }
    country = *parsed;
}

void to_json(nlohmann::json& j, const ExecutionRecord& record) {
    j = nlohmann::json{
        {"id", record.id ? nlohmann::json(*record.id) : nlohmann::json(nullptr)},
        {"date", record.date},
        {"symbol", record.symbol},
        {"name", record.name},
        {"side", record.side},
        {"quantity", record.quantity},
        {"price", record.price},
        {"country", record.country}
    };
}

void from_json(const nlohmann::json& j, ExecutionRecord& record) {
    read_optional_id(j, record.id);
    record.date = j.at("date").get<Date>();
    record.symbol = j.at("symbol").get<std::string>();
    record.name = j.value("name", record.symbol);
    record.side = j.at("side").get<Side>();
    record.quantity = j.at("quantity").get<double>();
    record.price = j.at("price").get<double>();
    record.country = j.at("country").get<Country>();
}

void to_json(nlohmann::json& j, const RoundTripTrade& trade) {
    j = nlohmann::json{
        {"id", trade.id ? nlohmann::json(*trade.id) : nlohmann::json(nullptr)},
        {"symbol", trade.symbol},
        {"name", trade.name},
        {"country", trade.country},
        {"entry_date", trade.entry_date},
        {"avg_entry_price", trade.avg_entry_price},
        {"total_quantity", trade.total_quantity},
        {"total_entry_cost", trade.total_entry_cost},
        {"exit_date", trade.exit_date},
        {"avg_exit_price", trade.avg_exit_price},
        {"total_exit_revenue", trade.total_exit_revenue},
        {"profit_loss", trade.profit_loss},
        {"profit_loss_percent", trade.profit_loss_percent},
        {"holding_days", trade.holding_days},
        {"entry_execution_ids", trade.entry_execution_ids},
        {"exit_execution_ids", trade.exit_execution_ids}
    };
}

void from_json(const nlohmann::json& j, RoundTripTrade& trade) {
    read_optional_id(j, trade.id);
    trade.symbol = j.at("symbol").get<std::string>();
    trade.name = j.at("name").get<std::string>();
    trade.country = j.at("country").get<Country>();
    trade.entry_date = j.at("entry_date").get<Date>();
    trade.avg_entry_price = j.at("avg_entry_price").get<double>();
    trade.total_quantity = j.at("total_quantity").get<double>();
    trade.total_entry_cost = j.at("total_entry_cost").get<double>();
    trade.exit_date = j.at("exit_date").get<Date>();
    trade.avg_exit_price = j.at("avg_exit_price").get<double>();
    trade.total_exit_revenue = j.at("total_exit_revenue").get<double>();
    trade.profit_loss = j.at("profit_loss").get<double>();
    trade.profit_loss_percent = j.at("profit_loss_percent").get<double>();
    trade.holding_days = j.at("holding_days").get<int64_t>();
    trade.entry_execution_ids = j.at("entry_execution_ids").get<std::vector<ExecutionId>>();
    trade.exit_execution_ids = j.at("exit_execution_ids").get<std::vector<ExecutionId>>();
}

void to_json(nlohmann::json& j, const Bar& bar) {
    j = nlohmann::json{
        {"date", bar.date.to_iso()},
        {"open", bar.open},
        {"high", bar.high},
        {"low", bar.low},
        {"close", bar.close},
        {"volume", bar.volume}
    };
}

void from_json(const nlohmann::json& j, Bar& bar) {
    // The quote source calls the date field "time"
    bar.date = parse_date_value(j.contains("date") ? j.at("date") : j.at("time"));
    bar.open = j.at("open").get<double>();
    bar.high = j.at("high").get<double>();
    bar.low = j.at("low").get<double>();
    bar.close = j.at("close").get<double>();
    bar.volume = j.value("volume", 0.0);
}

void to_json(nlohmann::json& j, const PerformanceStats& stats) {
    j = nlohmann::json{
        {"trade_count", stats.trade_count},
        {"win_count", stats.win_count},
        {"win_rate", stats.win_rate},
        {"total_pl", stats.total_pl},
        {"gross_profit", stats.gross_profit},
        {"gross_loss", stats.gross_loss},
        {"profit_factor", stats.profit_factor},
        {"avg_holding_days", stats.avg_holding_days}
    };
}

void to_json(nlohmann::json& j, const PlBucket& bucket) {
    j = nlohmann::json{
        {"lower_percent", bucket.lower_percent},
        {"upper_percent", bucket.upper_percent},
        {"trade_count", bucket.trade_count},
        {"profit_loss", bucket.profit_loss}
    };
}

void to_json(nlohmann::json& j, const TradeSummary& summary) {
    // Keyed by market: {"JP": {...stats, "distribution": [...]}, "US": {...}}
    j = nlohmann::json::object();
    for (const auto& [country, market] : summary.markets) {
        nlohmann::json entry = market.stats;
        entry["distribution"] = market.distribution;
        j[to_string(country)] = std::move(entry);
    }
}

} // namespace tradelog
