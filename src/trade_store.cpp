#include "tradelog/trade_store.hpp"
#include "tradelog/json.hpp"
#include "tradelog/logging.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace tradelog {

TradeStore::TradeStore() {
    logger_ = get_logger("trade_store");
}

ExecutionId TradeStore::insert(ExecutionRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecutionId id = next_execution_id_++;
    record.id = id;
    executions_.push_back(std::move(record));
    return id;
}

std::vector<ExecutionId> TradeStore::bulk_insert(std::vector<ExecutionRecord> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionId> ids;
    ids.reserve(records.size());
    for (auto& record : records) {
        record.id = next_execution_id_++;
        ids.push_back(*record.id);
        executions_.push_back(std::move(record));
    }
    return ids;
}

bool TradeStore::remove(ExecutionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(executions_.begin(), executions_.end(),
                           [id](const ExecutionRecord& r) { return r.id == id; });
    if (it == executions_.end()) {
        return false;
    }
    executions_.erase(it);
    return true;
}

void TradeStore::clear_executions() {
    std::lock_guard<std::mutex> lock(mutex_);
    executions_.clear();
}

std::optional<ExecutionRecord> TradeStore::find(ExecutionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : executions_) {
        if (record.id == id) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<ExecutionRecord> TradeStore::executions_by_date() const {
    std::vector<ExecutionRecord> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = executions_;
    }
    // Insertion order already follows ids, so a stable sort keeps id order per day
    std::stable_sort(out.begin(), out.end(),
                     [](const ExecutionRecord& a, const ExecutionRecord& b) { return a.date < b.date; });
    return out;
}

size_t TradeStore::execution_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executions_.size();
}

void TradeStore::replace_trades(std::vector<RoundTripTrade> trades) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& trade : trades) {
        trade.id = next_trade_id_++;
    }
    trades_ = std::move(trades);
}

std::vector<RoundTripTrade> TradeStore::trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trades_;
}

std::vector<RoundTripTrade> TradeStore::trades_by_exit_date(const std::optional<Date>& from,
                                                            const std::optional<Date>& to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RoundTripTrade> out;
    for (const auto& trade : trades_) {
        if (from && trade.exit_date < *from) continue;
        if (to && trade.exit_date > *to) continue;
        out.push_back(trade);
    }
    return out;
}

void TradeStore::save(const std::string& path) const {
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = nlohmann::json{
            {"next_execution_id", next_execution_id_},
            {"next_trade_id", next_trade_id_},
            {"executions", executions_},
            {"trades", trades_}
        };
    }

    // Write beside the target and rename so a crash never leaves half a file
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + tmp_path + " for writing");
        }
        out << snapshot.dump(2);
        if (!out) {
            throw std::runtime_error("Failed writing " + tmp_path);
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw std::runtime_error("Cannot replace " + path);
    }
    logger_->debug("Saved {} executions and {} trades to {}",
                   snapshot["executions"].size(), snapshot["trades"].size(), path);
}

void TradeStore::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        logger_->info("No snapshot at {}, starting empty", path);
        return;
    }

    std::vector<ExecutionRecord> executions;
    std::vector<RoundTripTrade> trades;
    ExecutionId next_execution_id = 1;
    TradeId next_trade_id = 1;
    try {
        auto snapshot = nlohmann::json::parse(in);
        executions = snapshot.at("executions").get<std::vector<ExecutionRecord>>();
        trades = snapshot.at("trades").get<std::vector<RoundTripTrade>>();
        next_execution_id = snapshot.value("next_execution_id", ExecutionId{1});
        next_trade_id = snapshot.value("next_trade_id", TradeId{1});
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Corrupt snapshot " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Corrupt snapshot " + path + ": " + e.what());
    }

    // Never hand out an id that is already taken
    for (const auto& record : executions) {
        if (record.id && *record.id >= next_execution_id) {
            next_execution_id = *record.id + 1;
        }
    }
    for (const auto& trade : trades) {
        if (trade.id && *trade.id >= next_trade_id) {
            next_trade_id = *trade.id + 1;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    executions_ = std::move(executions);
    trades_ = std::move(trades);
    next_execution_id_ = next_execution_id;
    next_trade_id_ = next_trade_id;
    logger_->info("Loaded {} executions and {} trades from {}",
                  executions_.size(), trades_.size(), path);
}

} // namespace tradelog
