#pragma once

#include "tradelog/types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace tradelog {

// In-memory store with two tables: raw executions and the round-trip
// trades derived from them.
class TradeStore {
public:
    TradeStore();

    // Executions
    ExecutionId insert(ExecutionRecord record);
    std::vector<ExecutionId> bulk_insert(std::vector<ExecutionRecord> records);
    bool remove(ExecutionId id);
    void clear_executions();
    std::optional<ExecutionRecord> find(ExecutionId id) const;
    std::vector<ExecutionRecord> executions_by_date() const;
    size_t execution_count() const;

    // Round-trip trades
    void replace_trades(std::vector<RoundTripTrade> trades);
    std::vector<RoundTripTrade> trades() const;

    // Inclusive on both ends; a missing bound is open
    std::vector<RoundTripTrade> trades_by_exit_date(const std::optional<Date>& from,
                                                    const std::optional<Date>& to) const;

    // JSON snapshot of both tables. load() on a missing file leaves the store
    // empty; unreadable or corrupt files throw std::runtime_error.
    void save(const std::string& path) const;
    void load(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::vector<ExecutionRecord> executions_;
    std::vector<RoundTripTrade> trades_;
    ExecutionId next_execution_id_ = 1;
    TradeId next_trade_id_ = 1;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tradelog
