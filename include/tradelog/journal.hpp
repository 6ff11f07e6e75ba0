#pragma once

#include "tradelog/csv_parser.hpp"
#include "tradelog/lot_matcher.hpp"
#include "tradelog/trade_store.hpp"
#include "tradelog/types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace tradelog {

struct ImportResult {
    CsvLayout layout = CsvLayout::DomesticJp;
    size_t imported = 0;
    size_t skipped_rows = 0;
    size_t trade_count = 0;
};

// Trade journal: the executions table plus the round-trip trades derived
// from it. Every change to the executions rebuilds all trades.
class TradeJournal {
public:
    // With a data file, the store is loaded from it on construction and
    // saved after every change.
    explicit TradeJournal(std::string data_file = "");
    ~TradeJournal() = default;

    // Import & manual entry
    ImportResult import_document(const std::string& bytes, TextEncoding encoding = TextEncoding::Auto);
    ExecutionId add_execution(const ExecutionRecord& record);
    bool remove_execution(ExecutionId id);
    void clear_executions();

    // Queries
    std::vector<ExecutionRecord> executions() const;
    std::vector<RoundTripTrade> trades() const;
    std::vector<RoundTripTrade> trades_between(const std::optional<Date>& from,
                                               const std::optional<Date>& to) const;
    TradeSummary summary(const std::optional<Date>& from = std::nullopt,
                         const std::optional<Date>& to = std::nullopt) const;

    // Full rebuild of the trades table; returns the trade count
    size_t recalculate();

    // Reporting
    void print_summary() const;

private:
    TradeStore store_;
    ExecutionParser parser_;
    LotMatcher matcher_;
    std::string data_file_;
    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;

    size_t rebuild_locked();
};

} // namespace tradelog
