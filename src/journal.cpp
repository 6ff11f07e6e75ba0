#include "tradelog/journal.hpp"
#include "tradelog/logging.hpp"
#include "tradelog/summary.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace tradelog {

TradeJournal::TradeJournal(std::string data_file)
    : data_file_(std::move(data_file)) {
    logger_ = get_logger("trade_journal");

    if (!data_file_.empty()) {
        store_.load(data_file_);
        // Trades are derived data; never trust a stored copy
        std::lock_guard<std::mutex> lock(mutex_);
        rebuild_locked();
    }

    logger_->info("Trade journal ready ({} executions)", store_.execution_count());
}

ImportResult TradeJournal::import_document(const std::string& bytes, TextEncoding encoding) {
    // Parse before taking the lock; a rejected file changes nothing
    ParseResult parsed = parser_.parse_bytes(bytes, encoding);

    std::lock_guard<std::mutex> lock(mutex_);
    ImportResult result;
    result.layout = parsed.layout;
    result.skipped_rows = parsed.skipped_rows;
    result.imported = store_.bulk_insert(std::move(parsed.records)).size();
    result.trade_count = rebuild_locked();

    logger_->info("Imported {} executions from {} export, {} round trips",
                  result.imported, to_string(result.layout), result.trade_count);
    return result;
}

ExecutionId TradeJournal::add_execution(const ExecutionRecord& record) {
    if (record.symbol.empty()) {
        throw std::invalid_argument("Symbol must not be empty");
    }
    if (!(record.quantity > 0.0)) {
        throw std::invalid_argument("Quantity must be positive");
    }
    if (!(record.price > 0.0)) {
        throw std::invalid_argument("Price must be positive");
    }

    ExecutionRecord copy = record;
    copy.id.reset();
    if (copy.name.empty()) {
        copy.name = copy.symbol;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ExecutionId id = store_.insert(std::move(copy));
    rebuild_locked();

    logger_->info("Execution {} added: {} {} {} @ {:.2f}",
                  id, to_string(record.side), record.quantity, record.symbol, record.price);
    return id;
}

bool TradeJournal::remove_execution(ExecutionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = store_.find(id);
    if (!record || !store_.remove(id)) {
        logger_->warn("Execution {} not found", id);
        return false;
    }
    rebuild_locked();
    logger_->info("Execution {} removed: {} {} {} on {}",
                  id, to_string(record->side), record->quantity, record->symbol, record->date.to_string());
    return true;
}

void TradeJournal::clear_executions() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.clear_executions();
    rebuild_locked();
    logger_->info("All executions cleared");
}

std::vector<ExecutionRecord> TradeJournal::executions() const {
    return store_.executions_by_date();
}

std::vector<RoundTripTrade> TradeJournal::trades() const {
    return store_.trades();
}

std::vector<RoundTripTrade> TradeJournal::trades_between(const std::optional<Date>& from,
                                                         const std::optional<Date>& to) const {
    return store_.trades_by_exit_date(from, to);
}

TradeSummary TradeJournal::summary(const std::optional<Date>& from, const std::optional<Date>& to) const {
    return summarize(store_.trades_by_exit_date(from, to));
}

size_t TradeJournal::recalculate() {
    std::lock_guard<std::mutex> lock(mutex_);
    return rebuild_locked();
}

void TradeJournal::print_summary() const {
    TradeSummary s = summary();

    std::cout << "\n=== Trade Summary ===" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Executions: " << store_.execution_count() << std::endl;
    for (const auto& [country, market] : s.markets) {
        const PerformanceStats& stats = market.stats;
        std::cout << "[" << to_string(country) << "]" << std::endl;
        std::cout << "  Round trips: " << stats.trade_count << std::endl;
        std::cout << "  Win rate: " << stats.win_rate << "%" << std::endl;
        std::cout << "  Total P&L: " << stats.total_pl << std::endl;
        std::cout << "  Profit factor: " << stats.profit_factor << std::endl;
        std::cout << "  Avg holding days: " << stats.avg_holding_days << std::endl;
    }
    std::cout << "=====================" << std::endl;
}

size_t TradeJournal::rebuild_locked() {
    auto trades = matcher_.aggregate(store_.executions_by_date());
    size_t count = trades.size();
    store_.replace_trades(std::move(trades));
    logger_->debug("Rebuilt {} round trips", count);

    // The in-memory tables stay authoritative; the next change retries the write
    if (!data_file_.empty()) {
        try {
            store_.save(data_file_);
        } catch (const std::exception& e) {
            logger_->error("Failed to persist journal to {}: {}", data_file_, e.what());
        }
    }
    return count;
}

} // namespace tradelog
