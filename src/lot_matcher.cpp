#include "tradelog/lot_matcher.hpp"
#include "tradelog/logging.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace tradelog {

void LotQueue::push(const ExecutionRecord& buy) {
    fragments_.push_back(LotFragment{buy.price, buy.quantity, buy.date, buy.id});
}

std::vector<LotFragment> LotQueue::consume(double quantity, double& unmatched) {
    std::vector<LotFragment> matched;
    double remaining = quantity;

    while (remaining > kQuantityEpsilon && !fragments_.empty()) {
        LotFragment& head = fragments_.front();

        if (head.quantity <= remaining + kQuantityEpsilon) {
            // Whole fragment is sold
            remaining -= head.quantity;
            matched.push_back(head);
            fragments_.pop_front();
        } else {
            // Split: the sold piece leaves, the rest stays at the head
            LotFragment piece = head;
            piece.quantity = remaining;
            matched.push_back(piece);
            head.quantity -= remaining;
            remaining = 0.0;
        }
    }

    unmatched = remaining > kQuantityEpsilon ? remaining : 0.0;
    return matched;
}

double LotQueue::open_quantity() const {
    double total = 0.0;
    for (const auto& fragment : fragments_) {
        total += fragment.quantity;
    }
    return total;
}

RoundTripTrade make_round_trip(const std::vector<LotFragment>& buys, const ExecutionRecord& sell) {
    RoundTripTrade trade;
    trade.symbol = sell.symbol;
    trade.name = sell.name;
    trade.country = sell.country;

    for (const auto& buy : buys) {
        trade.total_quantity += buy.quantity;
        trade.total_entry_cost += buy.price * buy.quantity;
        if (buy.source_id) {
            trade.entry_execution_ids.push_back(*buy.source_id);
        }
    }

    trade.entry_date = buys.front().date;
    trade.avg_entry_price = trade.total_quantity > 0.0 ? trade.total_entry_cost / trade.total_quantity : 0.0;

    trade.exit_date = sell.date;
    trade.avg_exit_price = sell.price;
    trade.total_exit_revenue = sell.price * trade.total_quantity;
    if (sell.id) {
        trade.exit_execution_ids.push_back(*sell.id);
    }

    trade.profit_loss = trade.total_exit_revenue - trade.total_entry_cost;
    trade.profit_loss_percent = trade.total_entry_cost != 0.0
        ? trade.profit_loss / trade.total_entry_cost * 100.0
        : 0.0;

    // Dates are whole days, so the ceiling only matters if that ever changes
    int64_t days = trade.exit_date.days_since_epoch() - trade.entry_date.days_since_epoch();
    trade.holding_days = static_cast<int64_t>(std::ceil(std::abs(static_cast<double>(days))));
    return trade;
}

LotMatcher::LotMatcher() {
    logger_ = get_logger("lot_matcher");
}

std::vector<RoundTripTrade> LotMatcher::aggregate(const std::vector<ExecutionRecord>& executions) const {
    // Group by (symbol, country), keeping first-appearance order for stable output
    std::map<std::pair<std::string, Country>, size_t> group_index;
    std::vector<std::vector<ExecutionRecord>> groups;

    for (const auto& execution : executions) {
        auto key = std::make_pair(execution.symbol, execution.country);
        auto it = group_index.find(key);
        if (it == group_index.end()) {
            it = group_index.emplace(key, groups.size()).first;
            groups.emplace_back();
        }
        groups[it->second].push_back(execution);
    }

    std::vector<RoundTripTrade> trades;
    for (auto& group : groups) {
        auto matched = match_instrument(std::move(group));
        trades.insert(trades.end(), matched.begin(), matched.end());
    }

    logger_->debug("Aggregated {} executions in {} instruments into {} round trips",
                   executions.size(), groups.size(), trades.size());
    return trades;
}

std::vector<RoundTripTrade> LotMatcher::match_instrument(std::vector<ExecutionRecord> executions) const {
    // Same-day fills keep their input order
    std::stable_sort(executions.begin(), executions.end(),
                     [](const ExecutionRecord& a, const ExecutionRecord& b) { return a.date < b.date; });

    std::vector<RoundTripTrade> trades;
    LotQueue queue;

    for (const auto& execution : executions) {
        if (execution.side == Side::Buy) {
            queue.push(execution);
            continue;
        }

        double unmatched = 0.0;
        std::vector<LotFragment> buys = queue.consume(execution.quantity, unmatched);

        if (!buys.empty()) {
            trades.push_back(make_round_trip(buys, execution));
        }
        if (unmatched > 0.0) {
            // Short positions are not tracked; the excess is dropped
            logger_->debug("Dropping unmatched sell quantity {} of {} ({}) on {}",
                           unmatched, execution.symbol, to_string(execution.country),
                           execution.date.to_string());
        }
    }
    return trades;
}

std::vector<RoundTripTrade> aggregate_trades(const std::vector<ExecutionRecord>& executions) {
    return LotMatcher().aggregate(executions);
}

} // namespace tradelog
