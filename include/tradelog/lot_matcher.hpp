#pragma once

#include "tradelog/types.hpp"
#include <deque>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace tradelog {

// Remaining quantity of one buy execution waiting to be sold
struct LotFragment {
    double price = 0.0;
    double quantity = 0.0;
    Date date;
    std::optional<ExecutionId> source_id;
};

// Quantities closer than this are treated as equal
constexpr double kQuantityEpsilon = 1e-9;

// FIFO lot queue for a single instrument
class LotQueue {
public:
    void push(const ExecutionRecord& buy);

    // Consumes up to `quantity` from the oldest fragments, splitting the head
    // fragment when it is larger than what is left. Returns the consumed
    // pieces in consumption order; anything that could not be matched is
    // reported through `unmatched`.
    std::vector<LotFragment> consume(double quantity, double& unmatched);

    bool empty() const { return fragments_.empty(); }
    size_t size() const { return fragments_.size(); }
    double open_quantity() const;
    const std::deque<LotFragment>& fragments() const { return fragments_; }

private:
    std::deque<LotFragment> fragments_;
};

class LotMatcher {
public:
    LotMatcher();

    // Rebuilds every round-trip trade from scratch. Pure: the same input
    // always yields the same output, and nothing here throws.
    std::vector<RoundTripTrade> aggregate(const std::vector<ExecutionRecord>& executions) const;

private:
    std::shared_ptr<spdlog::logger> logger_;

    std::vector<RoundTripTrade> match_instrument(std::vector<ExecutionRecord> executions) const;
};

// Builds the trade for `sell` from the buy fragments it consumed
RoundTripTrade make_round_trip(const std::vector<LotFragment>& buys, const ExecutionRecord& sell);

// Shorthand for LotMatcher().aggregate(executions)
std::vector<RoundTripTrade> aggregate_trades(const std::vector<ExecutionRecord>& executions);

} // namespace tradelog
