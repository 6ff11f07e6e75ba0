#pragma once

#include "tradelog/types.hpp"
#include <vector>

namespace tradelog {

constexpr double kPlBucketPercent = 5.0;

// Win rate, P/L and holding statistics. Profit factor falls back to the
// gross profit when there are no losing trades.
PerformanceStats compute_stats(const std::vector<RoundTripTrade>& trades);

// Summed P/L per P/L% bucket. Buckets are contiguous from the lowest to the
// highest P/L% and always span 0%, so empty buckets in between are kept.
// No trades, no buckets.
std::vector<PlBucket> pl_distribution(const std::vector<RoundTripTrade>& trades,
                                      double bucket_percent = kPlBucketPercent);

// Per-market statistics; both JP and US are always present
TradeSummary summarize(const std::vector<RoundTripTrade>& trades);

} // namespace tradelog
