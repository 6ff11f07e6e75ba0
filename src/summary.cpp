#include "tradelog/summary.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace tradelog {

namespace {

double bucket_floor(double percent, double bucket_percent) {
    return std::floor(percent / bucket_percent) * bucket_percent;
}

} // namespace

PerformanceStats compute_stats(const std::vector<RoundTripTrade>& trades) {
    PerformanceStats stats;
    stats.trade_count = trades.size();
    if (trades.empty()) {
        return stats;
    }

    double holding_days = 0.0;
    for (const auto& trade : trades) {
        stats.total_pl += trade.profit_loss;
        holding_days += static_cast<double>(trade.holding_days);

        if (trade.is_win()) {
            ++stats.win_count;
            stats.gross_profit += trade.profit_loss;
        } else if (trade.profit_loss < 0.0) {
            stats.gross_loss += std::abs(trade.profit_loss);
        }
    }

    auto count = static_cast<double>(stats.trade_count);
    stats.win_rate = static_cast<double>(stats.win_count) / count * 100.0;
    stats.avg_holding_days = holding_days / count;
    stats.profit_factor = stats.gross_loss == 0.0
        ? stats.gross_profit
        : stats.gross_profit / stats.gross_loss;
    return stats;
}

std::vector<PlBucket> pl_distribution(const std::vector<RoundTripTrade>& trades, double bucket_percent) {
    std::vector<PlBucket> buckets;
    if (trades.empty() || !(bucket_percent > 0.0)) {
        return buckets;
    }

    double min_percent = 0.0;
    double max_percent = 0.0;
    for (const auto& trade : trades) {
        min_percent = std::min(min_percent, trade.profit_loss_percent);
        max_percent = std::max(max_percent, trade.profit_loss_percent);
    }

    // Index arithmetic instead of stepping a double keeps bucket edges exact
    double first = bucket_floor(min_percent, bucket_percent);
    auto count = static_cast<size_t>(
        std::llround((bucket_floor(max_percent, bucket_percent) - first) / bucket_percent)) + 1;
    buckets.resize(count);
    for (size_t i = 0; i < count; ++i) {
        buckets[i].lower_percent = first + static_cast<double>(i) * bucket_percent;
        buckets[i].upper_percent = buckets[i].lower_percent + bucket_percent;
    }

    for (const auto& trade : trades) {
        auto index = static_cast<size_t>(
            std::llround((bucket_floor(trade.profit_loss_percent, bucket_percent) - first) / bucket_percent));
        buckets[index].trade_count += 1;
        buckets[index].profit_loss += trade.profit_loss;
    }
    return buckets;
}

TradeSummary summarize(const std::vector<RoundTripTrade>& trades) {
    TradeSummary summary;
    for (Country country : {Country::JP, Country::US}) {
        std::vector<RoundTripTrade> market;
        std::copy_if(trades.begin(), trades.end(), std::back_inserter(market),
                     [country](const RoundTripTrade& t) { return t.country == country; });

        MarketSummary& entry = summary.markets[country];
        entry.stats = compute_stats(market);
        entry.distribution = pl_distribution(market);
    }
    return summary;
}

} // namespace tradelog
