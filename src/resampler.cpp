#include "tradelog/resampler.hpp"
#include <algorithm>
#include <map>

namespace tradelog {

Date bucket_start(const Date& date, Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::Week:
            return date.add_days(-((date.weekday() + 6) % 7));
        case Timeframe::Month:
            return date.first_of_month();
        case Timeframe::Day:
            break;
    }
    return date;
}

std::vector<Bar> resample(const std::vector<Bar>& bars, Timeframe timeframe) {
    std::map<Date, std::vector<Bar>> buckets;
    for (const auto& bar : bars) {
        buckets[bucket_start(bar.date, timeframe)].push_back(bar);
    }

    std::vector<Bar> out;
    out.reserve(buckets.size());

    for (auto& [start, group] : buckets) {
        std::stable_sort(group.begin(), group.end(),
                         [](const Bar& a, const Bar& b) { return a.date < b.date; });

        Bar bucket;
        bucket.date = start;
        bucket.open = group.front().open;
        bucket.close = group.back().close;
        bucket.high = group.front().high;
        bucket.low = group.front().low;
        for (const auto& bar : group) {
            bucket.high = std::max(bucket.high, bar.high);
            bucket.low = std::min(bucket.low, bar.low);
            bucket.volume += bar.volume;
        }
        out.push_back(bucket);
    }
    return out;
}

} // namespace tradelog
