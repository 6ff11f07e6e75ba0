#pragma once

#include "tradelog/types.hpp"
#include <vector>

namespace tradelog {

// Start of the bucket a date falls into: the Monday on or before it for
// Week (Sunday belongs to the preceding week), the 1st for Month, the date
// itself for Day.
Date bucket_start(const Date& date, Timeframe timeframe);

// Groups daily bars into timeframe buckets. Each bucket takes the first open
// and last close in date order, the highest high, the lowest low and the
// summed volume. Output is sorted by bucket start.
std::vector<Bar> resample(const std::vector<Bar>& bars, Timeframe timeframe);

} // namespace tradelog
