#pragma once

#include "tradelog/types.hpp"
#include <nlohmann/json.hpp>

namespace tradelog {

// nlohmann::json conversions, found by ADL. from_json throws
// std::invalid_argument for values that are present but unusable
// (unknown side, impossible date) and nlohmann::json exceptions for
// missing keys or wrong types.

void to_json(nlohmann::json& j, const Date& date);
void from_json(const nlohmann::json& j, Date& date);

void to_json(nlohmann::json& j, Side side);
void from_json(const nlohmann::json& j, Side& side);

void to_json(nlohmann::json& j, Country country);
void from_json(const nlohmann::json& j, Country& country);

void to_json(nlohmann::json& j, const ExecutionRecord& record);
void from_json(const nlohmann::json& j, ExecutionRecord& record);

void to_json(nlohmann::json& j, const RoundTripTrade& trade);
void from_json(const nlohmann::json& j, RoundTripTrade& trade);

// Bars use ISO dates ("2024-01-15") like the quote source does
void to_json(nlohmann::json& j, const Bar& bar);
void from_json(const nlohmann::json& j, Bar& bar);

void to_json(nlohmann::json& j, const PerformanceStats& stats);
void to_json(nlohmann::json& j, const PlBucket& bucket);
void to_json(nlohmann::json& j, const TradeSummary& summary);

} // namespace tradelog
