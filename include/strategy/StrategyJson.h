#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "strategy/Strategy.h"

namespace strategylab {
namespace strategy {

// Strategy documents use the camelCase field names of the strategy builder:
// entryConditions[].indicatorType / parameter1..3 / operator / value /
// valueRange [low, high] / indicatorTypeRight / parameter1Right..3Right,
// positionSizing.type, riskManagement.stopLossType, and so on.
//
// Unknown operator, direction, timeframe or mode strings and wrongly typed
// fields throw StrategyValidationError. Unknown indicator names are kept.
Strategy strategyFromJson(const nlohmann::json& j);
nlohmann::json toJson(const Strategy& strategy);
nlohmann::json toJson(const Condition& condition);

// Reads and parses a strategy file. Does not run validateStrategy().
Strategy loadStrategyFile(const std::string& path);

} // namespace strategy
} // namespace strategylab
