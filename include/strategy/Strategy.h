#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/IndicatorEngine.h"
#include "common/Types.h"

namespace strategylab {
namespace strategy {

enum class ComparisonOperator {
    GREATER_THAN,
    LESS_THAN,
    EQUALS,
    RANGE,
    CROSSES_ABOVE,
    CROSSES_BELOW
};

enum class StrategyDirection { LONG, SHORT, BOTH };
enum class PositionSizingMode { FIXED, PERCENTAGE_OF_EQUITY, VOLATILITY, KELLY };
enum class StopLossMode { FIXED, PERCENTAGE };
enum class TakeProfitMode { FIXED, PERCENTAGE, RISK_MULTIPLE };

struct ValueRange {
    double low = 0.0;
    double high = 0.0;
};

// Left indicator compared against either a fixed value / range or a right indicator.
struct Condition {
    std::string id;
    analytics::IndicatorSpec left;
    ComparisonOperator op = ComparisonOperator::GREATER_THAN;
    std::optional<double> value;
    std::optional<ValueRange> value_range;
    std::optional<analytics::IndicatorSpec> right;
};

struct PositionSizing {
    PositionSizingMode mode = PositionSizingMode::PERCENTAGE_OF_EQUITY;
    double value = 0.0;
    std::optional<double> max_position_size;
    std::optional<int> max_positions_open;
};

struct RiskManagement {
    StopLossMode stop_loss_mode = StopLossMode::PERCENTAGE;
    double stop_loss_value = 0.0;
    TakeProfitMode take_profit_mode = TakeProfitMode::PERCENTAGE;
    double take_profit_value = 0.0;
    bool trailing_stop = false;
    std::optional<double> trailing_stop_value;  // percent
    std::optional<double> max_drawdown;         // percent
};

struct Strategy {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> symbols;
    Timeframe timeframe = Timeframe::DAILY;
    std::vector<Condition> entry_conditions;  // AND
    std::vector<Condition> exit_conditions;   // AND
    PositionSizing position_sizing;
    RiskManagement risk_management;
    StrategyDirection direction = StrategyDirection::LONG;
};

const char* comparisonOperatorToString(ComparisonOperator op);
std::optional<ComparisonOperator> parseComparisonOperator(const std::string& text);

const char* strategyDirectionToString(StrategyDirection direction);
std::optional<StrategyDirection> parseStrategyDirection(const std::string& text);

const char* positionSizingModeToString(PositionSizingMode mode);
std::optional<PositionSizingMode> parsePositionSizingMode(const std::string& text);

const char* stopLossModeToString(StopLossMode mode);
std::optional<StopLossMode> parseStopLossMode(const std::string& text);

const char* takeProfitModeToString(TakeProfitMode mode);
std::optional<TakeProfitMode> parseTakeProfitMode(const std::string& text);

// Shape validation. Throws StrategyValidationError on the first violation.
void validateStrategy(const Strategy& strategy);

} // namespace strategy
} // namespace strategylab
