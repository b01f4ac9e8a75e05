#include "strategy/Strategy.h"
#include "common/Errors.h"

#include <cmath>
#include <limits>

namespace strategylab {
namespace strategy {

namespace {
void requireNonNegative(const std::optional<double>& v, const std::string& field) {
    if (v && (*v < 0.0 || !std::isfinite(*v))) {
        throw StrategyValidationError(field + " must be a non-negative number");
    }
}

void requireNonNegative(double v, const std::string& field) {
    if (v < 0.0 || !std::isfinite(v)) {
        throw StrategyValidationError(field + " must be a non-negative number");
    }
}

// Indicator parameters are periods; they must fit an int.
void requirePeriod(const std::optional<double>& v, const std::string& field) {
    requireNonNegative(v, field);
    if (v && *v > static_cast<double>(std::numeric_limits<int>::max())) {
        throw StrategyValidationError(field + " is too large");
    }
}

void validateIndicator(const analytics::IndicatorSpec& spec, const std::string& where) {
    requirePeriod(spec.parameter1, where + ".parameter1");
    requirePeriod(spec.parameter2, where + ".parameter2");
    requirePeriod(spec.parameter3, where + ".parameter3");
}

void validateConditions(const std::vector<Condition>& conditions, const std::string& list_name) {
    for (size_t i = 0; i < conditions.size(); ++i) {
        const auto& c = conditions[i];
        const std::string where = list_name + "[" + std::to_string(i) + "]";
        validateIndicator(c.left, where);
        if (c.right) {
            validateIndicator(*c.right, where + ".right");
        }

        if ((c.op == ComparisonOperator::CROSSES_ABOVE || c.op == ComparisonOperator::CROSSES_BELOW) &&
            !c.right) {
            throw StrategyValidationError(where + ": crossing operators need a right indicator");
        }
        if (c.op == ComparisonOperator::RANGE && !c.right) {
            if (!c.value_range) {
                throw StrategyValidationError(where + ": range operator needs valueRange");
            }
            if (c.value_range->low > c.value_range->high) {
                throw StrategyValidationError(where + ": valueRange low is above high");
            }
        }
    }
}
} // namespace

const char* comparisonOperatorToString(ComparisonOperator op) {
    switch (op) {
        case ComparisonOperator::GREATER_THAN: return "greater_than";
        case ComparisonOperator::LESS_THAN: return "less_than";
        case ComparisonOperator::EQUALS: return "equals";
        case ComparisonOperator::RANGE: return "range";
        case ComparisonOperator::CROSSES_ABOVE: return "crosses_above";
        case ComparisonOperator::CROSSES_BELOW: return "crosses_below";
    }
    return "greater_than";
}

std::optional<ComparisonOperator> parseComparisonOperator(const std::string& text) {
    if (text == "greater_than") return ComparisonOperator::GREATER_THAN;
    if (text == "less_than") return ComparisonOperator::LESS_THAN;
    if (text == "equals") return ComparisonOperator::EQUALS;
    if (text == "range") return ComparisonOperator::RANGE;
    if (text == "crosses_above") return ComparisonOperator::CROSSES_ABOVE;
    if (text == "crosses_below") return ComparisonOperator::CROSSES_BELOW;
    return std::nullopt;
}

const char* strategyDirectionToString(StrategyDirection direction) {
    switch (direction) {
        case StrategyDirection::LONG: return "long";
        case StrategyDirection::SHORT: return "short";
        case StrategyDirection::BOTH: return "both";
    }
    return "long";
}

std::optional<StrategyDirection> parseStrategyDirection(const std::string& text) {
    if (text == "long") return StrategyDirection::LONG;
    if (text == "short") return StrategyDirection::SHORT;
    if (text == "both") return StrategyDirection::BOTH;
    return std::nullopt;
}

const char* positionSizingModeToString(PositionSizingMode mode) {
    switch (mode) {
        case PositionSizingMode::FIXED: return "fixed";
        case PositionSizingMode::PERCENTAGE_OF_EQUITY: return "percentage_of_equity";
        case PositionSizingMode::VOLATILITY: return "volatility";
        case PositionSizingMode::KELLY: return "kelly";
    }
    return "fixed";
}

std::optional<PositionSizingMode> parsePositionSizingMode(const std::string& text) {
    if (text == "fixed") return PositionSizingMode::FIXED;
    if (text == "percentage_of_equity" || text == "percentage") return PositionSizingMode::PERCENTAGE_OF_EQUITY;
    if (text == "volatility") return PositionSizingMode::VOLATILITY;
    if (text == "kelly") return PositionSizingMode::KELLY;
    return std::nullopt;
}

const char* stopLossModeToString(StopLossMode mode) {
    return (mode == StopLossMode::FIXED) ? "fixed" : "percentage";
}

std::optional<StopLossMode> parseStopLossMode(const std::string& text) {
    if (text == "fixed") return StopLossMode::FIXED;
    if (text == "percentage") return StopLossMode::PERCENTAGE;
    return std::nullopt;
}

const char* takeProfitModeToString(TakeProfitMode mode) {
    switch (mode) {
        case TakeProfitMode::FIXED: return "fixed";
        case TakeProfitMode::PERCENTAGE: return "percentage";
        case TakeProfitMode::RISK_MULTIPLE: return "risk_multiple";
    }
    return "percentage";
}

std::optional<TakeProfitMode> parseTakeProfitMode(const std::string& text) {
    if (text == "fixed") return TakeProfitMode::FIXED;
    if (text == "percentage") return TakeProfitMode::PERCENTAGE;
    if (text == "risk_multiple" || text == "risk_ratio") return TakeProfitMode::RISK_MULTIPLE;
    return std::nullopt;
}

void validateStrategy(const Strategy& strategy) {
    if (strategy.symbols.empty()) {
        throw StrategyValidationError("symbols list is empty");
    }
    for (const auto& symbol : strategy.symbols) {
        if (symbol.empty()) {
            throw StrategyValidationError("symbols list contains an empty symbol");
        }
    }

    validateConditions(strategy.entry_conditions, "entryConditions");
    validateConditions(strategy.exit_conditions, "exitConditions");

    const auto& sizing = strategy.position_sizing;
    requireNonNegative(sizing.value, "positionSizing.value");
    requireNonNegative(sizing.max_position_size, "positionSizing.maxPositionSize");
    if (sizing.max_positions_open && *sizing.max_positions_open < 0) {
        throw StrategyValidationError("positionSizing.maxPositionsOpen must be non-negative");
    }

    const auto& risk = strategy.risk_management;
    requireNonNegative(risk.stop_loss_value, "riskManagement.stopLossValue");
    requireNonNegative(risk.take_profit_value, "riskManagement.takeProfitValue");
    requireNonNegative(risk.trailing_stop_value, "riskManagement.trailingStopValue");
    requireNonNegative(risk.max_drawdown, "riskManagement.maxDrawdown");
}

} // namespace strategy
} // namespace strategylab
