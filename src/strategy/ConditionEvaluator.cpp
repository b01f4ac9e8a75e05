#include "strategy/ConditionEvaluator.h"

#include <cmath>

namespace strategylab {
namespace strategy {

ConditionEvaluator::ConditionEvaluator(analytics::IndicatorEngine& indicators)
    : indicators_(indicators) {}

bool ConditionEvaluator::hasCrossed(double current_value,
                                    double current_compare,
                                    double previous_value,
                                    double previous_compare,
                                    ComparisonOperator op) {
    if (op == ComparisonOperator::CROSSES_ABOVE) {
        return previous_value < previous_compare && current_value >= current_compare;
    }
    if (op == ComparisonOperator::CROSSES_BELOW) {
        return previous_value > previous_compare && current_value <= current_compare;
    }
    return false;
}

bool ConditionEvaluator::evaluate(const Condition& condition, size_t index) {
    if (indicators_.size() == 0) {
        return false;
    }

    const double current_value = indicators_.value(condition.left, index);
    if (condition.right) {
        return evaluatePair(condition, current_value, index);
    }
    return evaluateFixed(condition, current_value);
}

bool ConditionEvaluator::evaluateFixed(const Condition& condition, double current_value) const {
    switch (condition.op) {
        case ComparisonOperator::GREATER_THAN:
            return condition.value && current_value > *condition.value;
        case ComparisonOperator::LESS_THAN:
            return condition.value && current_value < *condition.value;
        case ComparisonOperator::EQUALS:
            return condition.value && std::abs(current_value - *condition.value) < EQUALS_EPSILON;
        case ComparisonOperator::RANGE:
            if (!condition.value_range) {
                return false;
            }
            return current_value >= condition.value_range->low &&
                   current_value <= condition.value_range->high;
        case ComparisonOperator::CROSSES_ABOVE:
        case ComparisonOperator::CROSSES_BELOW:
            // A crossing always compares two indicators.
            return false;
    }
    return false;
}

bool ConditionEvaluator::evaluatePair(const Condition& condition, double current_value, size_t index) {
    const analytics::IndicatorSpec& right = *condition.right;
    const double current_compare = indicators_.value(right, index);

    switch (condition.op) {
        case ComparisonOperator::CROSSES_ABOVE:
        case ComparisonOperator::CROSSES_BELOW: {
            if (index == 0) {
                return false;
            }
            const double previous_value = indicators_.value(condition.left, index - 1);
            const double previous_compare = indicators_.value(right, index - 1);
            return hasCrossed(current_value, current_compare, previous_value, previous_compare, condition.op);
        }
        case ComparisonOperator::GREATER_THAN:
            return current_value > current_compare;
        case ComparisonOperator::LESS_THAN:
            return current_value < current_compare;
        case ComparisonOperator::EQUALS:
            return std::abs(current_value - current_compare) < EQUALS_EPSILON;
        case ComparisonOperator::RANGE:
            return false;
    }
    return false;
}

bool ConditionEvaluator::evaluateAll(const std::vector<Condition>& conditions, size_t index) {
    if (conditions.empty()) {
        return false;
    }
    for (const auto& condition : conditions) {
        if (!evaluate(condition, index)) {
            return false;
        }
    }
    return true;
}

} // namespace strategy
} // namespace strategylab
