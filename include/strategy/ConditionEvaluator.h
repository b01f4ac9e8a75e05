#pragma once

#include <vector>

#include "analytics/IndicatorEngine.h"
#include "strategy/Strategy.h"

namespace strategylab {
namespace strategy {

constexpr double EQUALS_EPSILON = 1e-4;

// Evaluates strategy conditions at a bar index against one symbol's indicators.
class ConditionEvaluator {
public:
    explicit ConditionEvaluator(analytics::IndicatorEngine& indicators);

    bool evaluate(const Condition& condition, size_t index);

    // Every condition must hold at `index`. An empty list never passes.
    bool evaluateAll(const std::vector<Condition>& conditions, size_t index);

    static bool hasCrossed(double current_value,
                           double current_compare,
                           double previous_value,
                           double previous_compare,
                           ComparisonOperator op);

private:
    bool evaluateFixed(const Condition& condition, double current_value) const;
    bool evaluatePair(const Condition& condition, double current_value, size_t index);

    analytics::IndicatorEngine& indicators_;
};

} // namespace strategy
} // namespace strategylab
