#include "strategy/ConditionEvaluator.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace strategylab;
using strategylab::analytics::IndicatorEngine;
using strategylab::analytics::IndicatorSpec;
using strategylab::analytics::IndicatorType;
using strategylab::strategy::ComparisonOperator;
using strategylab::strategy::Condition;
using strategylab::strategy::ConditionEvaluator;

namespace {
std::vector<Bar> barsFromCloses(const std::vector<double>& closes) {
    std::vector<Bar> bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.emplace_back(c, c, c, c, 1000.0, static_cast<TimestampMs>(i) * 86400000LL);
    }
    return bars;
}

IndicatorSpec indicator(IndicatorType type, std::optional<double> p1 = std::nullopt) {
    IndicatorSpec spec;
    spec.type = type;
    spec.parameter1 = p1;
    return spec;
}

Condition fixed(ComparisonOperator op, double value) {
    Condition c;
    c.left = indicator(IndicatorType::PRICE);
    c.op = op;
    c.value = value;
    return c;
}

Condition priceVsSma(ComparisonOperator op, double period) {
    Condition c;
    c.left = indicator(IndicatorType::PRICE);
    c.op = op;
    c.right = indicator(IndicatorType::SMA, period);
    return c;
}
} // namespace

int main() {
    using Op = ComparisonOperator;

    // Crossing truth table
    {
        assert(ConditionEvaluator::hasCrossed(2.0, 1.0, 0.5, 1.0, Op::CROSSES_ABOVE));
        assert(ConditionEvaluator::hasCrossed(1.0, 1.0, 0.5, 1.0, Op::CROSSES_ABOVE));   // touch counts
        assert(!ConditionEvaluator::hasCrossed(2.0, 1.0, 1.0, 1.0, Op::CROSSES_ABOVE));  // was equal
        assert(!ConditionEvaluator::hasCrossed(2.0, 1.0, 1.5, 1.0, Op::CROSSES_ABOVE));  // already above
        assert(!ConditionEvaluator::hasCrossed(0.5, 1.0, 0.2, 1.0, Op::CROSSES_ABOVE));  // still below

        assert(ConditionEvaluator::hasCrossed(0.5, 1.0, 1.5, 1.0, Op::CROSSES_BELOW));
        assert(ConditionEvaluator::hasCrossed(1.0, 1.0, 1.5, 1.0, Op::CROSSES_BELOW));
        assert(!ConditionEvaluator::hasCrossed(0.5, 1.0, 1.0, 1.0, Op::CROSSES_BELOW));
        assert(!ConditionEvaluator::hasCrossed(2.0, 1.0, 0.5, 1.0, Op::CROSSES_BELOW));

        assert(!ConditionEvaluator::hasCrossed(2.0, 1.0, 0.5, 1.0, Op::GREATER_THAN));
    }

    // Crossing against a second indicator; never at index 0
    {
        // sma(3): idx2 = 9, idx3 = 9.667; price 8 -> 12
        IndicatorEngine engine(barsFromCloses({10, 9, 8, 12}));
        ConditionEvaluator evaluator(engine);

        const auto above = priceVsSma(Op::CROSSES_ABOVE, 3);
        const auto below = priceVsSma(Op::CROSSES_BELOW, 3);
        assert(!evaluator.evaluate(above, 0));
        assert(!evaluator.evaluate(below, 0));
        assert(!evaluator.evaluate(above, 2));
        assert(evaluator.evaluate(above, 3));
        assert(!evaluator.evaluate(below, 3));

        // Indicator-vs-indicator comparisons at the same bar
        assert(evaluator.evaluate(priceVsSma(Op::GREATER_THAN, 3), 3));
        assert(evaluator.evaluate(priceVsSma(Op::LESS_THAN, 3), 2));
        assert(evaluator.evaluate(priceVsSma(Op::EQUALS, 3), 0));  // sma == close before the window fills

        // range needs a fixed band; with a right indicator it never holds
        auto ranged = priceVsSma(Op::RANGE, 3);
        ranged.value_range = strategy::ValueRange{0.0, 100.0};
        assert(!evaluator.evaluate(ranged, 3));
    }

    // Fixed-value operators
    {
        IndicatorEngine engine(barsFromCloses({10, 9, 8, 12}));
        ConditionEvaluator evaluator(engine);

        assert(evaluator.evaluate(fixed(Op::GREATER_THAN, 11.0), 3));
        assert(!evaluator.evaluate(fixed(Op::GREATER_THAN, 12.0), 3));
        assert(evaluator.evaluate(fixed(Op::LESS_THAN, 8.5), 2));

        assert(evaluator.evaluate(fixed(Op::EQUALS, 8.00005), 2));
        assert(!evaluator.evaluate(fixed(Op::EQUALS, 8.001), 2));

        // Crossing a constant is not supported
        assert(!evaluator.evaluate(fixed(Op::CROSSES_ABOVE, 9.0), 3));
        assert(!evaluator.evaluate(fixed(Op::CROSSES_BELOW, 9.0), 2));

        Condition range;
        range.left = indicator(IndicatorType::PRICE);
        range.op = Op::RANGE;
        range.value_range = strategy::ValueRange{7.0, 9.0};
        assert(evaluator.evaluate(range, 2));
        assert(!evaluator.evaluate(range, 3));
        range.value_range = strategy::ValueRange{8.0, 8.0};
        assert(evaluator.evaluate(range, 2));  // inclusive bounds

        // Missing comparand
        Condition no_value;
        no_value.left = indicator(IndicatorType::PRICE);
        no_value.op = Op::GREATER_THAN;
        assert(!evaluator.evaluate(no_value, 3));
        no_value.op = Op::RANGE;
        assert(!evaluator.evaluate(no_value, 3));
    }

    // Lists are AND-combined; an empty list never passes
    {
        IndicatorEngine engine(barsFromCloses({10, 9, 8, 12}));
        ConditionEvaluator evaluator(engine);

        assert(!evaluator.evaluateAll({}, 3));
        assert(evaluator.evaluateAll({fixed(Op::GREATER_THAN, 11.0), fixed(Op::LESS_THAN, 13.0)}, 3));
        assert(!evaluator.evaluateAll({fixed(Op::GREATER_THAN, 11.0), fixed(Op::LESS_THAN, 12.0)}, 3));
    }

    // No bars, no signal
    {
        IndicatorEngine engine(std::vector<Bar>{});
        ConditionEvaluator evaluator(engine);
        assert(!evaluator.evaluate(fixed(Op::LESS_THAN, 100.0), 0));
    }

    std::cout << "[TEST] ConditionEvaluator PASSED\n";
    return 0;
}
