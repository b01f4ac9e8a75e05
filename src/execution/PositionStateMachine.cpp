#include "execution/PositionStateMachine.h"
#include "common/Logger.h"

#include <utility>

namespace strategylab {
namespace execution {

namespace {
// `both` direction tie-break: 14-period RSI below 50 goes long, otherwise short.
strategy::Condition makeDirectionCondition() {
    strategy::Condition rsi_below;
    rsi_below.id = "direction_rsi";
    rsi_below.left.type = analytics::IndicatorType::RSI;
    rsi_below.left.parameter1 = 14.0;
    rsi_below.left.name = "rsi";
    rsi_below.op = strategy::ComparisonOperator::LESS_THAN;
    rsi_below.value = 50.0;
    return rsi_below;
}
} // namespace

PositionStateMachine::PositionStateMachine(std::string symbol,
                                           const strategy::Strategy& strategy,
                                           const risk::RiskManager& risk_manager,
                                           ExecutionCosts costs)
    : symbol_(std::move(symbol))
    , strategy_(strategy)
    , risk_manager_(risk_manager)
    , costs_(costs)
{}

double PositionStateMachine::calculatePnl(TradeDirection direction, double size,
                                          double entry_price, double exit_price, double commission) {
    if (direction == TradeDirection::LONG) {
        return size * (exit_price / entry_price - 1.0) - commission;
    }
    return size * (1.0 - exit_price / entry_price) - commission;
}

std::optional<Trade> PositionStateMachine::onBar(const std::vector<Bar>& history,
                                                 size_t index,
                                                 strategy::ConditionEvaluator& evaluator,
                                                 double equity,
                                                 bool entries_allowed) {
    if (index >= history.size()) {
        return std::nullopt;
    }
    if (state_ == PositionState::CLOSED) {
        state_ = PositionState::FLAT;
    }

    if (state_ == PositionState::OPEN) {
        auto trade = checkExit(history, index, evaluator);
        if (!trade && position_) {
            position_->stop_price = risk_manager_.updateTrailingStop(
                position_->direction, position_->stop_price, history[index]);
        }
        return trade;
    }

    if (entries_allowed) {
        tryEnter(history, index, evaluator, equity);
    }
    return std::nullopt;
}

std::optional<Trade> PositionStateMachine::checkExit(const std::vector<Bar>& history,
                                                     size_t index,
                                                     strategy::ConditionEvaluator& evaluator) {
    const Bar& bar = history[index];
    const Position& pos = *position_;
    const bool is_long = (pos.direction == TradeDirection::LONG);
    const double commission = pos.size * costs_.commission_rate;

    if (pos.stop_price) {
        const double stop = *pos.stop_price;
        if ((is_long && bar.low <= stop) || (!is_long && bar.high >= stop)) {
            return closePosition(bar, stop, ExitReason::STOP_LOSS, commission);
        }
    }

    if (pos.target_price) {
        const double target = *pos.target_price;
        if ((is_long && bar.high >= target) || (!is_long && bar.low <= target)) {
            return closePosition(bar, target, ExitReason::TAKE_PROFIT, commission);
        }
    }

    if (evaluator.evaluateAll(strategy_.exit_conditions, index)) {
        const double exit_price = is_long ? bar.close * (1.0 - costs_.slippage_rate)
                                          : bar.close * (1.0 + costs_.slippage_rate);
        return closePosition(bar, exit_price, ExitReason::EXIT_SIGNAL, commission);
    }
    return std::nullopt;
}

TradeDirection PositionStateMachine::resolveDirection(strategy::ConditionEvaluator& evaluator,
                                                      size_t index) const {
    switch (strategy_.direction) {
        case strategy::StrategyDirection::LONG:
            return TradeDirection::LONG;
        case strategy::StrategyDirection::SHORT:
            return TradeDirection::SHORT;
        case strategy::StrategyDirection::BOTH:
            break;
    }
    static const strategy::Condition rsi_below = makeDirectionCondition();
    return evaluator.evaluate(rsi_below, index) ? TradeDirection::LONG : TradeDirection::SHORT;
}

void PositionStateMachine::tryEnter(const std::vector<Bar>& history,
                                    size_t index,
                                    strategy::ConditionEvaluator& evaluator,
                                    double equity) {
    if (!evaluator.evaluateAll(strategy_.entry_conditions, index)) {
        return;
    }

    const Bar& bar = history[index];
    const TradeDirection direction = resolveDirection(evaluator, index);
    const double size = risk_manager_.calculatePositionSize(equity);
    if (size <= 0.0) {
        LOG_DEBUG("[{}] entry signal skipped: position size {:.2f} <= 0", symbol_, size);
        return;
    }

    const double entry_price = (direction == TradeDirection::LONG)
        ? bar.close * (1.0 + costs_.slippage_rate)
        : bar.close * (1.0 - costs_.slippage_rate);

    Position pos;
    pos.symbol = symbol_;
    pos.entry_time = bar.timestamp;
    pos.entry_price = entry_price;
    pos.direction = direction;
    pos.size = size;
    pos.stop_price = risk_manager_.calculateStopLoss(direction, entry_price);
    pos.target_price = risk_manager_.calculateTakeProfit(direction, entry_price, pos.stop_price);

    position_ = pos;
    state_ = PositionState::OPEN;

    LOG_DEBUG("[{}] open {} size={:.2f} entry={:.4f} stop={} target={}",
              symbol_, tradeDirectionToString(direction), size, entry_price,
              pos.stop_price ? std::to_string(*pos.stop_price) : "-",
              pos.target_price ? std::to_string(*pos.target_price) : "-");
}

Trade PositionStateMachine::closePosition(const Bar& bar, double exit_price, ExitReason reason, double commission) {
    const Position& pos = *position_;

    Trade trade;
    trade.symbol = pos.symbol;
    trade.entry_time = pos.entry_time;
    trade.entry_price = pos.entry_price;
    trade.direction = pos.direction;
    trade.size = pos.size;
    trade.stop_price = pos.stop_price;
    trade.target_price = pos.target_price;
    trade.exit_time = bar.timestamp;
    trade.exit_price = exit_price;
    trade.pnl = calculatePnl(pos.direction, pos.size, pos.entry_price, exit_price, commission);
    trade.pnl_percent = (trade.pnl / pos.size) * 100.0;
    trade.exit_reason = reason;

    position_.reset();
    state_ = PositionState::CLOSED;

    LOG_DEBUG("[{}] close {} exit={:.4f} pnl={:.2f} ({:.2f}%) reason={}",
              symbol_, tradeDirectionToString(trade.direction), trade.exit_price,
              trade.pnl, trade.pnl_percent, exitReasonToString(reason));
    return trade;
}

std::optional<Trade> PositionStateMachine::closeAtHorizon(const Bar& last_bar) {
    if (state_ != PositionState::OPEN || !position_) {
        return std::nullopt;
    }
    return closePosition(last_bar, last_bar.close, ExitReason::END_OF_DATA, 0.0);
}

} // namespace execution
} // namespace strategylab
