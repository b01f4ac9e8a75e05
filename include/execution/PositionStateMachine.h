#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "risk/RiskManager.h"
#include "strategy/ConditionEvaluator.h"
#include "strategy/Strategy.h"

namespace strategylab {
namespace execution {

enum class PositionState { FLAT, OPEN, CLOSED };

struct ExecutionCosts {
    double slippage_rate = 0.0;    // fraction of price, 0.001 = 0.1%
    double commission_rate = 0.0;  // fraction of position size, charged on exit
};

// Per-symbol position lifecycle: FLAT -> OPEN -> CLOSED. A closed position
// is emitted as a Trade and the machine returns to FLAT on the next bar.
//
// Exit priority on every bar while OPEN:
//   1. stop-loss breach    (fill at stop price)
//   2. take-profit breach  (fill at target price)
//   3. exit condition list (fill at slippage-adjusted close)
class PositionStateMachine {
public:
    PositionStateMachine(std::string symbol,
                         const strategy::Strategy& strategy,
                         const risk::RiskManager& risk_manager,
                         ExecutionCosts costs);

    // At most one transition per bar. Returns the trade closed on this bar.
    std::optional<Trade> onBar(const std::vector<Bar>& history,
                               size_t index,
                               strategy::ConditionEvaluator& evaluator,
                               double equity,
                               bool entries_allowed);

    // Closes a still-open position at the last bar's close without slippage or commission.
    std::optional<Trade> closeAtHorizon(const Bar& last_bar);

    PositionState state() const { return state_; }
    const std::optional<Position>& position() const { return position_; }

    TradeDirection resolveDirection(strategy::ConditionEvaluator& evaluator, size_t index) const;

    static double calculatePnl(TradeDirection direction, double size,
                               double entry_price, double exit_price, double commission);

private:
    std::optional<Trade> checkExit(const std::vector<Bar>& history,
                                   size_t index,
                                   strategy::ConditionEvaluator& evaluator);
    void tryEnter(const std::vector<Bar>& history,
                  size_t index,
                  strategy::ConditionEvaluator& evaluator,
                  double equity);
    Trade closePosition(const Bar& bar, double exit_price, ExitReason reason, double commission);

    std::string symbol_;
    const strategy::Strategy& strategy_;
    const risk::RiskManager& risk_manager_;
    ExecutionCosts costs_;

    PositionState state_ = PositionState::FLAT;
    std::optional<Position> position_;
};

} // namespace execution
} // namespace strategylab
