#include "risk/RiskManager.h"

#include <algorithm>
#include <cmath>

namespace strategylab {
namespace risk {

RiskManager::RiskManager(const strategy::PositionSizing& sizing,
                         const strategy::RiskManagement& risk,
                         double initial_capital)
    : sizing_(sizing)
    , risk_(risk)
    , peak_equity_(initial_capital)
    , current_equity_(initial_capital)
{}

double RiskManager::calculatePositionSize(double equity) const {
    double size = 0.0;
    switch (sizing_.mode) {
        case strategy::PositionSizingMode::FIXED:
            size = sizing_.value;
            break;
        case strategy::PositionSizingMode::PERCENTAGE_OF_EQUITY:
            size = equity * (sizing_.value / 100.0);
            break;
        case strategy::PositionSizingMode::VOLATILITY:
        case strategy::PositionSizingMode::KELLY:
            size = equity * PLACEHOLDER_SIZING_FRACTION;
            break;
    }

    // A zero cap means "no cap".
    if (sizing_.max_position_size && *sizing_.max_position_size > 0.0 &&
        size > *sizing_.max_position_size) {
        size = *sizing_.max_position_size;
    }
    return size;
}

std::optional<double> RiskManager::calculateStopLoss(TradeDirection direction, double entry_price) const {
    const bool is_long = (direction == TradeDirection::LONG);
    switch (risk_.stop_loss_mode) {
        case strategy::StopLossMode::FIXED:
            return is_long ? entry_price - risk_.stop_loss_value
                           : entry_price + risk_.stop_loss_value;
        case strategy::StopLossMode::PERCENTAGE:
            return is_long ? entry_price * (1.0 - risk_.stop_loss_value / 100.0)
                           : entry_price * (1.0 + risk_.stop_loss_value / 100.0);
    }
    return std::nullopt;
}

std::optional<double> RiskManager::calculateTakeProfit(TradeDirection direction,
                                                       double entry_price,
                                                       const std::optional<double>& stop_loss) const {
    const bool is_long = (direction == TradeDirection::LONG);
    switch (risk_.take_profit_mode) {
        case strategy::TakeProfitMode::FIXED:
            return is_long ? entry_price + risk_.take_profit_value
                           : entry_price - risk_.take_profit_value;
        case strategy::TakeProfitMode::PERCENTAGE:
            return is_long ? entry_price * (1.0 + risk_.take_profit_value / 100.0)
                           : entry_price * (1.0 - risk_.take_profit_value / 100.0);
        case strategy::TakeProfitMode::RISK_MULTIPLE: {
            // No stop, or a stop price of exactly zero, leaves no risk to multiply.
            if (!stop_loss || *stop_loss == 0.0) {
                return std::nullopt;
            }
            const double risk_amount = std::abs(entry_price - *stop_loss);
            return is_long ? entry_price + risk_amount * risk_.take_profit_value
                           : entry_price - risk_amount * risk_.take_profit_value;
        }
    }
    return std::nullopt;
}

bool RiskManager::isTrailingEnabled() const {
    return risk_.trailing_stop && risk_.trailing_stop_value && *risk_.trailing_stop_value > 0.0;
}

std::optional<double> RiskManager::updateTrailingStop(TradeDirection direction,
                                                      const std::optional<double>& current_stop,
                                                      const Bar& bar) const {
    if (!isTrailingEnabled()) {
        return current_stop;
    }

    const double trail_pct = *risk_.trailing_stop_value / 100.0;
    if (direction == TradeDirection::LONG) {
        const double candidate = bar.high * (1.0 - trail_pct);
        return current_stop ? std::max(*current_stop, candidate) : candidate;
    }
    const double candidate = bar.low * (1.0 + trail_pct);
    return current_stop ? std::min(*current_stop, candidate) : candidate;
}

void RiskManager::updateEquity(double equity) {
    current_equity_ = equity;
    if (equity > peak_equity_) {
        peak_equity_ = equity;
    }
}

double RiskManager::getCurrentDrawdownPct() const {
    if (peak_equity_ <= 0.0) {
        return 0.0;
    }
    return (peak_equity_ - current_equity_) / peak_equity_ * 100.0;
}

bool RiskManager::isDrawdownExceeded() const {
    if (!risk_.max_drawdown || *risk_.max_drawdown <= 0.0) {
        return false;
    }
    return getCurrentDrawdownPct() >= *risk_.max_drawdown;
}

} // namespace risk
} // namespace strategylab
