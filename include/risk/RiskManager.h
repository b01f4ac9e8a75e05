#pragma once

#include <optional>

#include "common/Types.h"
#include "strategy/Strategy.h"

namespace strategylab {
namespace risk {

// Flat fraction of equity used by the volatility and kelly sizing modes.
constexpr double PLACEHOLDER_SIZING_FRACTION = 0.02;

// Position sizing, protective price levels and the running drawdown guard
// for one backtest run.
class RiskManager {
public:
    RiskManager(const strategy::PositionSizing& sizing,
                const strategy::RiskManagement& risk,
                double initial_capital);

    // Notional to commit at the given equity, capped at maxPositionSize.
    // A result <= 0 means no position may be opened.
    double calculatePositionSize(double equity) const;

    // Levels always follow the configured mode; a zero value puts the level at
    // the entry price. A risk multiple needs a non-zero stop.
    std::optional<double> calculateStopLoss(TradeDirection direction, double entry_price) const;
    std::optional<double> calculateTakeProfit(TradeDirection direction,
                                              double entry_price,
                                              const std::optional<double>& stop_loss) const;

    // Ratchets the stop toward price after a bar that kept the position open.
    // Returns the current stop unchanged when trailing is disabled.
    std::optional<double> updateTrailingStop(TradeDirection direction,
                                             const std::optional<double>& current_stop,
                                             const Bar& bar) const;
    bool isTrailingEnabled() const;

    // ===== Drawdown guard =====
    void updateEquity(double equity);
    bool isDrawdownExceeded() const;
    double getPeakEquity() const { return peak_equity_; }
    double getCurrentDrawdownPct() const;

private:
    strategy::PositionSizing sizing_;
    strategy::RiskManagement risk_;
    double peak_equity_;
    double current_equity_;
};

} // namespace risk
} // namespace strategylab
