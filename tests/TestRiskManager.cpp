#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace strategylab;
using strategylab::risk::RiskManager;
using strategylab::strategy::PositionSizing;
using strategylab::strategy::PositionSizingMode;
using strategylab::strategy::RiskManagement;
using strategylab::strategy::StopLossMode;
using strategylab::strategy::TakeProfitMode;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

PositionSizing sizing(PositionSizingMode mode, double value, std::optional<double> cap = std::nullopt) {
    PositionSizing s;
    s.mode = mode;
    s.value = value;
    s.max_position_size = cap;
    return s;
}

RiskManagement percentStops(double stop, double target) {
    RiskManagement r;
    r.stop_loss_mode = StopLossMode::PERCENTAGE;
    r.stop_loss_value = stop;
    r.take_profit_mode = TakeProfitMode::PERCENTAGE;
    r.take_profit_value = target;
    return r;
}
} // namespace

int main() {
    // Position sizing
    {
        const RiskManagement none;
        assert(near(RiskManager(sizing(PositionSizingMode::FIXED, 1000.0), none, 1e5).calculatePositionSize(50000.0), 1000.0));
        assert(near(RiskManager(sizing(PositionSizingMode::PERCENTAGE_OF_EQUITY, 10.0), none, 1e5).calculatePositionSize(50000.0), 5000.0));
        assert(near(RiskManager(sizing(PositionSizingMode::PERCENTAGE_OF_EQUITY, 10.0, 2000.0), none, 1e5).calculatePositionSize(50000.0), 2000.0));
        assert(near(RiskManager(sizing(PositionSizingMode::PERCENTAGE_OF_EQUITY, 10.0, 0.0), none, 1e5).calculatePositionSize(50000.0), 5000.0));
        assert(near(RiskManager(sizing(PositionSizingMode::VOLATILITY, 3.0), none, 1e5).calculatePositionSize(50000.0), 1000.0));
        assert(near(RiskManager(sizing(PositionSizingMode::KELLY, 0.5), none, 1e5).calculatePositionSize(80000.0), 1600.0));
        assert(RiskManager(sizing(PositionSizingMode::FIXED, 0.0), none, 1e5).calculatePositionSize(50000.0) <= 0.0);
    }

    // Stop and target levels
    {
        const auto fixed_size = sizing(PositionSizingMode::FIXED, 1000.0);
        RiskManager pct(fixed_size, percentStops(2.0, 6.0), 1e5);

        assert(near(*pct.calculateStopLoss(TradeDirection::LONG, 100.0), 98.0));
        assert(near(*pct.calculateStopLoss(TradeDirection::SHORT, 100.0), 102.0));
        assert(near(*pct.calculateTakeProfit(TradeDirection::LONG, 100.0, 98.0), 106.0));
        assert(near(*pct.calculateTakeProfit(TradeDirection::SHORT, 100.0, 102.0), 94.0));

        RiskManagement absolute;
        absolute.stop_loss_mode = StopLossMode::FIXED;
        absolute.stop_loss_value = 5.0;
        absolute.take_profit_mode = TakeProfitMode::FIXED;
        absolute.take_profit_value = 8.0;
        RiskManager abs_rm(fixed_size, absolute, 1e5);
        assert(near(*abs_rm.calculateStopLoss(TradeDirection::LONG, 100.0), 95.0));
        assert(near(*abs_rm.calculateTakeProfit(TradeDirection::SHORT, 100.0, 105.0), 92.0));

        RiskManagement multiple = percentStops(2.0, 2.0);
        multiple.take_profit_mode = TakeProfitMode::RISK_MULTIPLE;
        RiskManager rr(fixed_size, multiple, 1e5);
        assert(near(*rr.calculateTakeProfit(TradeDirection::LONG, 100.0, 98.0), 104.0));
        assert(near(*rr.calculateTakeProfit(TradeDirection::SHORT, 100.0, 102.0), 96.0));
        assert(!rr.calculateTakeProfit(TradeDirection::LONG, 100.0, std::nullopt));

        // Zero values still produce levels, both at the entry price
        RiskManager at_entry(fixed_size, percentStops(0.0, 0.0), 1e5);
        assert(near(*at_entry.calculateStopLoss(TradeDirection::LONG, 100.0), 100.0));
        assert(near(*at_entry.calculateStopLoss(TradeDirection::SHORT, 100.0), 100.0));
        assert(near(*at_entry.calculateTakeProfit(TradeDirection::LONG, 100.0, 100.0), 100.0));

        RiskManagement fixed_zero;
        fixed_zero.stop_loss_mode = StopLossMode::FIXED;
        fixed_zero.take_profit_mode = TakeProfitMode::RISK_MULTIPLE;
        fixed_zero.take_profit_value = 2.0;
        RiskManager zero_rr(fixed_size, fixed_zero, 1e5);
        assert(near(*zero_rr.calculateStopLoss(TradeDirection::LONG, 50.0), 50.0));
        assert(near(*zero_rr.calculateTakeProfit(TradeDirection::LONG, 50.0, 50.0), 50.0));
        assert(!zero_rr.calculateTakeProfit(TradeDirection::LONG, 50.0, 0.0));
    }

    // Trailing stop ratchets toward price, never away
    {
        RiskManagement trailing = percentStops(2.0, 0.0);
        trailing.trailing_stop = true;
        trailing.trailing_stop_value = 5.0;
        RiskManager rm(sizing(PositionSizingMode::FIXED, 1000.0), trailing, 1e5);
        assert(rm.isTrailingEnabled());

        const Bar up(100.0, 110.0, 99.0, 108.0, 1.0, 0);
        const Bar dip(108.0, 100.0, 96.0, 97.0, 1.0, 0);
        auto stop = rm.updateTrailingStop(TradeDirection::LONG, 90.0, up);
        assert(near(*stop, 104.5));
        stop = rm.updateTrailingStop(TradeDirection::LONG, stop, dip);
        assert(near(*stop, 104.5));
        assert(near(*rm.updateTrailingStop(TradeDirection::LONG, std::nullopt, dip), 95.0));

        const Bar drop(100.0, 101.0, 90.0, 91.0, 1.0, 0);
        assert(near(*rm.updateTrailingStop(TradeDirection::SHORT, 110.0, drop), 94.5));
        assert(near(*rm.updateTrailingStop(TradeDirection::SHORT, 93.0, drop), 93.0));

        RiskManagement flag_only = trailing;
        flag_only.trailing_stop_value = std::nullopt;
        RiskManager off(sizing(PositionSizingMode::FIXED, 1000.0), flag_only, 1e5);
        assert(!off.isTrailingEnabled());
        assert(near(*off.updateTrailingStop(TradeDirection::LONG, 90.0, up), 90.0));
    }

    // Drawdown guard
    {
        RiskManagement guarded = percentStops(2.0, 6.0);
        guarded.max_drawdown = 10.0;
        RiskManager rm(sizing(PositionSizingMode::FIXED, 1000.0), guarded, 100000.0);

        assert(!rm.isDrawdownExceeded());
        rm.updateEquity(110000.0);
        assert(near(rm.getPeakEquity(), 110000.0));
        rm.updateEquity(99001.0);
        assert(!rm.isDrawdownExceeded());
        rm.updateEquity(99000.0);
        assert(near(rm.getCurrentDrawdownPct(), 10.0));
        assert(rm.isDrawdownExceeded());
        rm.updateEquity(120000.0);
        assert(!rm.isDrawdownExceeded());

        guarded.max_drawdown = 0.0;
        RiskManager disabled(sizing(PositionSizingMode::FIXED, 1000.0), guarded, 100000.0);
        disabled.updateEquity(10.0);
        assert(!disabled.isDrawdownExceeded());
    }

    std::cout << "[TEST] RiskManager PASSED\n";
    return 0;
}
