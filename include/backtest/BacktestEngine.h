#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "analytics/PerformanceAnalyzer.h"
#include "backtest/IBarProvider.h"
#include "common/Types.h"
#include "strategy/Strategy.h"

namespace strategylab {
namespace backtest {

struct BacktestParameters {
    strategy::Strategy strategy;
    TimestampMs start_ms = 0;
    TimestampMs end_ms = 0;
    double initial_capital = 100000.0;
    double slippage_percent = 0.1;    // percentage points
    double commission_percent = 0.05; // percentage points

    // Range and costs from Config: end = now, start = end - lookback_days.
    static BacktestParameters fromConfig(const strategy::Strategy& strategy);
};

struct BacktestResult {
    strategy::Strategy strategy;
    TimestampMs start_ms = 0;
    TimestampMs end_ms = 0;
    double initial_capital = 0.0;
    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    analytics::PerformanceSummary summary;
};

// Runs one strategy over every symbol in order against a bar provider.
// Equity is a single running balance shared across symbols; each symbol's
// trades are applied to it in the order the symbols are listed.
class BacktestEngine {
public:
    explicit BacktestEngine(std::shared_ptr<IBarProvider> provider);

    // Checked at every symbol and bar boundary. Not owned.
    void setCancellationFlag(const std::atomic<bool>* flag) { cancel_flag_ = flag; }

    BacktestResult run(const BacktestParameters& params);

    // Throws StrategyValidationError for a malformed strategy or run parameters.
    static void validateParameters(const BacktestParameters& params);

private:
    void checkCancelled(const char* where) const;

    std::shared_ptr<IBarProvider> provider_;
    const std::atomic<bool>* cancel_flag_ = nullptr;
};

} // namespace backtest
} // namespace strategylab
