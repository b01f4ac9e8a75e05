#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace strategylab {
namespace analytics {

struct MonthlyPerformance {
    std::string month;  // "YYYY-M" of the exit date
    double profit = 0.0;
    double profit_percent = 0.0;
};

struct DrawdownStats {
    double max_drawdown = 0.0;
    double max_drawdown_percent = 0.0;
};

struct PerformanceSummary {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double average_win = 0.0;   // mean pnl percent of winners
    double average_loss = 0.0;  // mean |pnl percent| of losers
    double profit_factor = 0.0;
    double final_equity = 0.0;
    double net_profit = 0.0;
    double net_profit_percent = 0.0;
    double max_drawdown = 0.0;
    double max_drawdown_percent = 0.0;
    double sharpe_ratio = 0.0;
    double annualized_return = 0.0;
    std::vector<MonthlyPerformance> monthly;
};

// Reduces a run's trades and equity curve to summary statistics.
// Every ratio is guarded: an empty or flat input yields 0, never NaN.
class PerformanceAnalyzer {
public:
    static PerformanceSummary analyze(const std::vector<Trade>& trades,
                                      const std::vector<EquityPoint>& equity_curve,
                                      double initial_capital,
                                      TimestampMs start_ms,
                                      TimestampMs end_ms);

    // winRate * averageWin / ((1 - winRate) * averageLoss); 0 without losses.
    static double calculateProfitFactor(double win_rate, double average_win, double average_loss);

    // Running peak starts at initial_capital. The percent is taken against
    // the peak in force when the maximum drawdown was reached.
    static DrawdownStats calculateMaxDrawdown(const std::vector<EquityPoint>& equity_curve,
                                              double initial_capital);

    // mean / stdDev * sqrt(252 / n) over step returns of the equity curve.
    static double calculateSharpeRatio(const std::vector<EquityPoint>& equity_curve);

    static double calculateAnnualizedReturn(double final_equity, double initial_capital, double total_days);

    static std::vector<MonthlyPerformance> buildMonthlyBreakdown(const std::vector<Trade>& trades,
                                                                 const std::vector<EquityPoint>& equity_curve,
                                                                 double initial_capital);
};

} // namespace analytics
} // namespace strategylab
