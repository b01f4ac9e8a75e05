#include "analytics/PerformanceAnalyzer.h"
#include "common/DateUtils.h"

#include <cmath>
#include <map>

namespace strategylab {
namespace analytics {

namespace {
constexpr double TRADING_DAYS_PER_YEAR = 252.0;
constexpr double CALENDAR_DAYS_PER_YEAR = 365.0;

struct MonthAccumulator {
    double profit = 0.0;
    double start_equity = 0.0;
};
} // namespace

double PerformanceAnalyzer::calculateProfitFactor(double win_rate, double average_win, double average_loss) {
    if (average_loss <= 0.0) {
        return 0.0;
    }
    const double denominator = (1.0 - win_rate) * average_loss;
    return (denominator > 0.0) ? (win_rate * average_win) / denominator : 0.0;
}

DrawdownStats PerformanceAnalyzer::calculateMaxDrawdown(const std::vector<EquityPoint>& equity_curve,
                                                        double initial_capital) {
    DrawdownStats stats;
    double peak = initial_capital;
    double peak_at_max = initial_capital;

    for (const auto& point : equity_curve) {
        if (point.equity > peak) {
            peak = point.equity;
        }
        const double drawdown = peak - point.equity;
        if (drawdown > stats.max_drawdown) {
            stats.max_drawdown = drawdown;
            peak_at_max = peak;
        }
    }

    stats.max_drawdown_percent = (stats.max_drawdown > 0.0 && peak_at_max > 0.0)
        ? (stats.max_drawdown / peak_at_max) * 100.0
        : 0.0;
    return stats;
}

double PerformanceAnalyzer::calculateSharpeRatio(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    returns.reserve(equity_curve.size());
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double previous = equity_curve[i - 1].equity;
        if (previous == 0.0) {
            returns.push_back(0.0);
            continue;
        }
        returns.push_back(equity_curve[i].equity / previous - 1.0);
    }
    if (returns.empty()) {
        return 0.0;
    }

    const double n = static_cast<double>(returns.size());
    double sum = 0.0;
    for (double r : returns) {
        sum += r;
    }
    const double mean = sum / n;

    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }
    const double std_dev = std::sqrt(sq_sum / n);
    if (!(std_dev > 0.0)) {
        return 0.0;
    }
    return (mean / std_dev) * std::sqrt(TRADING_DAYS_PER_YEAR / n);
}

double PerformanceAnalyzer::calculateAnnualizedReturn(double final_equity, double initial_capital, double total_days) {
    if (initial_capital <= 0.0 || total_days <= 0.0) {
        return 0.0;
    }
    const double growth = final_equity / initial_capital;
    if (growth <= 0.0) {
        return -1.0;
    }
    return std::pow(growth, CALENDAR_DAYS_PER_YEAR / total_days) - 1.0;
}

std::vector<MonthlyPerformance> PerformanceAnalyzer::buildMonthlyBreakdown(
    const std::vector<Trade>& trades,
    const std::vector<EquityPoint>& equity_curve,
    double initial_capital) {
    // Months in order of first appearance on the equity curve; the start
    // equity of a month is the curve value just before its first point.
    std::vector<std::string> order;
    std::map<std::string, MonthAccumulator> months;
    for (size_t i = 0; i < equity_curve.size(); ++i) {
        const std::string key = utils::DateUtils::toMonthKey(equity_curve[i].timestamp);
        if (months.count(key) > 0) {
            continue;
        }
        MonthAccumulator acc;
        acc.start_equity = (i > 0) ? equity_curve[i - 1].equity : initial_capital;
        months.emplace(key, acc);
        order.push_back(key);
    }

    for (const auto& trade : trades) {
        auto it = months.find(utils::DateUtils::toMonthKey(trade.exit_time));
        if (it != months.end()) {
            it->second.profit += trade.pnl;
        }
    }

    std::vector<MonthlyPerformance> out;
    out.reserve(order.size());
    for (const auto& key : order) {
        const auto& acc = months.at(key);
        MonthlyPerformance m;
        m.month = key;
        m.profit = acc.profit;
        m.profit_percent = (acc.start_equity != 0.0) ? (acc.profit / acc.start_equity) * 100.0 : 0.0;
        out.push_back(m);
    }
    return out;
}

PerformanceSummary PerformanceAnalyzer::analyze(const std::vector<Trade>& trades,
                                                const std::vector<EquityPoint>& equity_curve,
                                                double initial_capital,
                                                TimestampMs start_ms,
                                                TimestampMs end_ms) {
    PerformanceSummary s;
    s.total_trades = static_cast<int>(trades.size());

    double win_pct_sum = 0.0;
    double loss_pct_sum = 0.0;
    for (const auto& trade : trades) {
        if (trade.pnl > 0.0) {
            s.winning_trades++;
            win_pct_sum += trade.pnl_percent;
        } else {
            s.losing_trades++;
            loss_pct_sum += trade.pnl_percent;
        }
    }

    s.win_rate = (s.total_trades > 0)
        ? static_cast<double>(s.winning_trades) / static_cast<double>(s.total_trades)
        : 0.0;
    s.average_win = (s.winning_trades > 0) ? win_pct_sum / s.winning_trades : 0.0;
    s.average_loss = (s.losing_trades > 0) ? std::abs(loss_pct_sum / s.losing_trades) : 0.0;
    s.profit_factor = calculateProfitFactor(s.win_rate, s.average_win, s.average_loss);

    s.final_equity = equity_curve.empty() ? initial_capital : equity_curve.back().equity;
    s.net_profit = s.final_equity - initial_capital;
    s.net_profit_percent = (initial_capital != 0.0) ? (s.net_profit / initial_capital) * 100.0 : 0.0;

    const DrawdownStats dd = calculateMaxDrawdown(equity_curve, initial_capital);
    s.max_drawdown = dd.max_drawdown;
    s.max_drawdown_percent = dd.max_drawdown_percent;

    s.sharpe_ratio = calculateSharpeRatio(equity_curve);

    const double total_days = static_cast<double>(end_ms - start_ms) / static_cast<double>(utils::MS_PER_DAY);
    s.annualized_return = calculateAnnualizedReturn(s.final_equity, initial_capital, total_days);

    s.monthly = buildMonthlyBreakdown(trades, equity_curve, initial_capital);
    return s;
}

} // namespace analytics
} // namespace strategylab
