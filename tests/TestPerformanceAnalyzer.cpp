#include "analytics/PerformanceAnalyzer.h"
#include "common/DateUtils.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace strategylab;
using strategylab::analytics::PerformanceAnalyzer;
using strategylab::analytics::PerformanceSummary;
using strategylab::utils::DateUtils;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

TimestampMs date(const char* text) {
    return *DateUtils::parse(text);
}

Trade closedTrade(double pnl, double size, TimestampMs exit_time) {
    Trade t;
    t.symbol = "TEST";
    t.size = size;
    t.pnl = pnl;
    t.pnl_percent = pnl / size * 100.0;
    t.entry_time = exit_time - 86400000LL;
    t.exit_time = exit_time;
    return t;
}

bool allFinite(const PerformanceSummary& s) {
    for (double v : {s.win_rate, s.average_win, s.average_loss, s.profit_factor, s.final_equity,
                     s.net_profit, s.net_profit_percent, s.max_drawdown, s.max_drawdown_percent,
                     s.sharpe_ratio, s.annualized_return}) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    for (const auto& m : s.monthly) {
        if (!std::isfinite(m.profit) || !std::isfinite(m.profit_percent)) {
            return false;
        }
    }
    return true;
}
} // namespace

int main() {
    const TimestampMs start = date("2024-01-01");
    const TimestampMs end = date("2024-12-31");

    // Zero trades: every statistic is a finite zero
    {
        const std::vector<EquityPoint> curve{{start, 100000.0}};
        const auto s = PerformanceAnalyzer::analyze({}, curve, 100000.0, start, end);
        assert(allFinite(s));
        assert(s.total_trades == 0 && s.winning_trades == 0 && s.losing_trades == 0);
        assert(s.win_rate == 0.0 && s.average_win == 0.0 && s.average_loss == 0.0);
        assert(s.profit_factor == 0.0);
        assert(s.final_equity == 100000.0 && s.net_profit == 0.0);
        assert(s.max_drawdown == 0.0 && s.max_drawdown_percent == 0.0);
        assert(s.sharpe_ratio == 0.0);
        assert(s.annualized_return == 0.0);
        assert(s.monthly.size() == 1 && s.monthly[0].profit == 0.0);

        const auto empty = PerformanceAnalyzer::analyze({}, {}, 0.0, start, start);
        assert(allFinite(empty));
    }

    // Mixed outcomes across two months
    {
        const std::vector<Trade> trades{
            closedTrade(200.0, 10000.0, date("2024-01-10")),
            closedTrade(-100.0, 10000.0, date("2024-02-05")),
            closedTrade(300.0, 10000.0, date("2024-02-20")),
        };
        const std::vector<EquityPoint> curve{
            {start, 100000.0},
            {date("2024-01-10"), 100200.0},
            {date("2024-02-05"), 100100.0},
            {date("2024-02-20"), 100400.0},
        };
        const auto s = PerformanceAnalyzer::analyze(trades, curve, 100000.0, start, end);
        assert(allFinite(s));

        assert(s.total_trades == 3 && s.winning_trades == 2 && s.losing_trades == 1);
        assert(near(s.win_rate, 2.0 / 3.0));
        assert(near(s.average_win, 2.5));
        assert(near(s.average_loss, 1.0));
        assert(near(s.profit_factor, 5.0));  // (2/3 * 2.5) / (1/3 * 1)
        assert(near(s.final_equity, 100400.0));
        assert(near(s.net_profit, 400.0));
        assert(near(s.net_profit_percent, 0.4));
        assert(near(s.max_drawdown, 100.0));
        assert(near(s.max_drawdown_percent, 100.0 / 100200.0 * 100.0));
        assert(s.sharpe_ratio > 0.0);

        const double days = static_cast<double>(end - start) / 86400000.0;
        assert(near(s.annualized_return, std::pow(1.004, 365.0 / days) - 1.0));

        assert(s.monthly.size() == 2);
        assert(s.monthly[0].month == "2024-1");
        assert(near(s.monthly[0].profit, 200.0));
        assert(near(s.monthly[0].profit_percent, 0.2));
        assert(s.monthly[1].month == "2024-2");
        assert(near(s.monthly[1].profit, 200.0));
        assert(near(s.monthly[1].profit_percent, 200.0 / 100200.0 * 100.0));
    }

    // Sharpe over consecutive equity points, population deviation
    {
        const std::vector<EquityPoint> curve{{0, 100.0}, {1, 110.0}, {2, 99.0}, {3, 108.9}};
        const double r1 = 0.1, r2 = -0.1, r3 = 0.1;
        const double mean = (r1 + r2 + r3) / 3.0;
        const double var = ((r1 - mean) * (r1 - mean) + (r2 - mean) * (r2 - mean) + (r3 - mean) * (r3 - mean)) / 3.0;
        const double expected = mean / std::sqrt(var) * std::sqrt(252.0 / 3.0);
        assert(near(PerformanceAnalyzer::calculateSharpeRatio(curve), expected, 1e-6));

        const std::vector<EquityPoint> flat{{0, 100.0}, {1, 100.0}, {2, 100.0}};
        assert(PerformanceAnalyzer::calculateSharpeRatio(flat) == 0.0);
    }

    // Guards
    {
        assert(PerformanceAnalyzer::calculateProfitFactor(1.0, 3.0, 0.0) == 0.0);
        assert(PerformanceAnalyzer::calculateProfitFactor(0.0, 0.0, 2.0) == 0.0);

        assert(near(PerformanceAnalyzer::calculateAnnualizedReturn(110000.0, 100000.0, 365.0), 0.1));
        assert(PerformanceAnalyzer::calculateAnnualizedReturn(110000.0, 100000.0, 0.0) == 0.0);
        assert(PerformanceAnalyzer::calculateAnnualizedReturn(-5.0, 100000.0, 30.0) == -1.0);
        assert(PerformanceAnalyzer::calculateAnnualizedReturn(5.0, 0.0, 30.0) == 0.0);

        const std::vector<EquityPoint> losing{{0, 100000.0}, {1, 90000.0}, {2, 95000.0}};
        const auto dd = PerformanceAnalyzer::calculateMaxDrawdown(losing, 100000.0);
        assert(near(dd.max_drawdown, 10000.0));
        assert(near(dd.max_drawdown_percent, 10.0));

        const std::vector<EquityPoint> wiped{{0, 0.0}};
        const auto none = PerformanceAnalyzer::calculateMaxDrawdown(wiped, 0.0);
        assert(none.max_drawdown_percent == 0.0);
    }

    std::cout << "[TEST] PerformanceAnalyzer PASSED\n";
    return 0;
}
