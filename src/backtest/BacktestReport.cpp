#include "backtest/BacktestReport.h"

#include <fstream>
#include <iomanip>

#include "common/DateUtils.h"
#include "common/Errors.h"
#include "strategy/StrategyJson.h"

namespace strategylab {
namespace backtest {

using utils::DateUtils;

nlohmann::json toJson(const Trade& trade) {
    nlohmann::json j = {
        {"symbol", trade.symbol},
        {"direction", tradeDirectionToString(trade.direction)},
        {"entryDate", DateUtils::toIsoString(trade.entry_time)},
        {"entryPrice", trade.entry_price},
        {"exitDate", DateUtils::toIsoString(trade.exit_time)},
        {"exitPrice", trade.exit_price},
        {"size", trade.size},
        {"pnl", trade.pnl},
        {"pnlPercent", trade.pnl_percent},
        {"exitReason", exitReasonToString(trade.exit_reason)}
    };
    if (trade.stop_price) j["stopPrice"] = *trade.stop_price;
    if (trade.target_price) j["targetPrice"] = *trade.target_price;
    return j;
}

nlohmann::json toJson(const BacktestResult& result) {
    const auto& s = result.summary;

    nlohmann::json j;
    j["strategy"] = strategy::toJson(result.strategy);
    j["startDate"] = DateUtils::toIsoString(result.start_ms);
    j["endDate"] = DateUtils::toIsoString(result.end_ms);
    j["initialCapital"] = result.initial_capital;

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        j["trades"].push_back(toJson(trade));
    }

    j["totalTrades"] = s.total_trades;
    j["winningTrades"] = s.winning_trades;
    j["losingTrades"] = s.losing_trades;
    j["winRate"] = s.win_rate;
    j["averageWin"] = s.average_win;
    j["averageLoss"] = s.average_loss;
    j["profitFactor"] = s.profit_factor;
    j["finalEquity"] = s.final_equity;
    j["netProfit"] = s.net_profit;
    j["netProfitPercent"] = s.net_profit_percent;
    j["maxDrawdown"] = s.max_drawdown;
    j["maxDrawdownPercent"] = s.max_drawdown_percent;
    j["sharpeRatio"] = s.sharpe_ratio;
    j["annualizedReturn"] = s.annualized_return;

    j["equityCurve"] = nlohmann::json::array();
    for (const auto& point : result.equity_curve) {
        j["equityCurve"].push_back({
            {"date", DateUtils::toIsoString(point.timestamp)},
            {"equity", point.equity}
        });
    }

    j["monthly"] = nlohmann::json::array();
    for (const auto& m : s.monthly) {
        j["monthly"].push_back({
            {"month", m.month},
            {"profit", m.profit},
            {"profitPercent", m.profit_percent}
        });
    }
    return j;
}

void printSummary(std::ostream& os, const BacktestResult& result) {
    const auto& s = result.summary;
    const auto flags = os.flags();
    const auto precision = os.precision();

    os << "\nBacktest result: " << (result.strategy.name.empty() ? "(unnamed)" : result.strategy.name) << "\n";
    os << "---------------------------------------------\n";
    os << "Period:          " << DateUtils::toDateString(result.start_ms)
       << " .. " << DateUtils::toDateString(result.end_ms) << "\n";
    os << std::fixed << std::setprecision(2);
    os << "Initial capital: " << result.initial_capital << "\n";
    os << "Final equity:    " << s.final_equity << "\n";
    os << "Net profit:      " << s.net_profit << " (" << s.net_profit_percent << "%)\n";
    os << "Max drawdown:    " << s.max_drawdown << " (" << s.max_drawdown_percent << "%)\n";
    os << "Trades:          " << s.total_trades
       << " (win " << s.winning_trades << " / loss " << s.losing_trades << ")\n";
    os << "Win rate:        " << (s.win_rate * 100.0) << "%\n";
    os << "Average win:     " << s.average_win << "%\n";
    os << "Average loss:    " << s.average_loss << "%\n";
    os << std::setprecision(3);
    os << "Profit factor:   " << s.profit_factor << "\n";
    os << "Sharpe ratio:    " << s.sharpe_ratio << "\n";
    os << std::setprecision(2);
    os << "Annualized:      " << (s.annualized_return * 100.0) << "%\n";

    if (!s.monthly.empty()) {
        os << "Monthly:\n";
        for (const auto& m : s.monthly) {
            os << "  - " << std::left << std::setw(8) << m.month << std::right
               << " pnl=" << m.profit << " (" << m.profit_percent << "%)\n";
        }
    }
    os << "---------------------------------------------\n";

    os.flags(flags);
    os.precision(precision);
}

void writeResultFile(const std::string& path, const BacktestResult& result) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StrategyLabError("cannot write result file: " + path);
    }
    out << toJson(result).dump(2) << "\n";
    if (!out) {
        throw StrategyLabError("failed writing result file: " + path);
    }
}

} // namespace backtest
} // namespace strategylab
