#include "backtest/BacktestEngine.h"

#include <cmath>
#include <utility>

#include "analytics/IndicatorEngine.h"
#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "execution/PositionStateMachine.h"
#include "risk/RiskManager.h"
#include "strategy/ConditionEvaluator.h"

namespace strategylab {
namespace backtest {

BacktestParameters BacktestParameters::fromConfig(const strategy::Strategy& strategy) {
    const auto& config = Config::getInstance();

    BacktestParameters params;
    params.strategy = strategy;
    params.end_ms = utils::DateUtils::nowMs();
    params.start_ms = params.end_ms - static_cast<TimestampMs>(config.getLookbackDays()) * utils::MS_PER_DAY;
    params.initial_capital = config.getInitialCapital();
    params.slippage_percent = config.getSlippagePercent();
    params.commission_percent = config.getCommissionPercent();
    return params;
}

BacktestEngine::BacktestEngine(std::shared_ptr<IBarProvider> provider)
    : provider_(std::move(provider))
{}

void BacktestEngine::validateParameters(const BacktestParameters& params) {
    strategy::validateStrategy(params.strategy);

    if (!(params.initial_capital > 0.0) || !std::isfinite(params.initial_capital)) {
        throw StrategyValidationError("initialCapital must be positive");
    }
    if (!(params.slippage_percent >= 0.0) || !std::isfinite(params.slippage_percent)) {
        throw StrategyValidationError("slippagePercent must be non-negative");
    }
    if (!(params.commission_percent >= 0.0) || !std::isfinite(params.commission_percent)) {
        throw StrategyValidationError("commissionPercent must be non-negative");
    }
    if (params.end_ms < params.start_ms) {
        throw StrategyValidationError("endDate is before startDate");
    }
}

void BacktestEngine::checkCancelled(const char* where) const {
    if (cancel_flag_ && cancel_flag_->load()) {
        throw BacktestCancelledError(std::string("stopped at ") + where);
    }
}

BacktestResult BacktestEngine::run(const BacktestParameters& params) {
    validateParameters(params);
    if (!provider_) {
        throw DataSourceError("no bar provider configured");
    }

    const auto& strat = params.strategy;
    LOG_INFO("Backtest start: strategy='{}' symbols={} range={}..{} capital={:.2f}",
             strat.name, strat.symbols.size(),
             utils::DateUtils::toDateString(params.start_ms),
             utils::DateUtils::toDateString(params.end_ms),
             params.initial_capital);

    BacktestResult result;
    result.strategy = strat;
    result.start_ms = params.start_ms;
    result.end_ms = params.end_ms;
    result.initial_capital = params.initial_capital;
    result.equity_curve.push_back(EquityPoint{params.start_ms, params.initial_capital});

    const execution::ExecutionCosts costs{params.slippage_percent / 100.0,
                                          params.commission_percent / 100.0};
    risk::RiskManager risk_manager(strat.position_sizing, strat.risk_management, params.initial_capital);
    double equity = params.initial_capital;

    auto record = [&](const Trade& trade) {
        equity += trade.pnl;
        result.equity_curve.push_back(EquityPoint{trade.exit_time, equity});
        result.trades.push_back(trade);
        risk_manager.updateEquity(equity);
        Logger::getInstance().logTrade(trade);
    };

    for (const auto& symbol : strat.symbols) {
        checkCancelled("symbol boundary");

        const std::vector<Bar> bars = provider_->fetchBars(symbol, params.start_ms, params.end_ms, strat.timeframe);
        LOG_INFO("[{}] {} bars ({})", symbol, bars.size(), timeframeToString(strat.timeframe));
        if (bars.empty()) {
            continue;
        }

        analytics::IndicatorEngine indicators(bars);
        strategy::ConditionEvaluator evaluator(indicators);
        execution::PositionStateMachine machine(symbol, strat, risk_manager, costs);

        const size_t trades_before = result.trades.size();
        for (size_t i = 1; i < bars.size(); ++i) {
            checkCancelled("bar boundary");
            const bool entries_allowed = !risk_manager.isDrawdownExceeded();
            auto trade = machine.onBar(bars, i, evaluator, equity, entries_allowed);
            if (trade) {
                record(*trade);
            }
        }
        if (auto trade = machine.closeAtHorizon(bars.back())) {
            record(*trade);
        }

        LOG_INFO("[{}] {} trades, equity {:.2f}", symbol, result.trades.size() - trades_before, equity);
    }

    result.summary = analytics::PerformanceAnalyzer::analyze(
        result.trades, result.equity_curve, params.initial_capital, params.start_ms, params.end_ms);

    LOG_INFO("Backtest done: {} trades, final equity {:.2f} ({:+.2f}%)",
             result.summary.total_trades, result.summary.final_equity,
             result.summary.net_profit_percent);
    return result;
}

} // namespace backtest
} // namespace strategylab
