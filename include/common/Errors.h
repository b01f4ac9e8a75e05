#pragma once

#include <stdexcept>
#include <string>

namespace strategylab {

class StrategyLabError : public std::runtime_error {
public:
    explicit StrategyLabError(const std::string& msg) : std::runtime_error(msg) {}
};

// Strategy or run parameters failed shape validation.
class StrategyValidationError : public StrategyLabError {
public:
    explicit StrategyValidationError(const std::string& msg)
        : StrategyLabError("Invalid strategy: " + msg) {}
};

// Bar provider could not supply history. Propagated to the caller, never retried.
class DataSourceError : public StrategyLabError {
public:
    explicit DataSourceError(const std::string& msg)
        : StrategyLabError("Data source error: " + msg) {}
};

class BacktestCancelledError : public StrategyLabError {
public:
    explicit BacktestCancelledError(const std::string& msg)
        : StrategyLabError("Backtest cancelled: " + msg) {}
};

} // namespace strategylab
