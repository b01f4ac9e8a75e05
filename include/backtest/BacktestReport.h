#pragma once

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

#include "backtest/BacktestEngine.h"

namespace strategylab {
namespace backtest {

// Serialised BacktestResult. Dates are ISO-8601 UTC strings.
nlohmann::json toJson(const Trade& trade);
nlohmann::json toJson(const BacktestResult& result);

void printSummary(std::ostream& os, const BacktestResult& result);

// Writes the result as indented JSON. Throws StrategyLabError if the file cannot be written.
void writeResultFile(const std::string& path, const BacktestResult& result);

} // namespace backtest
} // namespace strategylab
