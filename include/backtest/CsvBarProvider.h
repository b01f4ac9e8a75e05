#pragma once

#include <filesystem>
#include <string>

#include "backtest/IBarProvider.h"

namespace strategylab {
namespace backtest {

// Reads <data_dir>/<SYMBOL>.csv, falling back to <SYMBOL>.json.
// The timeframe is taken as-is from the file; no resampling is done.
class CsvBarProvider : public IBarProvider {
public:
    explicit CsvBarProvider(std::filesystem::path data_dir);

    std::vector<Bar> fetchBars(
        const std::string& symbol,
        TimestampMs start_ms,
        TimestampMs end_ms,
        Timeframe timeframe
    ) override;

    const std::filesystem::path& dataDir() const { return data_dir_; }

private:
    std::filesystem::path data_dir_;
};

} // namespace backtest
} // namespace strategylab
