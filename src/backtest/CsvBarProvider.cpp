#include "backtest/CsvBarProvider.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <utility>

namespace strategylab {
namespace backtest {

CsvBarProvider::CsvBarProvider(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::vector<Bar> CsvBarProvider::fetchBars(const std::string& symbol,
                                           TimestampMs start_ms,
                                           TimestampMs end_ms,
                                           Timeframe timeframe) {
    const auto csv_path = data_dir_ / (symbol + ".csv");
    const auto json_path = data_dir_ / (symbol + ".json");

    std::vector<Bar> raw;
    std::error_code ec;
    if (std::filesystem::exists(csv_path, ec)) {
        raw = DataHistory::loadCSV(csv_path.string());
    } else if (std::filesystem::exists(json_path, ec)) {
        raw = DataHistory::loadJSON(json_path.string());
    } else {
        throw DataSourceError("no bar file for " + symbol + " in " + data_dir_.string());
    }

    auto bars = DataHistory::normalize(DataHistory::filterByDate(raw, start_ms, end_ms));
    LOG_DEBUG("[{}] {} bars in range ({} in file, timeframe {})",
              symbol, bars.size(), raw.size(), timeframeToString(timeframe));
    return bars;
}

} // namespace backtest
} // namespace strategylab
