#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace strategylab {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file
    // Expected format: timestamp,open,high,low,close,volume
    // timestamp is epoch ms, epoch seconds, or YYYY-MM-DD[THH:MM:SS]
    // Malformed rows are skipped; an unreadable file throws DataSourceError.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Load bars from a JSON array of objects (long or short keys: open/o, high/h, ...)
    // Throws DataSourceError if the file cannot be read or is not a valid bar array.
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Keep bars with start_ms <= timestamp <= end_ms
    static std::vector<Bar> filterByDate(const std::vector<Bar>& bars,
                                         TimestampMs start_ms,
                                         TimestampMs end_ms);

    // Sort ascending, drop duplicate timestamps and weekend bars.
    static std::vector<Bar> normalize(std::vector<Bar> bars);
};

} // namespace backtest
} // namespace strategylab
