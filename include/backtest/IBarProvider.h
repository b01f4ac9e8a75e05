#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace strategylab {
namespace backtest {

// Market-data collaborator. Returns bars in ascending timestamp order within
// [start_ms, end_ms], weekends excluded. Failures are reported by throwing
// DataSourceError; the engine does not retry.
class IBarProvider {
public:
    virtual ~IBarProvider() = default;

    virtual std::vector<Bar> fetchBars(
        const std::string& symbol,
        TimestampMs start_ms,
        TimestampMs end_ms,
        Timeframe timeframe
    ) = 0;
};

} // namespace backtest
} // namespace strategylab
