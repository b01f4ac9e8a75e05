#pragma once

#include <cstdint>
#include <string>

#include "backtest/IBarProvider.h"

namespace strategylab {
namespace backtest {

// Deterministic synthetic OHLCV. The same (symbol, range, timeframe) request
// always yields the same bars: the random stream is seeded from the symbol.
class SyntheticBarProvider : public IBarProvider {
public:
    std::vector<Bar> fetchBars(
        const std::string& symbol,
        TimestampMs start_ms,
        TimestampMs end_ms,
        Timeframe timeframe
    ) override;

    // Sum of the symbol's character codes.
    static std::uint32_t symbolSeed(const std::string& symbol);
};

} // namespace backtest
} // namespace strategylab
