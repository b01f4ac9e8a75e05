#include "backtest/SyntheticBarProvider.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace strategylab {
namespace backtest {

namespace {
// Uniform [0, 1) from the top 53 bits; identical on every standard library.
double nextUniform(std::mt19937_64& rng) {
    return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}
} // namespace

std::uint32_t SyntheticBarProvider::symbolSeed(const std::string& symbol) {
    std::uint32_t seed = 0;
    for (unsigned char c : symbol) {
        seed += c;
    }
    return seed;
}

std::vector<Bar> SyntheticBarProvider::fetchBars(const std::string& symbol,
                                                 TimestampMs start_ms,
                                                 TimestampMs end_ms,
                                                 Timeframe timeframe) {
    std::vector<Bar> bars;
    if (end_ms < start_ms) {
        return bars;
    }

    const std::uint32_t seed = symbolSeed(symbol);
    std::mt19937_64 rng(seed);

    double price = 100.0 + static_cast<double>(seed % 900);
    const double volatility = 2.0 + static_cast<double>(seed % 5);
    const TimestampMs step_ms = std::max<TimestampMs>(
        1, static_cast<TimestampMs>(std::llround(timeframeToDays(timeframe) * utils::MS_PER_DAY)));

    for (TimestampMs current = start_ms; current <= end_ms; current += step_ms) {
        if (utils::DateUtils::isWeekend(current)) {
            continue;
        }

        const double change_pct = (nextUniform(rng) - 0.5) * volatility / 100.0;
        const double open = price;
        const double range = price * (0.01 + nextUniform(rng) * 0.02);  // 1-3% range
        const double close = price * (1.0 + change_pct);
        const double high = std::max(open, close) + nextUniform(rng) * range;
        const double low = std::min(open, close) - nextUniform(rng) * range;
        const double volume = std::floor(50000.0 + nextUniform(rng) * 1000000.0);

        bars.emplace_back(open, high, low, close, volume, current);
        price = close;
    }

    LOG_DEBUG("[{}] generated {} synthetic {} bars", symbol, bars.size(), timeframeToString(timeframe));
    return bars;
}

} // namespace backtest
} // namespace strategylab
