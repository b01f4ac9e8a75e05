#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace strategylab {
namespace analytics {

// Closed indicator set. The tail entries are accepted from strategy files
// but are not computed; they resolve to the bar close like UNKNOWN.
enum class IndicatorType {
    PRICE,
    SMA,
    EMA,
    RSI,
    MACD,
    BOLLINGER,
    STOCHASTIC,
    ATR,
    ADX,
    OBV,
    FIBONACCI,
    ICHIMOKU,
    PARABOLIC_SAR,
    UNKNOWN
};

struct IndicatorSpec {
    IndicatorType type = IndicatorType::PRICE;
    std::optional<double> parameter1;  // period / fast period
    std::optional<double> parameter2;  // slow period
    std::optional<double> parameter3;  // signal period (unused)
    std::string name;                  // name as written in the strategy file
};

IndicatorType parseIndicatorType(const std::string& name);
const char* indicatorTypeToString(IndicatorType type);

// Default periods applied when a parameter is missing or zero.
constexpr int DEFAULT_SMA_PERIOD = 14;
constexpr int DEFAULT_EMA_PERIOD = 14;
constexpr int DEFAULT_RSI_PERIOD = 14;
constexpr int DEFAULT_MACD_FAST = 12;
constexpr int DEFAULT_MACD_SLOW = 26;
constexpr int DEFAULT_BOLLINGER_PERIOD = 20;

// Causal indicator values over one symbol's bar history. Values at index i
// only read bars 0..i. Never throws: short histories fall back to documented
// defaults and unknown types resolve to close[i].
//
// EMA series are filled once per period in a forward pass and kept for the
// lifetime of the engine, so one engine should live as long as the symbol run.
class IndicatorEngine {
public:
    explicit IndicatorEngine(const std::vector<Bar>& history);

    double value(const IndicatorSpec& spec, size_t index);
    double value(IndicatorType type,
                 const std::optional<double>& p1,
                 const std::optional<double>& p2,
                 const std::optional<double>& p3,
                 size_t index);

    double price(size_t index) const;
    double sma(int period, size_t index) const;
    double ema(int period, size_t index);
    double rsi(int period, size_t index) const;
    double macd(int fast_period, int slow_period, size_t index);
    double bollingerMiddle(int period, size_t index) const;

    const std::vector<double>& emaSeries(int period);
    size_t size() const { return closes_.size(); }

    static std::vector<double> calculateEMAVector(const std::vector<double>& closes, int period);
    static int resolvePeriod(const std::optional<double>& parameter, int fallback);

private:
    size_t clampIndex(size_t index) const;

    std::vector<double> closes_;
    std::map<int, std::vector<double>> ema_cache_;
};

} // namespace analytics
} // namespace strategylab
