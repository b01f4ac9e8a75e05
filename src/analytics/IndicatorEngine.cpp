#include "analytics/IndicatorEngine.h"

#include <limits>

namespace strategylab {
namespace analytics {

IndicatorType parseIndicatorType(const std::string& name) {
    if (name == "price") return IndicatorType::PRICE;
    if (name == "sma") return IndicatorType::SMA;
    if (name == "ema") return IndicatorType::EMA;
    if (name == "rsi") return IndicatorType::RSI;
    if (name == "macd") return IndicatorType::MACD;
    if (name == "bollinger") return IndicatorType::BOLLINGER;
    if (name == "stochastic") return IndicatorType::STOCHASTIC;
    if (name == "atr") return IndicatorType::ATR;
    if (name == "adx") return IndicatorType::ADX;
    if (name == "obv") return IndicatorType::OBV;
    if (name == "fibonacci") return IndicatorType::FIBONACCI;
    if (name == "ichimoku") return IndicatorType::ICHIMOKU;
    if (name == "parabolic_sar") return IndicatorType::PARABOLIC_SAR;
    return IndicatorType::UNKNOWN;
}

const char* indicatorTypeToString(IndicatorType type) {
    switch (type) {
        case IndicatorType::PRICE: return "price";
        case IndicatorType::SMA: return "sma";
        case IndicatorType::EMA: return "ema";
        case IndicatorType::RSI: return "rsi";
        case IndicatorType::MACD: return "macd";
        case IndicatorType::BOLLINGER: return "bollinger";
        case IndicatorType::STOCHASTIC: return "stochastic";
        case IndicatorType::ATR: return "atr";
        case IndicatorType::ADX: return "adx";
        case IndicatorType::OBV: return "obv";
        case IndicatorType::FIBONACCI: return "fibonacci";
        case IndicatorType::ICHIMOKU: return "ichimoku";
        case IndicatorType::PARABOLIC_SAR: return "parabolic_sar";
        case IndicatorType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

IndicatorEngine::IndicatorEngine(const std::vector<Bar>& history) {
    closes_.reserve(history.size());
    for (const auto& bar : history) {
        closes_.push_back(bar.close);
    }
}

int IndicatorEngine::resolvePeriod(const std::optional<double>& parameter, int fallback) {
    if (!parameter || !(*parameter >= 1.0)) {
        return fallback;
    }
    constexpr int MAX_PERIOD = std::numeric_limits<int>::max();
    if (*parameter >= static_cast<double>(MAX_PERIOD)) {
        return MAX_PERIOD;
    }
    return static_cast<int>(*parameter);
}

size_t IndicatorEngine::clampIndex(size_t index) const {
    return (index < closes_.size()) ? index : closes_.size() - 1;
}

double IndicatorEngine::value(const IndicatorSpec& spec, size_t index) {
    return value(spec.type, spec.parameter1, spec.parameter2, spec.parameter3, index);
}

double IndicatorEngine::value(IndicatorType type,
                              const std::optional<double>& p1,
                              const std::optional<double>& p2,
                              const std::optional<double>& /*p3*/,
                              size_t index) {
    if (closes_.empty()) {
        return 0.0;
    }
    index = clampIndex(index);

    switch (type) {
        case IndicatorType::PRICE:
            return price(index);
        case IndicatorType::SMA:
            return sma(resolvePeriod(p1, DEFAULT_SMA_PERIOD), index);
        case IndicatorType::EMA:
            return ema(resolvePeriod(p1, DEFAULT_EMA_PERIOD), index);
        case IndicatorType::RSI:
            return rsi(resolvePeriod(p1, DEFAULT_RSI_PERIOD), index);
        case IndicatorType::MACD:
            return macd(resolvePeriod(p1, DEFAULT_MACD_FAST),
                        resolvePeriod(p2, DEFAULT_MACD_SLOW), index);
        case IndicatorType::BOLLINGER:
            // Middle band only.
            return bollingerMiddle(resolvePeriod(p1, DEFAULT_BOLLINGER_PERIOD), index);
        default:
            return price(index);
    }
}

double IndicatorEngine::price(size_t index) const {
    if (closes_.empty()) {
        return 0.0;
    }
    return closes_[clampIndex(index)];
}

double IndicatorEngine::sma(int period, size_t index) const {
    if (closes_.empty()) {
        return 0.0;
    }
    index = clampIndex(index);
    if (period < 1) {
        period = DEFAULT_SMA_PERIOD;
    }
    if (index + 1 < static_cast<size_t>(period)) {
        return closes_[index];
    }

    double sum = 0.0;
    for (int i = 0; i < period; ++i) {
        sum += closes_[index - i];
    }
    return sum / period;
}

std::vector<double> IndicatorEngine::calculateEMAVector(const std::vector<double>& closes, int period) {
    std::vector<double> series(closes.size(), 0.0);
    if (period < 1) {
        period = DEFAULT_EMA_PERIOD;
    }
    const double multiplier = 2.0 / (period + 1);
    const size_t seed_index = static_cast<size_t>(period) - 1;

    for (size_t i = 0; i < closes.size(); ++i) {
        if (i < seed_index) {
            series[i] = closes[i];
            continue;
        }

        double previous = 0.0;
        if (i == seed_index) {
            // Seed with the simple average of the first `period` closes.
            double sum = 0.0;
            for (size_t j = 0; j < static_cast<size_t>(period); ++j) {
                sum += closes[j];
            }
            previous = sum / period;
        } else {
            previous = series[i - 1];
        }
        series[i] = (closes[i] - previous) * multiplier + previous;
    }
    return series;
}

const std::vector<double>& IndicatorEngine::emaSeries(int period) {
    if (period < 1) {
        period = DEFAULT_EMA_PERIOD;
    }
    auto it = ema_cache_.find(period);
    if (it == ema_cache_.end()) {
        it = ema_cache_.emplace(period, calculateEMAVector(closes_, period)).first;
    }
    return it->second;
}

double IndicatorEngine::ema(int period, size_t index) {
    if (closes_.empty()) {
        return 0.0;
    }
    return emaSeries(period)[clampIndex(index)];
}

double IndicatorEngine::rsi(int period, size_t index) const {
    if (closes_.empty()) {
        return 50.0;
    }
    index = clampIndex(index);
    if (period < 1) {
        period = DEFAULT_RSI_PERIOD;
    }
    if (index < static_cast<size_t>(period)) {
        return 50.0;
    }

    double gains = 0.0;
    double losses = 0.0;
    for (size_t i = index - period + 1; i <= index; ++i) {
        const double change = closes_[i] - closes_[i - 1];
        if (change >= 0.0) {
            gains += change;
        } else {
            losses -= change;
        }
    }

    const double avg_gain = gains / period;
    const double avg_loss = losses / period;
    if (avg_loss == 0.0) {
        return 100.0;
    }

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double IndicatorEngine::macd(int fast_period, int slow_period, size_t index) {
    return ema(fast_period, index) - ema(slow_period, index);
}

double IndicatorEngine::bollingerMiddle(int period, size_t index) const {
    return sma(period, index);
}

} // namespace analytics
} // namespace strategylab
