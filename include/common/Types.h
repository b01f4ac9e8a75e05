#pragma once

#include <string>
#include <vector>
#include <optional>

namespace strategylab {

using TimestampMs = long long;
using Price = double;
using Volume = double;
using Amount = double;

enum class TradeDirection { LONG, SHORT };
enum class ExitReason { STOP_LOSS, TAKE_PROFIT, EXIT_SIGNAL, END_OF_DATA };
enum class Timeframe { M1, M5, M15, M30, H1, H4, DAILY, WEEKLY, MONTHLY };

// One OHLCV period. timestamp is milliseconds since epoch (UTC).
struct Bar {
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Bar() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Bar(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Open position for a single symbol. Lives between entry and exit only.
struct Position {
    std::string symbol;
    TimestampMs entry_time = 0;
    Price entry_price = 0.0;
    TradeDirection direction = TradeDirection::LONG;
    Amount size = 0.0;
    std::optional<Price> stop_price;
    std::optional<Price> target_price;
};

// Closed trade. Never mutated after creation.
struct Trade {
    std::string symbol;
    TimestampMs entry_time = 0;
    Price entry_price = 0.0;
    TradeDirection direction = TradeDirection::LONG;
    Amount size = 0.0;
    std::optional<Price> stop_price;
    std::optional<Price> target_price;

    TimestampMs exit_time = 0;
    Price exit_price = 0.0;
    Amount pnl = 0.0;
    double pnl_percent = 0.0;
    ExitReason exit_reason = ExitReason::EXIT_SIGNAL;
};

struct EquityPoint {
    TimestampMs timestamp = 0;
    Amount equity = 0.0;
};

inline const char* tradeDirectionToString(TradeDirection direction) {
    return (direction == TradeDirection::LONG) ? "long" : "short";
}

inline const char* exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::EXIT_SIGNAL: return "exit_signal";
        case ExitReason::END_OF_DATA: return "end_of_data";
    }
    return "unknown";
}

inline const char* timeframeToString(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::M1: return "1m";
        case Timeframe::M5: return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1: return "1h";
        case Timeframe::H4: return "4h";
        case Timeframe::DAILY: return "daily";
        case Timeframe::WEEKLY: return "weekly";
        case Timeframe::MONTHLY: return "monthly";
    }
    return "daily";
}

std::optional<Timeframe> parseTimeframe(const std::string& text);

// Bar spacing in (fractional) days.
double timeframeToDays(Timeframe timeframe);

} // namespace strategylab
