#include "common/Types.h"

namespace strategylab {

std::optional<Timeframe> parseTimeframe(const std::string& text) {
    if (text == "1m") return Timeframe::M1;
    if (text == "5m") return Timeframe::M5;
    if (text == "15m") return Timeframe::M15;
    if (text == "30m") return Timeframe::M30;
    if (text == "1h") return Timeframe::H1;
    if (text == "4h") return Timeframe::H4;
    if (text == "daily" || text == "1d") return Timeframe::DAILY;
    if (text == "weekly") return Timeframe::WEEKLY;
    if (text == "monthly") return Timeframe::MONTHLY;
    return std::nullopt;
}

double timeframeToDays(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::M1: return 1.0 / 24.0 / 60.0;
        case Timeframe::M5: return 5.0 / 24.0 / 60.0;
        case Timeframe::M15: return 15.0 / 24.0 / 60.0;
        case Timeframe::M30: return 30.0 / 24.0 / 60.0;
        case Timeframe::H1: return 1.0 / 24.0;
        case Timeframe::H4: return 4.0 / 24.0;
        case Timeframe::DAILY: return 1.0;
        case Timeframe::WEEKLY: return 7.0;
        case Timeframe::MONTHLY: return 30.0;
    }
    return 1.0;
}

} // namespace strategylab
