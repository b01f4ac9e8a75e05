#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace strategylab {
namespace utils {

constexpr TimestampMs MS_PER_DAY = 86400000LL;

struct CivilDate {
    int year = 1970;
    int month = 1;   // 1..12
    int day = 1;     // 1..31
};

class DateUtils {
public:
    static TimestampMs nowMs();

    // Days since 1970-01-01 for a proleptic Gregorian date.
    static long long daysFromCivil(int year, int month, int day);
    static CivilDate civilFromTimestamp(TimestampMs ts);

    // 0 = Sunday ... 6 = Saturday (UTC)
    static int weekday(TimestampMs ts);
    static bool isWeekend(TimestampMs ts);

    // Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" and an optional ".sss" / "Z" suffix.
    static std::optional<TimestampMs> parse(const std::string& text);

    static std::string toIsoString(TimestampMs ts);   // 2024-03-01T00:00:00.000Z
    static std::string toDateString(TimestampMs ts);  // 2024-03-01
    static std::string toMonthKey(TimestampMs ts);    // 2024-3
};

} // namespace utils
} // namespace strategylab
