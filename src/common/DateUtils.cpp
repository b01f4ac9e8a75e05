#include "common/DateUtils.h"

#include <chrono>
#include <cstdio>
#include <cctype>

namespace strategylab {
namespace utils {

namespace {
long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool readNumber(const std::string& text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}
} // namespace

TimestampMs DateUtils::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Howard Hinnant's days_from_civil
long long DateUtils::daysFromCivil(int year, int month, int day) {
    const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = floorDiv(y, 400);
    const long long yoe = y - era * 400;
    const long long mp = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate DateUtils::civilFromTimestamp(TimestampMs ts) {
    long long z = floorDiv(ts, MS_PER_DAY) + 719468;
    const long long era = floorDiv(z, 146097);
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const long long d = doy - (153 * mp + 2) / 5 + 1;
    const long long m = mp < 10 ? mp + 3 : mp - 9;
    const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);

    CivilDate out;
    out.year = static_cast<int>(y);
    out.month = static_cast<int>(m);
    out.day = static_cast<int>(d);
    return out;
}

int DateUtils::weekday(TimestampMs ts) {
    const long long days = floorDiv(ts, MS_PER_DAY);
    // 1970-01-01 was a Thursday
    long long wd = (days + 4) % 7;
    if (wd < 0) {
        wd += 7;
    }
    return static_cast<int>(wd);
}

bool DateUtils::isWeekend(TimestampMs ts) {
    const int wd = weekday(ts);
    return wd == 0 || wd == 6;
}

std::optional<TimestampMs> DateUtils::parse(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() < 10 || text[4] != '-' || text[7] != '-' ||
        !readNumber(text, 0, 4, year) ||
        !readNumber(text, 5, 2, month) ||
        !readNumber(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    size_t pos = 10;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        if (text.size() < pos + 9 || text[pos + 3] != ':' || text[pos + 6] != ':' ||
            !readNumber(text, pos + 1, 2, hour) ||
            !readNumber(text, pos + 4, 2, minute) ||
            !readNumber(text, pos + 7, 2, second)) {
            return std::nullopt;
        }
        pos += 9;
        if (pos < text.size() && text[pos] == '.') {
            if (!readNumber(text, pos + 1, 3, millis)) {
                return std::nullopt;
            }
            pos += 4;
        }
        if (pos < text.size() && text[pos] == 'Z') {
            ++pos;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    const long long days = daysFromCivil(year, month, day);
    return days * MS_PER_DAY +
           (static_cast<long long>(hour) * 3600 + minute * 60 + second) * 1000LL +
           millis;
}

std::string DateUtils::toIsoString(TimestampMs ts) {
    const CivilDate date = civilFromTimestamp(ts);
    long long ms_of_day = ts - floorDiv(ts, MS_PER_DAY) * MS_PER_DAY;
    const int hour = static_cast<int>(ms_of_day / 3600000LL);
    ms_of_day %= 3600000LL;
    const int minute = static_cast<int>(ms_of_day / 60000LL);
    ms_of_day %= 60000LL;
    const int second = static_cast<int>(ms_of_day / 1000LL);
    const int millis = static_cast<int>(ms_of_day % 1000LL);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  date.year, date.month, date.day, hour, minute, second, millis);
    return buffer;
}

std::string DateUtils::toDateString(TimestampMs ts) {
    const CivilDate date = civilFromTimestamp(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buffer;
}

std::string DateUtils::toMonthKey(TimestampMs ts) {
    const CivilDate date = civilFromTimestamp(ts);
    return std::to_string(date.year) + "-" + std::to_string(date.month);
}

} // namespace utils
} // namespace strategylab
