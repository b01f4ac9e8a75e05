#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace strategylab {
namespace backtest {

namespace {
// Values below this are treated as epoch seconds.
constexpr long long MIN_EPOCH_MS = 100000000000LL;

long long normalizeEpoch(long long ts) {
    return (ts > 0 && ts < MIN_EPOCH_MS) ? ts * 1000LL : ts;
}

bool parseTimestampCell(const std::string& cell, long long& out) {
    if (cell.find('-', 1) != std::string::npos) {
        const auto parsed = utils::DateUtils::parse(cell);
        if (!parsed) {
            return false;
        }
        out = *parsed;
        return true;
    }
    out = normalizeEpoch(std::stoll(cell));
    return true;
}

bool readTimestamp(const nlohmann::json& item, long long& out) {
    for (const char* key : {"timestamp", "t", "date"}) {
        if (!item.contains(key)) {
            continue;
        }
        const auto& raw = item[key];
        if (raw.is_string()) {
            return parseTimestampCell(raw.get<std::string>(), out);
        }
        if (raw.is_number()) {
            out = normalizeEpoch(raw.get<long long>());
            return true;
        }
    }
    return false;
}

double readField(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return item[long_key].get<double>();
    if (item.contains(short_key)) return item[short_key].get<double>();
    return 0.0;
}
} // namespace

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataSourceError("failed to open CSV file: " + file_path);
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // Strip UTF-8 BOM if present at first cell.
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        // Accept quoted CSV cells.
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header or malformed row.
            continue;
        }

        try {
            Bar bar;
            if (!parseTimestampCell(row[0], bar.timestamp)) {
                ++skipped;
                continue;
            }
            bar.open = std::stod(row[1]);
            bar.high = std::stod(row[2]);
            bar.low = std::stod(row[3]);
            bar.close = std::stod(row[4]);
            bar.volume = std::stod(row[5]);
            bars.push_back(bar);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    if (skipped > 0) {
        LOG_WARN("Skipped {} malformed rows in {}", skipped, file_path);
    }
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataSourceError("failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw DataSourceError("malformed JSON in " + file_path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw DataSourceError("expected an array of bars in " + file_path);
    }

    try {
        for (const auto& item : j) {
            Bar bar;
            if (!readTimestamp(item, bar.timestamp)) {
                LOG_WARN("Bar without timestamp skipped in {}", file_path);
                continue;
            }
            bar.open = readField(item, "open", "o");
            bar.high = readField(item, "high", "h");
            bar.low = readField(item, "low", "l");
            bar.close = readField(item, "close", "c");
            bar.volume = readField(item, "volume", "v");
            bars.push_back(bar);
        }
    } catch (const std::exception& e) {
        throw DataSourceError("bad bar in " + file_path + ": " + e.what());
    }

    // Ensure sorted by timestamp ascending
    std::sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::filterByDate(const std::vector<Bar>& bars,
                                           TimestampMs start_ms,
                                           TimestampMs end_ms) {
    std::vector<Bar> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        if (bar.timestamp >= start_ms && bar.timestamp <= end_ms) {
            out.push_back(bar);
        }
    }
    return out;
}

std::vector<Bar> DataHistory::normalize(std::vector<Bar> bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<Bar> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        if (utils::DateUtils::isWeekend(bar.timestamp)) {
            continue;
        }
        if (!out.empty() && out.back().timestamp == bar.timestamp) {
            continue;
        }
        out.push_back(bar);
    }
    return out;
}

} // namespace backtest
} // namespace strategylab
