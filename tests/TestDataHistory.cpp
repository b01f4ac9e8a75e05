#include "backtest/CsvBarProvider.h"
#include "backtest/DataHistory.h"
#include "backtest/SyntheticBarProvider.h"
#include "common/DateUtils.h"
#include "common/Errors.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace strategylab;
using strategylab::backtest::CsvBarProvider;
using strategylab::backtest::DataHistory;
using strategylab::backtest::SyntheticBarProvider;
using strategylab::utils::DateUtils;

namespace {
TimestampMs date(const char* text) {
    return *DateUtils::parse(text);
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

template <typename Fn>
bool throwsDataSourceError(Fn&& fn) {
    try {
        fn();
    } catch (const DataSourceError&) {
        return true;
    }
    return false;
}
} // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "strategylab_test_bars";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    // CSV: mixed timestamp formats, header, malformed rows, weekend and duplicate bars
    writeFile(dir / "MIX.csv",
              "timestamp,open,high,low,close,volume\n"
              "1704240000,3,3,3,3,300\n"           // 2024-01-03 in epoch seconds
              "1704153600000,2,2,2,2,200\n"        // 2024-01-02 in epoch ms
              "2024-01-01,1,1,1,1,100\n"
              "2024-01-06,6,6,6,6,600\n"           // Saturday
              "\"2024-01-02\",22,22,22,22,220\n"   // duplicate date, quoted
              "2024-13-01,9,9,9,9,900\n"           // bad month
              "1704326400000,4,4,oops,4,400\n"     // bad number
              "short,row\n");
    {
        const auto raw = DataHistory::loadCSV((dir / "MIX.csv").string());
        assert(raw.size() == 5);

        const auto bars = DataHistory::normalize(raw);
        assert(bars.size() == 3);
        assert(bars[0].timestamp == date("2024-01-01") && bars[0].close == 1.0);
        assert(bars[1].timestamp == date("2024-01-02") && bars[1].close == 2.0);  // first duplicate wins
        assert(bars[2].timestamp == date("2024-01-03") && bars[2].close == 3.0);

        const auto window = DataHistory::filterByDate(bars, date("2024-01-02"), date("2024-01-03"));
        assert(window.size() == 2);
        assert(window.front().close == 2.0 && window.back().close == 3.0);

        assert(throwsDataSourceError([&] { DataHistory::loadCSV((dir / "missing.csv").string()); }));
    }

    // JSON with long and short keys
    writeFile(dir / "JS.json",
              R"([
                  {"timestamp": "2024-01-02", "open": 2, "high": 2.5, "low": 1.5, "close": 2, "volume": 20},
                  {"t": 1704067200000, "o": 1, "h": 1.5, "l": 0.5, "c": 1, "v": 10},
                  {"open": 9}
              ])");
    {
        const auto bars = DataHistory::loadJSON((dir / "JS.json").string());
        assert(bars.size() == 2);
        assert(bars[0].timestamp == date("2024-01-01"));
        assert(bars[0].high == 1.5 && bars[0].volume == 10.0);
        assert(bars[1].close == 2.0 && bars[1].low == 1.5);
    }

    // Corrupt JSON files fail loudly instead of yielding no bars
    writeFile(dir / "CUT.json", R"([{"timestamp":1704153600000,"close":"oops"})");
    writeFile(dir / "TYPE.json", R"([{"timestamp":1704153600000,"close":"oops"}])");
    writeFile(dir / "OBJ.json", R"({"timestamp":1704153600000,"close":1})");
    {
        assert(throwsDataSourceError([&] { DataHistory::loadJSON((dir / "CUT.json").string()); }));
        assert(throwsDataSourceError([&] { DataHistory::loadJSON((dir / "TYPE.json").string()); }));
        assert(throwsDataSourceError([&] { DataHistory::loadJSON((dir / "OBJ.json").string()); }));
        assert(throwsDataSourceError([&] { DataHistory::loadJSON((dir / "absent.json").string()); }));

        CsvBarProvider provider(dir);
        assert(throwsDataSourceError([&] {
            provider.fetchBars("CUT", date("2024-01-01"), date("2024-01-31"), Timeframe::DAILY);
        }));
    }

    // File-backed provider
    {
        CsvBarProvider provider(dir);
        const auto bars = provider.fetchBars("MIX", date("2024-01-01"), date("2024-01-31"), Timeframe::DAILY);
        assert(bars.size() == 3);

        const auto from_json = provider.fetchBars("JS", date("2024-01-02"), date("2024-01-02"), Timeframe::DAILY);
        assert(from_json.size() == 1 && from_json[0].close == 2.0);

        bool threw = false;
        try {
            provider.fetchBars("NOPE", date("2024-01-01"), date("2024-01-31"), Timeframe::DAILY);
        } catch (const DataSourceError& e) {
            threw = std::string(e.what()).find("NOPE") != std::string::npos;
        }
        assert(threw);
    }

    // Synthetic provider: reproducible, weekday-only, consistent OHLC
    {
        assert(SyntheticBarProvider::symbolSeed("AB") == 131);

        SyntheticBarProvider provider;
        const TimestampMs start = date("2024-01-01");
        const TimestampMs end = date("2024-03-31");
        const auto a = provider.fetchBars("INFY", start, end, Timeframe::DAILY);
        const auto b = provider.fetchBars("INFY", start, end, Timeframe::DAILY);
        assert(!a.empty() && a.size() == b.size());

        const auto seed = SyntheticBarProvider::symbolSeed("INFY");
        assert(a[0].open == 100.0 + static_cast<double>(seed % 900));

        for (size_t i = 0; i < a.size(); ++i) {
            assert(a[i].timestamp == b[i].timestamp);
            assert(a[i].close == b[i].close && a[i].volume == b[i].volume);
            assert(!DateUtils::isWeekend(a[i].timestamp));
            assert(a[i].timestamp >= start && a[i].timestamp <= end);
            assert(a[i].high >= std::max(a[i].open, a[i].close));
            assert(a[i].low <= std::min(a[i].open, a[i].close));
            assert(a[i].volume >= 50000.0);
            if (i > 0) {
                assert(a[i].timestamp > a[i - 1].timestamp);
                assert(a[i].open == a[i - 1].close);
            }
        }

        const auto other = provider.fetchBars("TCS", start, end, Timeframe::DAILY);
        assert(other.size() == a.size());
        assert(other[0].open != a[0].open || other[5].close != a[5].close);

        const auto hourly = provider.fetchBars("INFY", start, start + 86400000LL - 1, Timeframe::H1);
        assert(hourly.size() == 24);

        assert(provider.fetchBars("INFY", end, start, Timeframe::DAILY).empty());
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
