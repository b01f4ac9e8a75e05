#include "common/Logger.h"
#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/BacktestReport.h"
#include "backtest/CsvBarProvider.h"
#include "backtest/SyntheticBarProvider.h"
#include "strategy/StrategyJson.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace strategylab;

namespace {

constexpr int EXIT_GENERIC = 1;
constexpr int EXIT_VALIDATION = 2;
constexpr int EXIT_DATA_SOURCE = 3;
constexpr int EXIT_CANCELLED = 130;

std::atomic<bool> g_cancel_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_cancel_requested.store(true);
    }
}

struct CliOptions {
    std::string strategy_path;
    std::string config_path = "config/config.json";
    std::optional<std::string> start;
    std::optional<std::string> end;
    std::optional<double> initial_capital;
    std::optional<double> slippage;
    std::optional<double> commission;
    std::optional<std::string> data_dir;
    std::optional<std::string> source;
    std::optional<std::string> output;
    bool json = false;
    bool help = false;
};

void printUsage(std::ostream& os) {
    os << "Usage: strategylab --strategy <file.json> [options]\n"
       << "  --start YYYY-MM-DD        first bar date (default: end - lookback_days)\n"
       << "  --end YYYY-MM-DD          last bar date (default: today)\n"
       << "  --initial-capital N       starting equity\n"
       << "  --slippage P              slippage in percent of price\n"
       << "  --commission P            commission in percent of position size\n"
       << "  --source synthetic|csv    bar provider\n"
       << "  --data-dir DIR            directory with <SYMBOL>.csv / <SYMBOL>.json\n"
       << "  --config PATH             configuration file (default: config/config.json)\n"
       << "  --json                    print the result as JSON\n"
       << "  --output FILE             also write the JSON result to FILE\n";
}

double parseNumber(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        const double v = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return v;
    } catch (const std::exception&) {
        throw StrategyValidationError(flag + " expects a number, got '" + text + "'");
    }
}

TimestampMs parseDate(const std::string& flag, const std::string& text) {
    const auto ts = utils::DateUtils::parse(text);
    if (!ts) {
        throw StrategyValidationError(flag + " expects YYYY-MM-DD, got '" + text + "'");
    }
    return *ts;
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw StrategyLabError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--strategy") {
            opts.strategy_path = next();
        } else if (arg == "--config") {
            opts.config_path = next();
        } else if (arg == "--start") {
            opts.start = next();
        } else if (arg == "--end") {
            opts.end = next();
        } else if (arg == "--initial-capital") {
            opts.initial_capital = parseNumber(arg, next());
        } else if (arg == "--slippage") {
            opts.slippage = parseNumber(arg, next());
        } else if (arg == "--commission") {
            opts.commission = parseNumber(arg, next());
        } else if (arg == "--data-dir") {
            opts.data_dir = next();
        } else if (arg == "--source") {
            opts.source = next();
        } else if (arg == "--output") {
            opts.output = next();
        } else {
            throw StrategyLabError("unknown argument: " + arg);
        }
    }
    return opts;
}

std::shared_ptr<backtest::IBarProvider> makeProvider(const Config& config) {
    if (config.getDataSource() == DataSourceKind::CSV) {
        std::filesystem::path dir(config.getDataDir());
        if (!std::filesystem::exists(dir)) {
            dir = utils::PathUtils::resolveRelativePath(config.getDataDir());
        }
        LOG_INFO("Bar source: csv ({})", dir.string());
        return std::make_shared<backtest::CsvBarProvider>(dir);
    }
    LOG_INFO("Bar source: synthetic");
    return std::make_shared<backtest::SyntheticBarProvider>();
}

// Goes through the logger once it is up, straight to stderr before that.
void reportError(const std::string& message) {
    if (Logger::getInstance().isInitialized()) {
        LOG_ERROR("{}", message);
    } else {
        std::cerr << message << "\n";
    }
}

int runBacktest(const CliOptions& opts) {
    auto& config = Config::getInstance();
    config.load(opts.config_path);

    if (opts.data_dir) config.setDataDir(*opts.data_dir);
    if (opts.source) {
        if (*opts.source == "csv") {
            config.setDataSource(DataSourceKind::CSV);
        } else if (*opts.source == "synthetic") {
            config.setDataSource(DataSourceKind::SYNTHETIC);
        } else {
            throw StrategyLabError("--source must be synthetic or csv");
        }
    }
    if (opts.initial_capital) config.setInitialCapital(*opts.initial_capital);
    if (opts.slippage) config.setSlippagePercent(*opts.slippage);
    if (opts.commission) config.setCommissionPercent(*opts.commission);

    Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

    const strategy::Strategy strat = strategy::loadStrategyFile(opts.strategy_path);
    auto params = backtest::BacktestParameters::fromConfig(strat);
    if (opts.end) {
        params.end_ms = parseDate("--end", *opts.end);
        if (!opts.start) {
            params.start_ms = params.end_ms - static_cast<TimestampMs>(config.getLookbackDays()) * utils::MS_PER_DAY;
        }
    }
    if (opts.start) {
        params.start_ms = parseDate("--start", *opts.start);
    }

    backtest::BacktestEngine engine(makeProvider(config));
    engine.setCancellationFlag(&g_cancel_requested);
    const auto result = engine.run(params);

    if (opts.output) {
        backtest::writeResultFile(*opts.output, result);
        LOG_INFO("Result written to {}", *opts.output);
    }
    if (opts.json) {
        std::cout << backtest::toJson(result).dump() << "\n";
    } else {
        backtest::printSummary(std::cout, result);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);

    try {
        const CliOptions opts = parseArgs(argc, argv);
        if (opts.help) {
            printUsage(std::cout);
            return 0;
        }
        if (opts.strategy_path.empty()) {
            printUsage(std::cerr);
            return EXIT_GENERIC;
        }
        return runBacktest(opts);
    } catch (const StrategyValidationError& e) {
        reportError(e.what());
        return EXIT_VALIDATION;
    } catch (const DataSourceError& e) {
        reportError(e.what());
        return EXIT_DATA_SOURCE;
    } catch (const BacktestCancelledError& e) {
        reportError(e.what());
        return EXIT_CANCELLED;
    } catch (const std::exception& e) {
        reportError(std::string("Error: ") + e.what());
        return EXIT_GENERIC;
    }
}
