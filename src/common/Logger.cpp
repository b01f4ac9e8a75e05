#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace strategylab {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level, bool console_only) {
    if (initialized_) return;

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        std::filesystem::path logs_path;
        if (!console_only) {
            if (std::filesystem::path(log_dir).is_absolute()) {
                logs_path = log_dir;
            } else {
                logs_path = utils::PathUtils::resolveRelativePath(log_dir);
            }
            std::filesystem::create_directories(logs_path);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (logs_path / "strategylab.log").string(), 1024 * 1024 * 10, 3
            );
            sinks.push_back(file_sink);
        }

        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        if (!console_only) {
            trade_logger_ = spdlog::daily_logger_mt("trade", (logs_path / "trades.log").string());
            trade_logger_->set_pattern("%v");
        }

        initialized_ = true;
        main_logger_->debug("Logger initialized");
        if (!console_only) {
            main_logger_->debug("Log directory: {}", logs_path.string());
        }
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::logTrade(const Trade& trade) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << trade.symbol << "," << tradeDirectionToString(trade.direction) << ","
            << std::fixed << std::setprecision(4) << trade.entry_price << ","
            << std::fixed << std::setprecision(4) << trade.exit_price << ","
            << std::fixed << std::setprecision(2) << trade.size << ","
            << std::fixed << std::setprecision(2) << trade.pnl << ","
            << exitReasonToString(trade.exit_reason);
        trade_logger_->info(oss.str());
    }
}

} // namespace strategylab
