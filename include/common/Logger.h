#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

#include "common/Types.h"

namespace strategylab {

class Logger {
public:
    static Logger& getInstance();

    // console_only skips the rotating file and the daily trade log; the tests use it
    // so they leave no log files behind.
    void initialize(const std::string& log_dir = "logs",
                    const std::string& level = "info",
                    bool console_only = false);
    void setLevel(const std::string& level);
    bool isInitialized() const { return initialized_; }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // One CSV row per closed trade: symbol,direction,entry,exit,size,pnl,reason
    void logTrade(const Trade& trade);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) strategylab::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) strategylab::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) strategylab::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) strategylab::Logger::getInstance().error(__VA_ARGS__)

} // namespace strategylab
