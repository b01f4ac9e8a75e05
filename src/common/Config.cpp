#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace strategylab {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

DataSourceKind parseDataSource(const std::string& raw, DataSourceKind fallback) {
    const std::string name = toLowerCopy(trimCopy(raw));
    if (name == "csv" || name == "file") {
        return DataSourceKind::CSV;
    }
    if (name == "synthetic") {
        return DataSourceKind::SYNTHETIC;
    }
    std::cerr << "Config warning: unknown data source '" << raw << "', keeping default\n";
    return fallback;
}
} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    initial_capital_ = 100000.0;
    slippage_percent_ = 0.1;
    commission_percent_ = 0.05;
    lookback_days_ = 365;
    data_source_ = DataSourceKind::SYNTHETIC;
    data_dir_ = "data/bars";
    log_level_ = "info";
    log_dir_ = "logs";
}

bool Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path(path);
        if (!std::filesystem::exists(config_path)) {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Config file not found: " << config_path.string() << ", using defaults\n";
            applyEnvironment();
            return false;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Config file could not be opened: " << config_path.string() << "\n";
            applyEnvironment();
            return false;
        }

        nlohmann::json j;
        file >> j;
        applyJson(j);
        applyEnvironment();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << "\n";
        applyEnvironment();
        return false;
    }
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("backtest")) {
        const auto& b = j["backtest"];
        initial_capital_ = b.value("initial_capital", initial_capital_);
        slippage_percent_ = b.value("slippage_percent", slippage_percent_);
        commission_percent_ = b.value("commission_percent", commission_percent_);
        lookback_days_ = b.value("lookback_days", lookback_days_);
    }

    if (j.contains("data")) {
        const auto& d = j["data"];
        if (d.contains("source")) {
            data_source_ = parseDataSource(d["source"].get<std::string>(), data_source_);
        }
        data_dir_ = d.value("data_dir", data_dir_);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level_ = toLowerCopy(l.value("level", log_level_));
        log_dir_ = l.value("log_dir", log_dir_);
    }
}

void Config::applyEnvironment() {
    const std::string data_dir = readEnvVar("STRATEGYLAB_DATA_DIR");
    if (!data_dir.empty()) {
        data_dir_ = data_dir;
    }
    const std::string level = readEnvVar("STRATEGYLAB_LOG_LEVEL");
    if (!level.empty()) {
        log_level_ = toLowerCopy(level);
    }
}

} // namespace strategylab
