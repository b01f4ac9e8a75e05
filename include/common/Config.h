#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace strategylab {

enum class DataSourceKind { SYNTHETIC, CSV };

class Config {
public:
    static Config& getInstance();

    // Returns false when the file is missing or unreadable; defaults stay in effect.
    bool load(const std::string& config_path);
    void applyJson(const nlohmann::json& j);
    void applyEnvironment();
    void resetToDefaults();

    // Backtest defaults
    double getInitialCapital() const { return initial_capital_; }
    double getSlippagePercent() const { return slippage_percent_; }
    double getCommissionPercent() const { return commission_percent_; }
    int getLookbackDays() const { return lookback_days_; }
    void setInitialCapital(double v) { initial_capital_ = v; }
    void setSlippagePercent(double v) { slippage_percent_ = v; }
    void setCommissionPercent(double v) { commission_percent_ = v; }

    // Market data
    DataSourceKind getDataSource() const { return data_source_; }
    std::string getDataDir() const { return data_dir_; }
    void setDataSource(DataSourceKind v) { data_source_ = v; }
    void setDataDir(const std::string& v) { data_dir_ = v; }

    // Logging
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    void setLogLevel(const std::string& v) { log_level_ = v; }

private:
    Config() = default;

    double initial_capital_ = 100000.0;
    double slippage_percent_ = 0.1;    // percentage points
    double commission_percent_ = 0.05; // percentage points
    int lookback_days_ = 365;

    DataSourceKind data_source_ = DataSourceKind::SYNTHETIC;
    std::string data_dir_ = "data/bars";

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace strategylab
