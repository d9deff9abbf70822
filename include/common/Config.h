#pragma once

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"
#include "strategy/StrategyConfig.h"

namespace replaylab {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps defaults; malformed content throws ConfigurationError
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void resetToDefaults();

    backtest::BacktestConfig getBacktestConfig() const;
    void setBacktestConfig(const backtest::BacktestConfig& cfg);

    std::string getDefaultStrategy() const;
    void setDefaultStrategy(const std::string& name);
    std::string getLogLevel() const;
    std::string getLogDirectory() const;
    std::string getResultsDirectory() const;

    strategy::MovingAverageCrossConfig getMovingAverageCrossConfig() const;
    strategy::RsiThresholdConfig getRsiThresholdConfig() const;
    strategy::MacdCrossConfig getMacdCrossConfig() const;

private:
    Config() = default;

    mutable std::mutex mutex_;
    backtest::BacktestConfig backtest_config_;
    std::string default_strategy_ = "sma_crossover";
    std::string log_level_ = "info";
    std::string log_directory_ = "logs";
    std::string results_directory_ = "results/backtests";

    strategy::MovingAverageCrossConfig sma_config_;
    strategy::RsiThresholdConfig rsi_config_;
    strategy::MacdCrossConfig macd_config_;
};

} // namespace replaylab
