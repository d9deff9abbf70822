#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "strategy/StrategyRegistry.h"

#include <filesystem>
#include <fstream>

namespace replaylab {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}, using defaults", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {}, using defaults", config_path.string());
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("config", "malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    const auto bt = getBacktestConfig();
    LOG_INFO("Config loaded: capital={}, commission={}, stop_loss={}",
             bt.initial_capital, bt.commission_rate, bt.use_stop_loss ? bt.stop_loss_pct : 0.0);
}

void Config::loadFromJson(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);

    backtest::BacktestConfig bt = backtest_config_;
    strategy::MovingAverageCrossConfig sma = sma_config_;
    strategy::RsiThresholdConfig rsi = rsi_config_;
    strategy::MacdCrossConfig macd = macd_config_;
    std::string default_strategy = default_strategy_;
    std::string log_level = log_level_;
    std::string log_directory = log_directory_;
    std::string results_directory = results_directory_;

    try {
        if (j.contains("backtest")) {
            const auto& b = j["backtest"];
            bt.initial_capital = b.value("initial_capital", bt.initial_capital);
            bt.commission_rate = b.value("commission_rate", bt.commission_rate);
            bt.use_stop_loss = b.value("use_stop_loss", bt.use_stop_loss);
            bt.stop_loss_pct = b.value("stop_loss_pct", bt.stop_loss_pct);
            bt.position_fraction = b.value("position_fraction", bt.position_fraction);
            bt.annualization_factor = b.value("annualization_factor", bt.annualization_factor);
            if (b.contains("sizing_policy")) {
                bt.sizing_policy = backtest::sizingPolicyFromString(b["sizing_policy"].get<std::string>());
            }
            if (b.contains("strategy")) {
                default_strategy = strategy::StrategyRegistry::normalizeName(b["strategy"].get<std::string>());
            }
        }

        if (j.contains("strategies") && j["strategies"].contains("sma_crossover")) {
            const auto& s = j["strategies"]["sma_crossover"];
            sma.fast_period = s.value("fast_period", sma.fast_period);
            sma.slow_period = s.value("slow_period", sma.slow_period);
            sma.lookback = s.value("lookback", sma.lookback);
        }

        if (j.contains("strategies") && j["strategies"].contains("rsi_threshold")) {
            const auto& s = j["strategies"]["rsi_threshold"];
            rsi.period = s.value("period", rsi.period);
            rsi.oversold = s.value("oversold", rsi.oversold);
            rsi.overbought = s.value("overbought", rsi.overbought);
            rsi.lookback = s.value("lookback", rsi.lookback);
        }

        if (j.contains("strategies") && j["strategies"].contains("macd_crossover")) {
            const auto& s = j["strategies"]["macd_crossover"];
            macd.fast_period = s.value("fast_period", macd.fast_period);
            macd.slow_period = s.value("slow_period", macd.slow_period);
            macd.signal_period = s.value("signal_period", macd.signal_period);
            macd.lookback = s.value("lookback", macd.lookback);
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level = l.value("level", log_level);
            log_directory = l.value("directory", log_directory);
        }

        if (j.contains("results")) {
            results_directory = j["results"].value("directory", results_directory);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("config", std::string("invalid config value: ") + e.what());
    }

    bt.validate();

    backtest_config_ = bt;
    sma_config_ = sma;
    rsi_config_ = rsi;
    macd_config_ = macd;
    default_strategy_ = default_strategy;
    log_level_ = log_level;
    log_directory_ = log_directory;
    results_directory_ = results_directory;
}

void Config::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    backtest_config_ = backtest::BacktestConfig{};
    default_strategy_ = "sma_crossover";
    log_level_ = "info";
    log_directory_ = "logs";
    results_directory_ = "results/backtests";
    sma_config_ = strategy::MovingAverageCrossConfig{};
    rsi_config_ = strategy::RsiThresholdConfig{};
    macd_config_ = strategy::MacdCrossConfig{};
}

backtest::BacktestConfig Config::getBacktestConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backtest_config_;
}

void Config::setBacktestConfig(const backtest::BacktestConfig& cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    backtest_config_ = cfg;
}

std::string Config::getDefaultStrategy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_strategy_;
}

void Config::setDefaultStrategy(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_strategy_ = strategy::StrategyRegistry::normalizeName(name);
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level_;
}

std::string Config::getLogDirectory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_directory_;
}

std::string Config::getResultsDirectory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_directory_;
}

strategy::MovingAverageCrossConfig Config::getMovingAverageCrossConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sma_config_;
}

strategy::RsiThresholdConfig Config::getRsiThresholdConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rsi_config_;
}

strategy::MacdCrossConfig Config::getMacdCrossConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return macd_config_;
}

} // namespace replaylab
