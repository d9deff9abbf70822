#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace replaylab;

    spdlog::set_level(spdlog::level::warn);

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.resetToDefaults();

    // 1. Defaults
    {
        const auto bt = config.getBacktestConfig();
        assert(bt.initial_capital == 10000.0);
        assert(std::abs(bt.commission_rate - 0.001) < 1e-12);
        assert(!bt.use_stop_loss);
        assert(std::abs(bt.stop_loss_pct - 0.02) < 1e-12);
        assert(std::abs(bt.position_fraction - 0.95) < 1e-12);
        assert(bt.sizing_policy == SizingPolicy::FIXED_INITIAL);
        assert(bt.annualization_factor == 252.0);
        assert(config.getDefaultStrategy() == "sma_crossover");
        assert(config.getResultsDirectory() == "results/backtests");

        const auto sma = config.getMovingAverageCrossConfig();
        assert(sma.fast_period == 20 && sma.slow_period == 50);
        const auto rsi = config.getRsiThresholdConfig();
        assert(rsi.period == 14 && rsi.oversold == 30.0 && rsi.overbought == 70.0);
        const auto macd = config.getMacdCrossConfig();
        assert(macd.fast_period == 12 && macd.slow_period == 26 && macd.signal_period == 9);
    }

    // 2. Sections override defaults, absent keys keep them
    {
        nlohmann::json j = {
            {"backtest", {
                {"initial_capital", 25000.0},
                {"use_stop_loss", true},
                {"stop_loss_pct", 0.05},
                {"sizing_policy", "compounding"},
                {"strategy", "RSI"}
            }},
            {"strategies", {
                {"rsi_threshold", {{"period", 7}, {"oversold", 25.0}}},
                {"sma_crossover", {{"fast_period", 5}, {"slow_period", 30}, {"lookback", 100}}}
            }},
            {"logging", {{"level", "debug"}, {"directory", "tmp_logs"}}},
            {"results", {{"directory", "out/results"}}}
        };
        config.loadFromJson(j);

        const auto bt = config.getBacktestConfig();
        assert(bt.initial_capital == 25000.0);
        assert(bt.use_stop_loss);
        assert(std::abs(bt.stop_loss_pct - 0.05) < 1e-12);
        assert(bt.sizing_policy == SizingPolicy::COMPOUNDING);
        assert(std::abs(bt.commission_rate - 0.001) < 1e-12);
        assert(config.getDefaultStrategy() == "rsi_threshold");

        const auto rsi = config.getRsiThresholdConfig();
        assert(rsi.period == 7);
        assert(rsi.oversold == 25.0);
        assert(rsi.overbought == 70.0);
        const auto sma = config.getMovingAverageCrossConfig();
        assert(sma.fast_period == 5 && sma.slow_period == 30 && sma.lookback == 100);

        assert(config.getLogLevel() == "debug");
        assert(config.getLogDirectory() == "tmp_logs");
        assert(config.getResultsDirectory() == "out/results");
    }

    // 3. Out-of-range values are rejected and nothing is applied
    {
        nlohmann::json j = {
            {"backtest", {{"initial_capital", 1.0}, {"commission_rate", 1.5}}},
            {"results", {{"directory", "never"}}}
        };
        bool threw = false;
        try {
            config.loadFromJson(j);
        } catch (const ConfigurationError& e) {
            threw = true;
            assert(e.parameter() == "commission_rate");
        }
        assert(threw);
        assert(config.getBacktestConfig().initial_capital == 25000.0);
        assert(config.getResultsDirectory() == "out/results");

        threw = false;
        try {
            nlohmann::json bad_policy = {{"backtest", {{"sizing_policy", "kelly"}}}};
            config.loadFromJson(bad_policy);
        } catch (const ConfigurationError& e) {
            threw = true;
            assert(e.parameter() == "sizing_policy");
        }
        assert(threw);

        threw = false;
        try {
            nlohmann::json bad_type = {{"backtest", {{"initial_capital", "lots"}}}};
            config.loadFromJson(bad_type);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // 4. Files: missing keeps defaults, malformed throws
    {
        config.resetToDefaults();
        const auto dir = std::filesystem::temp_directory_path() / "replaylab_config_test";
        std::filesystem::create_directories(dir);

        config.load((dir / "does_not_exist.json").string());
        assert(config.getBacktestConfig().initial_capital == 10000.0);

        const auto good = dir / "good.json";
        {
            std::ofstream out(good);
            out << R"({"backtest": {"initial_capital": 5000, "commission_rate": 0.0}})";
        }
        config.load(good.string());
        assert(config.getBacktestConfig().initial_capital == 5000.0);
        assert(config.getBacktestConfig().commission_rate == 0.0);

        const auto bad = dir / "bad.json";
        {
            std::ofstream out(bad);
            out << "{ \"backtest\": { \"initial_capital\": ";
        }
        bool threw = false;
        try {
            config.load(bad.string());
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);

        std::filesystem::remove_all(dir);
    }

    // 5. BacktestConfig range checks
    {
        backtest::BacktestConfig cfg;
        cfg.validate();

        cfg.stop_loss_pct = 1.0;
        bool threw = false;
        try {
            cfg.validate();
        } catch (const ConfigurationError& e) {
            threw = true;
            assert(e.parameter() == "stop_loss_pct");
        }
        assert(threw);

        cfg = backtest::BacktestConfig();
        cfg.position_fraction = 0.0;
        threw = false;
        try {
            cfg.validate();
        } catch (const ConfigurationError& e) {
            threw = true;
            assert(e.parameter() == "position_fraction");
        }
        assert(threw);

        assert(backtest::sizingPolicyFromString("Fixed") == SizingPolicy::FIXED_INITIAL);
        assert(std::string(backtest::sizingPolicyToString(SizingPolicy::COMPOUNDING)) == "compounding");
    }

    config.resetToDefaults();
    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
