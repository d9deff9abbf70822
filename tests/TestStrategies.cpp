#include "analytics/TechnicalIndicators.h"
#include "backtest/BacktestEngine.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "strategy/LookAheadDetector.h"
#include "strategy/MacdCrossStrategy.h"
#include "strategy/MovingAverageCrossStrategy.h"
#include "strategy/PredictionThresholdStrategy.h"
#include "strategy/RsiThresholdStrategy.h"
#include "strategy/StrategyRegistry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace replaylab;
using namespace replaylab::strategy;

namespace {
constexpr long long T0 = 1704067200000LL;
constexpr long long HOUR = 3600000LL;

BarSeries barsFromCloses(const std::vector<double>& closes) {
    BarSeries bars;
    for (size_t i = 0; i < closes.size(); ++i) {
        const double c = closes[i];
        bars.emplace_back(T0 + static_cast<long long>(i) * HOUR, c, c + 1.0, c - 1.0, c, 1000.0);
    }
    return bars;
}

std::vector<double> linear(size_t n, double start, double step) {
    std::vector<double> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(start + step * static_cast<double>(i));
    }
    return out;
}

// Peeks at the next bar: a textbook look-ahead bug
class NextBarPeekStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override {
        return StrategyInfo("peek", "uses tomorrow's close", "");
    }
    Signal signalAt(const BarWindow& window) const override {
        (void)window;
        return Signal::Flat;
    }
    std::vector<Signal> generateSignals(const BarSeries& bars) const override {
        std::vector<Signal> out(bars.size(), Signal::Flat);
        for (size_t i = 0; i + 1 < bars.size(); ++i) {
            out[i] = bars[i + 1].close > bars[i].close ? Signal::Long : Signal::Short;
        }
        return out;
    }
};

// Records what each decision was allowed to see
class WindowProbeStrategy : public IStrategy {
public:
    StrategyInfo getInfo() const override {
        return StrategyInfo("probe", "window probe", "");
    }
    size_t lookback() const override { return 4; }
    Signal signalAt(const BarWindow& window) const override {
        assert(!window.empty());
        assert(window.size() <= 4);
        assert(window.size() == std::min<size_t>(4, window.decisionIndex() + 1));
        assert(window.back().timestamp == T0 + static_cast<long long>(window.decisionIndex()) * HOUR);
        return Signal::Flat;
    }
};
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    // moving average crossover
    {
        MovingAverageCrossConfig cfg;
        cfg.fast_period = 2;
        cfg.slow_period = 3;
        MovingAverageCrossStrategy strat(cfg);
        assert(strat.getName() == "sma_crossover");

        const auto up = strat.generateSignals(barsFromCloses(linear(6, 100.0, 1.0)));
        assert(up.size() == 6);
        assert(up[0] == Signal::Flat && up[1] == Signal::Flat);
        for (size_t i = 2; i < up.size(); ++i) {
            assert(up[i] == Signal::Long);
        }

        const auto down = strat.generateSignals(barsFromCloses(linear(6, 100.0, -1.0)));
        assert(down[5] == Signal::Short);

        const auto flat = strat.generateSignals(barsFromCloses(linear(6, 100.0, 0.0)));
        assert(flat[5] == Signal::Flat);

        bool threw = false;
        try {
            MovingAverageCrossConfig bad;
            bad.fast_period = 10;
            bad.slow_period = 5;
            MovingAverageCrossStrategy invalid(bad);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // RSI thresholds
    {
        RsiThresholdConfig cfg;
        cfg.period = 3;
        RsiThresholdStrategy strat(cfg);

        const auto rising = strat.generateSignals(barsFromCloses(linear(8, 100.0, 1.0)));
        assert(rising[2] == Signal::Flat);      // warm-up
        assert(rising[7] == Signal::Short);     // RSI 100, overbought

        const auto falling = strat.generateSignals(barsFromCloses(linear(8, 100.0, -1.0)));
        assert(falling[7] == Signal::Long);     // RSI 0, oversold

        // a market that never moves is neutral, not overbought
        const auto still = RsiThresholdStrategy(RsiThresholdConfig()).generateSignals(
            barsFromCloses(linear(40, 100.0, 0.0)));
        for (Signal s : still) {
            assert(s == Signal::Flat);
        }
        assert(analytics::TechnicalIndicators::calculateRSI(std::vector<double>(20, 100.0), 14) == 50.0);
        assert(analytics::TechnicalIndicators::calculateRSI(linear(20, 100.0, 1.0), 14) == 100.0);

        backtest::BacktestEngine engine;
        const auto quiet = engine.run(RsiThresholdStrategy(RsiThresholdConfig()),
                                      barsFromCloses(linear(40, 100.0, 0.0)), backtest::BacktestConfig());
        assert(quiet.trades().empty());
        assert(quiet.metric("final_equity") == backtest::BacktestConfig().initial_capital);

        bool threw = false;
        try {
            RsiThresholdConfig bad;
            bad.oversold = 80.0;
            bad.overbought = 20.0;
            RsiThresholdStrategy invalid(bad);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // MACD crossover
    {
        MacdCrossConfig cfg;
        cfg.fast_period = 3;
        cfg.slow_period = 6;
        cfg.signal_period = 3;
        MacdCrossStrategy strat(cfg);

        std::vector<double> growth;
        double price = 100.0;
        for (int i = 0; i < 60; ++i) {
            growth.push_back(price);
            price *= 1.02;
        }
        const auto signals = strat.generateSignals(barsFromCloses(growth));
        assert(signals[7] == Signal::Flat);     // fewer than slow + signal bars
        assert(signals[59] == Signal::Long);

        // sharp turn after a rally drags the MACD line under its signal line
        std::vector<double> turn;
        price = 100.0;
        for (int i = 0; i < 40; ++i) {
            turn.push_back(price);
            price *= 1.02;
        }
        for (int i = 0; i < 5; ++i) {
            price *= 0.95;
            turn.push_back(price);
        }
        assert(strat.generateSignals(barsFromCloses(turn))[44] == Signal::Short);
    }

    // model-driven threshold
    {
        auto makeStrategy = [](double ratio) {
            return PredictionThresholdStrategy(
                "ratio",
                [ratio](const BarWindow& w) -> std::optional<double> { return w.back().close * ratio; });
        };
        const auto bars = barsFromCloses(linear(3, 100.0, 0.0));
        assert(makeStrategy(1.05).generateSignals(bars)[2] == Signal::Long);
        assert(makeStrategy(0.95).generateSignals(bars)[2] == Signal::Short);
        assert(makeStrategy(1.01).generateSignals(bars)[2] == Signal::Flat);

        PredictionThresholdStrategy silent(
            "silent", [](const BarWindow&) -> std::optional<double> { return std::nullopt; });
        assert(silent.generateSignals(bars)[2] == Signal::Flat);
        assert(silent.getName() == "prediction_threshold");

        bool threw = false;
        try {
            PredictionThresholdStrategy missing("none", PredictionThresholdStrategy::Predictor());
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    // decisions only see the bounded prefix window
    {
        WindowProbeStrategy probe;
        const auto signals = probe.generateSignals(barsFromCloses(linear(10, 50.0, 1.0)));
        assert(signals.size() == 10);
    }

    // look-ahead detection
    {
        std::vector<double> closes;
        for (int i = 0; i < 40; ++i) {
            closes.push_back(100.0 + 5.0 * std::sin(i * 0.5));
        }
        const auto bars = barsFromCloses(closes);

        MovingAverageCrossConfig sma;
        sma.fast_period = 3;
        sma.slow_period = 8;
        assert(LookAheadDetector::isCausal(MovingAverageCrossStrategy(sma), bars));

        RsiThresholdConfig rsi;
        rsi.period = 5;
        assert(LookAheadDetector::isCausal(RsiThresholdStrategy(rsi), bars));

        MacdCrossConfig macd;
        macd.fast_period = 3;
        macd.slow_period = 6;
        macd.signal_period = 3;
        assert(LookAheadDetector::isCausal(MacdCrossStrategy(macd), bars));

        NextBarPeekStrategy peek;
        const auto violation = LookAheadDetector::firstViolation(peek, bars);
        assert(violation.has_value());
        assert(*violation == 0);
        assert(!LookAheadDetector::isCausal(peek, bars));
    }

    // registry
    {
        Config& config = Config::getInstance();
        config.resetToDefaults();

        assert(StrategyRegistry::normalizeName("  SMA ") == "sma_crossover");
        assert(StrategyRegistry::normalizeName("rsi") == "rsi_threshold");
        assert(StrategyRegistry::normalizeName("MACD") == "macd_crossover");

        assert(StrategyRegistry::create("sma", config)->getName() == "sma_crossover");
        assert(StrategyRegistry::create("rsi_threshold", config)->getName() == "rsi_threshold");
        assert(StrategyRegistry::create("macd_crossover", config)->getName() == "macd_crossover");
        assert(StrategyRegistry::availableStrategies().size() == 3);

        bool threw = false;
        try {
            StrategyRegistry::create("bollinger", config);
        } catch (const ConfigurationError& e) {
            threw = true;
            assert(e.parameter() == "strategy");
        }
        assert(threw);
    }

    std::cout << "[TEST] Strategies PASSED\n";
    return 0;
}
