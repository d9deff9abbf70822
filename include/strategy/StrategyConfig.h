#pragma once

namespace replaylab {
namespace strategy {

// Bars handed to a single decision when the strategy does not say otherwise
constexpr int DEFAULT_LOOKBACK = 200;

struct MovingAverageCrossConfig {
    int fast_period = 20;
    int slow_period = 50;
    int lookback = DEFAULT_LOOKBACK;
};

struct RsiThresholdConfig {
    int period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
    int lookback = DEFAULT_LOOKBACK;
};

struct MacdCrossConfig {
    int fast_period = 12;
    int slow_period = 26;
    int signal_period = 9;
    int lookback = DEFAULT_LOOKBACK;
};

struct PredictionThresholdConfig {
    double threshold = 0.02;    // minimum expected move (fraction) before taking a side
    int lookback = DEFAULT_LOOKBACK;
};

} // namespace strategy
} // namespace replaylab
