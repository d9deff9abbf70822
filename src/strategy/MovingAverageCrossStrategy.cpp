#include "strategy/MovingAverageCrossStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <algorithm>

namespace replaylab {
namespace strategy {

MovingAverageCrossStrategy::MovingAverageCrossStrategy(const MovingAverageCrossConfig& config)
    : config_(config) {
    if (config_.fast_period <= 0 || config_.slow_period <= 0) {
        throw ConfigurationError("sma_crossover", "moving average periods must be positive");
    }
    if (config_.fast_period >= config_.slow_period) {
        throw ConfigurationError("sma_crossover", "fast_period must be shorter than slow_period");
    }
}

StrategyInfo MovingAverageCrossStrategy::getInfo() const {
    return StrategyInfo(
        "sma_crossover",
        "Simple moving average crossover",
        "fast=" + std::to_string(config_.fast_period) + ", slow=" + std::to_string(config_.slow_period)
    );
}

size_t MovingAverageCrossStrategy::lookback() const {
    return static_cast<size_t>(std::max(config_.lookback, config_.slow_period));
}

Signal MovingAverageCrossStrategy::signalAt(const BarWindow& window) const {
    if (window.size() < static_cast<size_t>(config_.slow_period)) {
        return Signal::Flat;
    }

    const auto closes = window.closes();
    const double fast_ma = analytics::TechnicalIndicators::calculateSMA(closes, config_.fast_period);
    const double slow_ma = analytics::TechnicalIndicators::calculateSMA(closes, config_.slow_period);

    if (fast_ma > slow_ma) return Signal::Long;
    if (fast_ma < slow_ma) return Signal::Short;
    return Signal::Flat;
}

} // namespace strategy
} // namespace replaylab
