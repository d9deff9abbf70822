#include "strategy/MacdCrossStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <algorithm>

namespace replaylab {
namespace strategy {

MacdCrossStrategy::MacdCrossStrategy(const MacdCrossConfig& config)
    : config_(config) {
    if (config_.fast_period <= 0 || config_.slow_period <= 0 || config_.signal_period <= 0) {
        throw ConfigurationError("macd_crossover", "MACD periods must be positive");
    }
    if (config_.fast_period >= config_.slow_period) {
        throw ConfigurationError("macd_crossover", "fast_period must be shorter than slow_period");
    }
}

StrategyInfo MacdCrossStrategy::getInfo() const {
    return StrategyInfo(
        "macd_crossover",
        "MACD line / signal line crossover",
        "fast=" + std::to_string(config_.fast_period) +
        ", slow=" + std::to_string(config_.slow_period) +
        ", signal=" + std::to_string(config_.signal_period)
    );
}

size_t MacdCrossStrategy::lookback() const {
    return static_cast<size_t>(std::max(config_.lookback, config_.slow_period + config_.signal_period));
}

Signal MacdCrossStrategy::signalAt(const BarWindow& window) const {
    const auto macd = analytics::TechnicalIndicators::calculateMACD(
        window.closes(), config_.fast_period, config_.slow_period, config_.signal_period);
    if (!macd.valid) {
        return Signal::Flat;
    }

    if (macd.macd > macd.signal) return Signal::Long;
    if (macd.macd < macd.signal) return Signal::Short;
    return Signal::Flat;
}

} // namespace strategy
} // namespace replaylab
