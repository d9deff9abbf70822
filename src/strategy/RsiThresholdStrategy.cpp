#include "strategy/RsiThresholdStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

#include <algorithm>
#include <sstream>

namespace replaylab {
namespace strategy {

RsiThresholdStrategy::RsiThresholdStrategy(const RsiThresholdConfig& config)
    : config_(config) {
    if (config_.period <= 0) {
        throw ConfigurationError("rsi_threshold", "RSI period must be positive");
    }
    if (config_.oversold < 0.0 || config_.overbought > 100.0 || config_.oversold >= config_.overbought) {
        throw ConfigurationError("rsi_threshold", "require 0 <= oversold < overbought <= 100");
    }
}

StrategyInfo RsiThresholdStrategy::getInfo() const {
    std::ostringstream params;
    params << "period=" << config_.period
           << ", oversold=" << config_.oversold
           << ", overbought=" << config_.overbought;
    return StrategyInfo("rsi_threshold", "RSI oversold/overbought threshold", params.str());
}

size_t RsiThresholdStrategy::lookback() const {
    return static_cast<size_t>(std::max(config_.lookback, config_.period + 1));
}

Signal RsiThresholdStrategy::signalAt(const BarWindow& window) const {
    if (window.size() < static_cast<size_t>(config_.period + 1)) {
        return Signal::Flat;
    }

    const double rsi = analytics::TechnicalIndicators::calculateRSI(window.closes(), config_.period);
    if (rsi < config_.oversold) return Signal::Long;
    if (rsi > config_.overbought) return Signal::Short;
    return Signal::Flat;
}

} // namespace strategy
} // namespace replaylab
