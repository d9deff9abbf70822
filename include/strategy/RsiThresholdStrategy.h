#pragma once

#include "strategy/IStrategy.h"

namespace replaylab {
namespace strategy {

// Oscillator threshold: Long when oversold, Short when overbought, Flat otherwise
class RsiThresholdStrategy : public IStrategy {
public:
    explicit RsiThresholdStrategy(const RsiThresholdConfig& config = {});

    StrategyInfo getInfo() const override;
    size_t lookback() const override;
    Signal signalAt(const BarWindow& window) const override;

private:
    RsiThresholdConfig config_;
};

} // namespace strategy
} // namespace replaylab
