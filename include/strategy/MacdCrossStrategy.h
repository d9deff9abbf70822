#pragma once

#include "strategy/IStrategy.h"

namespace replaylab {
namespace strategy {

// Momentum crossover: Long while the MACD line is above its signal line
class MacdCrossStrategy : public IStrategy {
public:
    explicit MacdCrossStrategy(const MacdCrossConfig& config = {});

    StrategyInfo getInfo() const override;
    size_t lookback() const override;
    Signal signalAt(const BarWindow& window) const override;

private:
    MacdCrossConfig config_;
};

} // namespace strategy
} // namespace replaylab
