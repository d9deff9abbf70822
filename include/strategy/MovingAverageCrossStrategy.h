#pragma once

#include "strategy/IStrategy.h"

namespace replaylab {
namespace strategy {

// Long while the fast SMA is above the slow SMA, Short while below,
// Flat on a tie or before slow_period bars exist.
class MovingAverageCrossStrategy : public IStrategy {
public:
    explicit MovingAverageCrossStrategy(const MovingAverageCrossConfig& config = {});

    StrategyInfo getInfo() const override;
    size_t lookback() const override;
    Signal signalAt(const BarWindow& window) const override;

private:
    MovingAverageCrossConfig config_;
};

} // namespace strategy
} // namespace replaylab
