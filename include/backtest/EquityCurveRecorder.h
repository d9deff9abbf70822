#pragma once

#include <vector>
#include "common/Types.h"

namespace replaylab {
namespace backtest {

struct EquityPoint {
    TimestampMs timestamp = 0;
    double realized_capital = 0.0;
    double mark_to_market_value = 0.0;
    Signal position_side = Signal::Flat;
};

// One point per processed bar, taken after that bar's transitions
class EquityCurveRecorder {
public:
    void reserve(size_t n) { points_.reserve(n); }

    void record(TimestampMs timestamp, double realized_capital,
                double unrealized_pnl, Signal position_side);

    const std::vector<EquityPoint>& points() const { return points_; }
    size_t size() const { return points_.size(); }
    std::vector<EquityPoint> releasePoints();

private:
    std::vector<EquityPoint> points_;
};

} // namespace backtest
} // namespace replaylab
