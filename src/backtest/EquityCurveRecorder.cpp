#include "backtest/EquityCurveRecorder.h"

#include <utility>

namespace replaylab {
namespace backtest {

void EquityCurveRecorder::record(TimestampMs timestamp, double realized_capital,
                                 double unrealized_pnl, Signal position_side) {
    EquityPoint point;
    point.timestamp = timestamp;
    point.realized_capital = realized_capital;
    point.mark_to_market_value = realized_capital + unrealized_pnl;
    point.position_side = position_side;
    points_.push_back(point);
}

std::vector<EquityPoint> EquityCurveRecorder::releasePoints() {
    return std::move(points_);
}

} // namespace backtest
} // namespace replaylab
