#pragma once

#include "common/Types.h"

namespace replaylab {
namespace backtest {

// Stateless cost and risk arithmetic used by the engine loop.
// side is sideValue(Signal): +1 long, -1 short.
class CostModel {
public:
    // entry_price * (1 - side * stop_loss_pct)
    static double stopLevel(int side, double entry_price, double stop_loss_pct);

    // Long: bar.low <= stop. Short: bar.high >= stop.
    static bool isStopTriggered(int side, double stop_level, const Bar& bar);

    static double commission(double price, double size, double rate);

    // (exit - entry) * side * size
    static double pnl(double entry_price, double exit_price, int side, double size);

    static double unrealizedPnl(int side, double entry_price, double mark_price, double size);

    // Units for a new position under the given policy
    static double positionSize(SizingPolicy policy, double fraction,
                               double initial_capital, double realized_capital,
                               double price);
};

} // namespace backtest
} // namespace replaylab
