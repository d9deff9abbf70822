#include "backtest/CostModel.h"

namespace replaylab {
namespace backtest {

double CostModel::stopLevel(int side, double entry_price, double stop_loss_pct) {
    return entry_price * (1.0 - static_cast<double>(side) * stop_loss_pct);
}

bool CostModel::isStopTriggered(int side, double stop_level, const Bar& bar) {
    if (side > 0) {
        return bar.low <= stop_level;
    }
    if (side < 0) {
        return bar.high >= stop_level;
    }
    return false;
}

double CostModel::commission(double price, double size, double rate) {
    return price * size * rate;
}

double CostModel::pnl(double entry_price, double exit_price, int side, double size) {
    return (exit_price - entry_price) * static_cast<double>(side) * size;
}

double CostModel::unrealizedPnl(int side, double entry_price, double mark_price, double size) {
    if (side == 0) {
        return 0.0;
    }
    return pnl(entry_price, mark_price, side, size);
}

double CostModel::positionSize(SizingPolicy policy, double fraction,
                               double initial_capital, double realized_capital,
                               double price) {
    if (price <= 0.0) {
        return 0.0;
    }
    const double base = (policy == SizingPolicy::COMPOUNDING) ? realized_capital : initial_capital;
    if (base <= 0.0) {
        return 0.0;
    }
    return fraction * base / price;
}

} // namespace backtest
} // namespace replaylab
