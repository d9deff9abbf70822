#include "backtest/TradeLedger.h"
#include "backtest/CostModel.h"
#include "common/TimeUtils.h"

#include <stdexcept>
#include <utility>

namespace replaylab {
namespace backtest {

double Trade::holdingHours() const {
    return utils::TimeUtils::hoursBetween(entry_time, exit_time);
}

TradeLedger::TradeLedger(double initial_capital, double commission_rate)
    : initial_capital_(initial_capital)
    , commission_rate_(commission_rate)
    , realized_capital_(initial_capital) {
}

void TradeLedger::open(Signal side, double price, TimestampMs time, double size) {
    if (hasPosition()) {
        throw std::logic_error("TradeLedger::open called with a position already open");
    }
    if (side == Signal::Flat) {
        throw std::logic_error("TradeLedger::open requires a long or short side");
    }

    position_.side = side;
    position_.entry_price = price;
    position_.entry_time = time;
    position_.size = size;
    position_.entry_commission = CostModel::commission(price, size, commission_rate_);
}

const Trade& TradeLedger::close(double price, TimestampMs time, ExitReason reason) {
    if (!hasPosition()) {
        throw std::logic_error("TradeLedger::close called without an open position");
    }

    const int side = sideValue(position_.side);

    Trade trade;
    trade.entry_time = position_.entry_time;
    trade.entry_price = position_.entry_price;
    trade.exit_time = time;
    trade.exit_price = price;
    trade.side = position_.side;
    trade.size = position_.size;
    trade.gross_pnl = CostModel::pnl(position_.entry_price, price, side, position_.size);
    trade.commission = position_.entry_commission +
                       CostModel::commission(price, position_.size, commission_rate_);
    trade.net_pnl = trade.gross_pnl - trade.commission;
    trade.exit_reason = reason;

    realized_capital_ += trade.net_pnl;
    position_ = Position();
    trades_.push_back(trade);
    return trades_.back();
}

double TradeLedger::markToMarket(double price) const {
    return realized_capital_ + CostModel::unrealizedPnl(sideValue(position_.side),
                                                        position_.entry_price, price, position_.size);
}

std::vector<Trade> TradeLedger::releaseTrades() {
    return std::move(trades_);
}

} // namespace backtest
} // namespace replaylab
