#pragma once

#include <vector>
#include "common/Types.h"

namespace replaylab {
namespace backtest {

// Open position. side == Signal::Flat means no position.
struct Position {
    Signal side = Signal::Flat;
    double entry_price = 0.0;
    TimestampMs entry_time = 0;
    double size = 0.0;
    double entry_commission = 0.0;
};

// Closed round trip. Never modified after the ledger appends it.
struct Trade {
    TimestampMs entry_time = 0;
    double entry_price = 0.0;
    TimestampMs exit_time = 0;
    double exit_price = 0.0;
    Signal side = Signal::Flat;
    double size = 0.0;
    double gross_pnl = 0.0;
    double commission = 0.0;    // entry + exit
    double net_pnl = 0.0;
    ExitReason exit_reason = ExitReason::SIGNAL;

    double holdingHours() const;
};

// Single-position state machine for one run.
// Realized capital only moves when a position closes, by the trade's net pnl.
class TradeLedger {
public:
    TradeLedger(double initial_capital, double commission_rate);

    bool hasPosition() const { return position_.side != Signal::Flat; }
    const Position& position() const { return position_; }
    Signal side() const { return position_.side; }

    // Throws std::logic_error if a position is already open or side is Flat
    void open(Signal side, double price, TimestampMs time, double size);

    // Throws std::logic_error when flat
    const Trade& close(double price, TimestampMs time, ExitReason reason);

    double initialCapital() const { return initial_capital_; }
    double realizedCapital() const { return realized_capital_; }
    double markToMarket(double price) const;

    const std::vector<Trade>& trades() const { return trades_; }
    std::vector<Trade> releaseTrades();

private:
    double initial_capital_;
    double commission_rate_;
    double realized_capital_;
    Position position_;
    std::vector<Trade> trades_;
};

} // namespace backtest
} // namespace replaylab
