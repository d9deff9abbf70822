#pragma once

#include <vector>
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestResult.h"
#include "backtest/BarTable.h"
#include "common/Types.h"
#include "strategy/IStrategy.h"

namespace replaylab {
namespace backtest {

// Replays a bar series through a strategy.
//
// Per bar t = 1..N-1 (bar 0 only seeds the loop):
//   1. stop-loss check against bar high/low, exit at the stop level
//   2. otherwise the signal transition: open at close when flat, close at
//      close when the signal differs from the open side (a reversal needs
//      a second bar)
//   3. on the last bar nothing new is opened and an open position is
//      closed at the final close
// then one equity point is recorded.
//
// The engine holds no run state. Every call builds its own RunContext, so
// one engine can serve concurrent runs.
class BacktestEngine {
public:
    BacktestEngine() = default;

    // Throws ConfigurationError, ValidationError, InsufficientDataError or
    // SignalAlignmentError. A result is only returned for a completed run.
    BacktestResult run(const strategy::IStrategy& strategy,
                       const BarSeries& bars,
                       const BacktestConfig& config) const;

    // Validates the column table first, then runs as above
    BacktestResult run(const strategy::IStrategy& strategy,
                       const BarTable& table,
                       const BacktestConfig& config) const;

    // Same loop over precomputed signals (must match bars in length)
    BacktestResult runWithSignals(const std::vector<Signal>& signals,
                                  const BarSeries& bars,
                                  const BacktestConfig& config,
                                  const std::string& label = "signals") const;
};

} // namespace backtest
} // namespace replaylab
