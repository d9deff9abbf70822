#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestEngine.h"
#include "backtest/BacktestResult.h"

namespace replaylab {
namespace backtest {

// One independent run for the batch runner
struct BacktestJob {
    std::string label;                              // e.g. symbol or parameter set
    std::shared_ptr<const strategy::IStrategy> strategy;
    std::shared_ptr<const BarSeries> bars;
    BacktestConfig config;
};

// Runs independent backtests concurrently. Jobs share no mutable state;
// the shared strategy and bars are only read.
class BacktestRunner {
public:
    // Results in job order. Waits for every job, then rethrows the first
    // failure in job order if any job failed.
    static std::vector<BacktestResult> runAll(const std::vector<BacktestJob>& jobs);
};

} // namespace backtest
} // namespace replaylab
