#pragma once

#include <map>
#include <string>
#include <vector>
#include "backtest/EquityCurveRecorder.h"
#include "backtest/TradeLedger.h"

namespace replaylab {
namespace backtest {

using MetricsMap = std::map<std::string, double>;

// Aggregate statistics of a finished run. Never throws; degenerate
// inputs (no trades, flat equity, empty curve) yield 0.
class MetricsCalculator {
public:
    static MetricsMap calculate(const std::vector<Trade>& trades,
                                const std::vector<EquityPoint>& equity_curve,
                                double initial_capital,
                                double annualization_factor = 252.0);

    // Percentage change between consecutive values; steps from a zero
    // or non-finite value are dropped
    static std::vector<double> stepReturns(const std::vector<double>& equity);

    // mean / sample std * sqrt(periods). 0 with fewer than two returns or zero spread.
    static double sharpeRatio(const std::vector<double>& returns, double annualization_factor);

    // min(equity / running_max - 1), within [-1, 0]. A fall from a peak at or below 0 gives -1.
    static double maxDrawdown(const std::vector<double>& equity);
};

} // namespace backtest
} // namespace replaylab
