#pragma once

#include <string>
#include <vector>
#include "backtest/EquityCurveRecorder.h"
#include "backtest/MetricsCalculator.h"
#include "backtest/TradeLedger.h"

namespace replaylab {
namespace backtest {

// Outcome of one completed run. Read-only once constructed.
class BacktestResult {
public:
    BacktestResult() = default;
    BacktestResult(std::string strategy_name,
                   std::vector<Trade> trades,
                   std::vector<EquityPoint> equity_curve,
                   MetricsMap metrics);

    const std::string& strategyName() const { return strategy_name_; }
    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<EquityPoint>& equityCurve() const { return equity_curve_; }
    const MetricsMap& metrics() const { return metrics_; }

    // 0 when the metric is absent
    double metric(const std::string& name) const;

private:
    std::string strategy_name_;
    std::vector<Trade> trades_;
    std::vector<EquityPoint> equity_curve_;
    MetricsMap metrics_;
};

} // namespace backtest
} // namespace replaylab
