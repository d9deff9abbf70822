#include "backtest/BacktestResult.h"

#include <utility>

namespace replaylab {
namespace backtest {

BacktestResult::BacktestResult(std::string strategy_name,
                               std::vector<Trade> trades,
                               std::vector<EquityPoint> equity_curve,
                               MetricsMap metrics)
    : strategy_name_(std::move(strategy_name))
    , trades_(std::move(trades))
    , equity_curve_(std::move(equity_curve))
    , metrics_(std::move(metrics)) {
}

double BacktestResult::metric(const std::string& name) const {
    auto it = metrics_.find(name);
    return it != metrics_.end() ? it->second : 0.0;
}

} // namespace backtest
} // namespace replaylab
