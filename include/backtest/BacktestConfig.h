#pragma once

#include <string>

#include "common/Types.h"

namespace replaylab {
namespace backtest {

// Run parameters, fixed for the duration of a single run
struct BacktestConfig {
    double initial_capital = 10000.0;
    double commission_rate = 0.001;         // per side, fraction of notional
    bool use_stop_loss = false;
    double stop_loss_pct = 0.02;
    double position_fraction = 0.95;        // share of sizing capital put into a position
    SizingPolicy sizing_policy = SizingPolicy::FIXED_INITIAL;
    double annualization_factor = 252.0;    // periods per year for the Sharpe ratio

    // Throws ConfigurationError naming the first out-of-range parameter
    void validate() const;
};

SizingPolicy sizingPolicyFromString(const std::string& value);
const char* sizingPolicyToString(SizingPolicy policy);

} // namespace backtest
} // namespace replaylab
