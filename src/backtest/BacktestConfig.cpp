#include "backtest/BacktestConfig.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace replaylab {
namespace backtest {

namespace {
std::string describe(const char* name, double value, const char* range) {
    return std::string(name) + " must be " + range + ", got " + std::to_string(value);
}
}

void BacktestConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw ConfigurationError("initial_capital", describe("initial_capital", initial_capital, "> 0"));
    }
    if (!std::isfinite(commission_rate) || commission_rate < 0.0 || commission_rate >= 1.0) {
        throw ConfigurationError("commission_rate", describe("commission_rate", commission_rate, "in [0, 1)"));
    }
    if (!std::isfinite(stop_loss_pct) || stop_loss_pct <= 0.0 || stop_loss_pct >= 1.0) {
        throw ConfigurationError("stop_loss_pct", describe("stop_loss_pct", stop_loss_pct, "in (0, 1)"));
    }
    if (!std::isfinite(position_fraction) || position_fraction <= 0.0 || position_fraction > 1.0) {
        throw ConfigurationError("position_fraction", describe("position_fraction", position_fraction, "in (0, 1]"));
    }
    if (!std::isfinite(annualization_factor) || annualization_factor <= 0.0) {
        throw ConfigurationError("annualization_factor",
                                 describe("annualization_factor", annualization_factor, "> 0"));
    }
}

SizingPolicy sizingPolicyFromString(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "fixed_initial" || v == "fixed") {
        return SizingPolicy::FIXED_INITIAL;
    }
    if (v == "compounding") {
        return SizingPolicy::COMPOUNDING;
    }
    throw ConfigurationError("sizing_policy", "unknown sizing policy: " + value);
}

const char* sizingPolicyToString(SizingPolicy policy) {
    switch (policy) {
        case SizingPolicy::FIXED_INITIAL: return "fixed_initial";
        case SizingPolicy::COMPOUNDING: return "compounding";
    }
    return "fixed_initial";
}

} // namespace backtest
} // namespace replaylab
