#include "backtest/MetricsCalculator.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace replaylab {
namespace backtest {

namespace {
constexpr double EPSILON = 1e-12;
}

std::vector<double> MetricsCalculator::stepReturns(const std::vector<double>& equity) {
    std::vector<double> returns;
    if (equity.size() < 2) {
        return returns;
    }
    returns.reserve(equity.size() - 1);
    for (size_t i = 1; i < equity.size(); ++i) {
        const double prev = equity[i - 1];
        if (std::abs(prev) < EPSILON || !std::isfinite(prev) || !std::isfinite(equity[i])) {
            continue;
        }
        returns.push_back(equity[i] / prev - 1.0);
    }
    return returns;
}

double MetricsCalculator::sharpeRatio(const std::vector<double>& returns, double annualization_factor) {
    if (returns.size() < 2 || !(annualization_factor > 0.0)) {
        return 0.0;
    }
    const double mean = analytics::TechnicalIndicators::calculateMean(returns);
    const double stddev = analytics::TechnicalIndicators::calculateStandardDeviation(returns, mean);
    if (!(stddev > EPSILON) || !std::isfinite(stddev)) {
        return 0.0;
    }
    return mean / stddev * std::sqrt(annualization_factor);
}

double MetricsCalculator::maxDrawdown(const std::vector<double>& equity) {
    double peak = 0.0;
    double worst = 0.0;
    bool have_peak = false;
    for (double value : equity) {
        if (!std::isfinite(value)) {
            continue;
        }
        if (!have_peak || value > peak) {
            peak = value;
            have_peak = true;
        }
        if (peak > 0.0) {
            worst = std::min(worst, value / peak - 1.0);
        } else if (value < peak) {
            // Any loss from a non-positive peak is a total loss
            worst = -1.0;
        }
    }
    return std::clamp(worst, -1.0, 0.0);
}

MetricsMap MetricsCalculator::calculate(const std::vector<Trade>& trades,
                                        const std::vector<EquityPoint>& equity_curve,
                                        double initial_capital,
                                        double annualization_factor) {
    std::vector<double> equity;
    equity.reserve(equity_curve.size());
    for (const auto& point : equity_curve) {
        equity.push_back(point.mark_to_market_value);
    }

    const double final_equity = equity.empty() ? initial_capital : equity.back();

    int wins = 0;
    int losses = 0;
    int stop_exits = 0;
    int signal_exits = 0;
    int final_exits = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_total = 0.0;
    double commission_total = 0.0;
    double hours_total = 0.0;

    for (const auto& trade : trades) {
        net_total += trade.net_pnl;
        commission_total += trade.commission;
        hours_total += trade.holdingHours();

        if (trade.net_pnl > 0.0) {
            ++wins;
            gross_profit += trade.net_pnl;
        } else if (trade.net_pnl < 0.0) {
            ++losses;
            gross_loss_abs += std::abs(trade.net_pnl);
        }

        switch (trade.exit_reason) {
            case ExitReason::STOP_LOSS: ++stop_exits; break;
            case ExitReason::SIGNAL: ++signal_exits; break;
            case ExitReason::FINAL: ++final_exits; break;
        }
    }

    const double count = static_cast<double>(trades.size());

    MetricsMap m;
    m["initial_capital"] = initial_capital;
    m["final_equity"] = final_equity;
    m["total_return"] = (initial_capital > 0.0) ? (final_equity / initial_capital - 1.0) : 0.0;
    m["sharpe_ratio"] = sharpeRatio(stepReturns(equity), annualization_factor);
    m["max_drawdown"] = maxDrawdown(equity);
    m["win_rate"] = trades.empty() ? 0.0 : static_cast<double>(wins) / count;
    m["avg_trade_duration_hours"] = trades.empty() ? 0.0 : hours_total / count;

    m["total_trades"] = count;
    m["winning_trades"] = static_cast<double>(wins);
    m["losing_trades"] = static_cast<double>(losses);
    m["gross_profit"] = gross_profit;
    m["gross_loss"] = gross_loss_abs;
    m["profit_factor"] = (gross_loss_abs > EPSILON) ? (gross_profit / gross_loss_abs) : 0.0;
    m["expectancy"] = trades.empty() ? 0.0 : net_total / count;
    m["avg_win"] = (wins > 0) ? gross_profit / static_cast<double>(wins) : 0.0;
    m["avg_loss"] = (losses > 0) ? gross_loss_abs / static_cast<double>(losses) : 0.0;
    m["total_commission"] = commission_total;
    m["stop_loss_exits"] = static_cast<double>(stop_exits);
    m["signal_exits"] = static_cast<double>(signal_exits);
    m["final_exits"] = static_cast<double>(final_exits);
    return m;
}

} // namespace backtest
} // namespace replaylab
