#include "backtest/BacktestEngine.h"
#include "backtest/BarSeriesValidator.h"
#include "backtest/CostModel.h"
#include "backtest/EquityCurveRecorder.h"
#include "backtest/MetricsCalculator.h"
#include "backtest/TradeLedger.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>
#include <optional>
#include <string>
#include <utility>

namespace replaylab {
namespace backtest {

namespace {

// Everything a single run mutates. Created per call, never shared.
struct RunContext {
    const BarSeries& bars;
    const std::vector<Signal>& signals;
    const BacktestConfig& config;
    const strategy::IStrategy* strategy;    // null for precomputed signals
    std::string strategy_name;

    TradeLedger ledger;
    EquityCurveRecorder recorder;

    RunContext(const BarSeries& b, const std::vector<Signal>& s, const BacktestConfig& c,
               const strategy::IStrategy* strat, std::string name)
        : bars(b)
        , signals(s)
        , config(c)
        , strategy(strat)
        , strategy_name(std::move(name))
        , ledger(c.initial_capital, c.commission_rate) {
        recorder.reserve(b.size() > 0 ? b.size() - 1 : 0);
    }
};

void checkSignals(const std::vector<Signal>& signals, size_t bar_count) {
    if (signals.size() != bar_count) {
        throw SignalAlignmentError(bar_count, signals.size());
    }
    for (size_t i = 0; i < signals.size(); ++i) {
        const int v = sideValue(signals[i]);
        if (v < -1 || v > 1) {
            throw ValidationError(ValidationError::Kind::STRATEGY_FAILURE,
                                  "signal value " + std::to_string(v) + " at bar " + std::to_string(i) +
                                  " is not short/flat/long",
                                  i);
        }
    }
}

void closePosition(RunContext& ctx, double price, TimestampMs time, ExitReason reason) {
    const Trade& trade = ctx.ledger.close(price, time, reason);

    LOG_DEBUG("[{}] close {} {:.8f} @ {:.4f} -> {:.4f} net={:.2f} ({})",
              ctx.strategy_name, signalToString(trade.side), trade.size,
              trade.entry_price, trade.exit_price, trade.net_pnl, exitReasonToString(reason));
    Logger::getInstance().logTrade(ctx.strategy_name, signalToString(trade.side),
                                   trade.entry_price, trade.exit_price, trade.size,
                                   trade.net_pnl, exitReasonToString(reason));
}

void openPosition(RunContext& ctx, Signal side, const Bar& bar) {
    const BacktestConfig& cfg = ctx.config;
    const double sizing_capital = (cfg.sizing_policy == SizingPolicy::COMPOUNDING)
        ? ctx.ledger.realizedCapital()
        : cfg.initial_capital;

    double size = 0.0;
    std::optional<double> custom;
    if (ctx.strategy) {
        custom = ctx.strategy->positionSize(sizing_capital, bar.close);
    }
    if (custom) {
        size = *custom;
    } else {
        size = CostModel::positionSize(cfg.sizing_policy, cfg.position_fraction,
                                       cfg.initial_capital, ctx.ledger.realizedCapital(), bar.close);
    }

    if (!std::isfinite(size) || size <= 0.0) {
        LOG_DEBUG("[{}] skip {} entry at {}: size {}", ctx.strategy_name,
                  signalToString(side), bar.close, size);
        return;
    }

    ctx.ledger.open(side, bar.close, bar.timestamp, size);
    LOG_DEBUG("[{}] open {} {:.8f} @ {:.4f}", ctx.strategy_name, signalToString(side), size, bar.close);
}

void processBar(RunContext& ctx, size_t t) {
    const Bar& bar = ctx.bars[t];
    const bool is_final = (t + 1 == ctx.bars.size());
    bool stopped = false;

    if (ctx.config.use_stop_loss && ctx.ledger.hasPosition()) {
        const Position& pos = ctx.ledger.position();
        const int side = sideValue(pos.side);
        const double stop = CostModel::stopLevel(side, pos.entry_price, ctx.config.stop_loss_pct);
        if (CostModel::isStopTriggered(side, stop, bar)) {
            LOG_INFO("[{}] stop-loss hit at bar {}: {} entry {:.4f} stop {:.4f}",
                     ctx.strategy_name, t, signalToString(pos.side), pos.entry_price, stop);
            closePosition(ctx, stop, bar.timestamp, ExitReason::STOP_LOSS);
            stopped = true;
        }
    }

    if (!stopped) {
        const Signal signal = ctx.signals[t];
        if (!ctx.ledger.hasPosition()) {
            if (signal != Signal::Flat && !is_final) {
                openPosition(ctx, signal, bar);
            }
        } else if (signal != ctx.ledger.side()) {
            closePosition(ctx, bar.close, bar.timestamp, ExitReason::SIGNAL);
        }
    }

    if (is_final && ctx.ledger.hasPosition()) {
        closePosition(ctx, bar.close, bar.timestamp, ExitReason::FINAL);
    }

    const Position& pos = ctx.ledger.position();
    ctx.recorder.record(bar.timestamp, ctx.ledger.realizedCapital(),
                        CostModel::unrealizedPnl(sideValue(pos.side), pos.entry_price, bar.close, pos.size),
                        pos.side);
}

BacktestResult simulate(RunContext& ctx) {
    for (size_t t = 1; t < ctx.bars.size(); ++t) {
        processBar(ctx, t);
    }

    MetricsMap metrics = MetricsCalculator::calculate(ctx.ledger.trades(), ctx.recorder.points(),
                                                      ctx.config.initial_capital,
                                                      ctx.config.annualization_factor);

    LOG_INFO("[{}] done: trades={} final_equity={:.2f} return={:.2f}% sharpe={:.3f} mdd={:.2f}%",
             ctx.strategy_name,
             ctx.ledger.trades().size(),
             metrics["final_equity"],
             metrics["total_return"] * 100.0,
             metrics["sharpe_ratio"],
             metrics["max_drawdown"] * 100.0);

    return BacktestResult(ctx.strategy_name, ctx.ledger.releaseTrades(),
                          ctx.recorder.releasePoints(), std::move(metrics));
}

void checkInputs(const BarSeries& bars, const BacktestConfig& config) {
    config.validate();
    BarSeriesValidator::validate(bars);
    if (bars.size() < 2) {
        throw InsufficientDataError(bars.size());
    }
}

} // namespace

BacktestResult BacktestEngine::run(const strategy::IStrategy& strategy,
                                   const BarSeries& bars,
                                   const BacktestConfig& config) const {
    const std::string name = strategy.getName();
    try {
        checkInputs(bars, config);

        LOG_INFO("[{}] backtest start: bars={} capital={:.2f} commission={} stop_loss={} ({}) sizing={}",
                 name, bars.size(), config.initial_capital, config.commission_rate,
                 config.use_stop_loss ? "on" : "off", config.stop_loss_pct,
                 sizingPolicyToString(config.sizing_policy));

        std::vector<Signal> signals;
        try {
            signals = strategy.generateSignals(bars);
        } catch (const BacktestError&) {
            throw;
        } catch (const std::exception& e) {
            throw ValidationError(ValidationError::Kind::STRATEGY_FAILURE,
                                  "strategy '" + name + "' failed while generating signals: " + e.what());
        }
        checkSignals(signals, bars.size());

        RunContext ctx(bars, signals, config, &strategy, name);
        return simulate(ctx);
    } catch (const BacktestError& e) {
        LOG_ERROR("[{}] backtest failed ({}): {}", name, errorCodeToString(e.code()), e.what());
        throw;
    }
}

BacktestResult BacktestEngine::run(const strategy::IStrategy& strategy,
                                   const BarTable& table,
                                   const BacktestConfig& config) const {
    BarSeries bars;
    try {
        bars = BarSeriesValidator::toBars(table);
    } catch (const BacktestError& e) {
        LOG_ERROR("[{}] input rejected: {}", strategy.getName(), e.what());
        throw;
    }
    return run(strategy, bars, config);
}

BacktestResult BacktestEngine::runWithSignals(const std::vector<Signal>& signals,
                                              const BarSeries& bars,
                                              const BacktestConfig& config,
                                              const std::string& label) const {
    try {
        checkInputs(bars, config);
        checkSignals(signals, bars.size());

        RunContext ctx(bars, signals, config, nullptr, label);
        return simulate(ctx);
    } catch (const BacktestError& e) {
        LOG_ERROR("[{}] backtest failed ({}): {}", label, errorCodeToString(e.code()), e.what());
        throw;
    }
}

} // namespace backtest
} // namespace replaylab
