#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace replaylab {
namespace strategy {

// Read-only view of the bars available at one decision point.
// back() is the decision bar; nothing after it is reachable.
class BarWindow {
public:
    BarWindow(const Bar* first, size_t size, size_t decision_index)
        : first_(first), size_(size), decision_index_(decision_index) {}

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    const Bar& operator[](size_t i) const { return first_[i]; }
    const Bar& back() const { return first_[size_ - 1]; }
    const Bar* begin() const { return first_; }
    const Bar* end() const { return first_ + size_; }

    // Position of back() in the full series
    size_t decisionIndex() const { return decision_index_; }

    std::vector<double> closes() const;

private:
    const Bar* first_;
    size_t size_;
    size_t decision_index_;
};

struct StrategyInfo {
    std::string name;           // registry key, e.g. "sma_crossover"
    std::string description;
    std::string parameters;     // human readable parameter summary

    StrategyInfo() = default;
    StrategyInfo(std::string n, std::string d, std::string p)
        : name(std::move(n)), description(std::move(d)), parameters(std::move(p)) {}
};

// Signal generator contract.
// A signal for bar i may only depend on bars [0, i]. The default
// generateSignals() enforces this by handing signalAt() nothing but the
// window ending at the decision bar.
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual StrategyInfo getInfo() const = 0;
    std::string getName() const { return getInfo().name; }

    // Maximum number of bars (decision bar included) given to signalAt()
    virtual size_t lookback() const { return static_cast<size_t>(DEFAULT_LOOKBACK); }

    virtual Signal signalAt(const BarWindow& window) const = 0;

    // One signal per bar, same length and alignment as bars
    virtual std::vector<Signal> generateSignals(const BarSeries& bars) const;

    // Units to buy/sell at price; nullopt defers to the configured sizing policy
    virtual std::optional<double> positionSize(double capital, double price) const {
        (void)capital;
        (void)price;
        return std::nullopt;
    }
};

} // namespace strategy
} // namespace replaylab
