#pragma once

#include "strategy/IStrategy.h"
#include <functional>

namespace replaylab {
namespace strategy {

// Model-driven variant. The predictor estimates the next close from the
// window it is given (nullopt while it has no opinion); the expected return
// against the decision bar close is compared with a symmetric threshold.
class PredictionThresholdStrategy : public IStrategy {
public:
    using Predictor = std::function<std::optional<double>(const BarWindow&)>;

    PredictionThresholdStrategy(std::string model_name, Predictor predictor,
                                const PredictionThresholdConfig& config = {});

    StrategyInfo getInfo() const override;
    size_t lookback() const override;
    Signal signalAt(const BarWindow& window) const override;

private:
    std::string model_name_;
    Predictor predictor_;
    PredictionThresholdConfig config_;
};

} // namespace strategy
} // namespace replaylab
