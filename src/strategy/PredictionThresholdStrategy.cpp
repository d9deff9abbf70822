#include "strategy/PredictionThresholdStrategy.h"
#include "common/Errors.h"

#include <cmath>
#include <sstream>

namespace replaylab {
namespace strategy {

PredictionThresholdStrategy::PredictionThresholdStrategy(std::string model_name, Predictor predictor,
                                                         const PredictionThresholdConfig& config)
    : model_name_(std::move(model_name))
    , predictor_(std::move(predictor))
    , config_(config) {
    if (!predictor_) {
        throw ConfigurationError("prediction_threshold", "a predictor is required");
    }
    if (!std::isfinite(config_.threshold) || config_.threshold < 0.0) {
        throw ConfigurationError("prediction_threshold", "threshold must be a non-negative number");
    }
    if (config_.lookback <= 0) {
        throw ConfigurationError("prediction_threshold", "lookback must be positive");
    }
}

StrategyInfo PredictionThresholdStrategy::getInfo() const {
    std::ostringstream params;
    params << "model=" << model_name_ << ", threshold=" << config_.threshold;
    return StrategyInfo("prediction_threshold", "Model prediction vs. expected-return threshold", params.str());
}

size_t PredictionThresholdStrategy::lookback() const {
    return static_cast<size_t>(config_.lookback);
}

Signal PredictionThresholdStrategy::signalAt(const BarWindow& window) const {
    if (window.empty()) {
        return Signal::Flat;
    }

    const double current = window.back().close;
    if (current <= 0.0) {
        return Signal::Flat;
    }

    const auto predicted = predictor_(window);
    if (!predicted || !std::isfinite(*predicted)) {
        return Signal::Flat;
    }

    const double expected_return = (*predicted - current) / current;
    if (expected_return > config_.threshold) return Signal::Long;
    if (expected_return < -config_.threshold) return Signal::Short;
    return Signal::Flat;
}

} // namespace strategy
} // namespace replaylab
