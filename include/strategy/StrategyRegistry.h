#pragma once

#include "strategy/IStrategy.h"
#include <memory>
#include <string>
#include <vector>

namespace replaylab {
class Config;

namespace strategy {

// Builds the indicator strategies by name with parameters from Config
class StrategyRegistry {
public:
    // Lower-cases, trims and resolves short aliases (sma, rsi, macd)
    static std::string normalizeName(std::string name);

    // Throws ConfigurationError for unknown names
    static std::shared_ptr<IStrategy> create(const std::string& name, const Config& config);

    static std::vector<std::string> availableStrategies();
};

} // namespace strategy
} // namespace replaylab
