#include "strategy/StrategyRegistry.h"
#include "strategy/MovingAverageCrossStrategy.h"
#include "strategy/RsiThresholdStrategy.h"
#include "strategy/MacdCrossStrategy.h"
#include "common/Config.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>

namespace replaylab {
namespace strategy {

std::string StrategyRegistry::normalizeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto first = name.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = name.find_last_not_of(" \t\r\n");
    name = name.substr(first, last - first + 1);

    if (name == "sma" || name == "ma") {
        return "sma_crossover";
    }
    if (name == "rsi") {
        return "rsi_threshold";
    }
    if (name == "macd") {
        return "macd_crossover";
    }
    return name;
}

std::shared_ptr<IStrategy> StrategyRegistry::create(const std::string& name, const Config& config) {
    const std::string key = normalizeName(name);

    if (key == "sma_crossover") {
        return std::make_shared<MovingAverageCrossStrategy>(config.getMovingAverageCrossConfig());
    }
    if (key == "rsi_threshold") {
        return std::make_shared<RsiThresholdStrategy>(config.getRsiThresholdConfig());
    }
    if (key == "macd_crossover") {
        return std::make_shared<MacdCrossStrategy>(config.getMacdCrossConfig());
    }

    throw ConfigurationError("strategy", "unknown strategy: " + name);
}

std::vector<std::string> StrategyRegistry::availableStrategies() {
    return {"sma_crossover", "rsi_threshold", "macd_crossover"};
}

} // namespace strategy
} // namespace replaylab
