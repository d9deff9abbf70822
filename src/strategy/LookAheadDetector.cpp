#include "strategy/LookAheadDetector.h"

#include <algorithm>
#include <cstddef>

namespace replaylab {
namespace strategy {

std::optional<size_t> LookAheadDetector::firstViolation(const IStrategy& strategy, const BarSeries& bars) {
    const auto full = strategy.generateSignals(bars);
    if (full.size() != bars.size()) {
        return std::optional<size_t>(std::min(full.size(), bars.size()));
    }

    for (size_t i = 0; i < bars.size(); ++i) {
        const BarSeries prefix(bars.begin(), bars.begin() + static_cast<std::ptrdiff_t>(i + 1));
        const auto truncated = strategy.generateSignals(prefix);
        if (truncated.size() != prefix.size() || truncated.back() != full[i]) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace strategy
} // namespace replaylab
