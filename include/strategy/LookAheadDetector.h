#pragma once

#include "strategy/IStrategy.h"
#include <optional>

namespace replaylab {
namespace strategy {

// Detects look-ahead bias: the signal a strategy emits for bar i when given
// the whole series must equal the one it emits when bars after i do not exist.
class LookAheadDetector {
public:
    // Index of the first bar whose signal changes once future bars are removed
    static std::optional<size_t> firstViolation(const IStrategy& strategy, const BarSeries& bars);

    static bool isCausal(const IStrategy& strategy, const BarSeries& bars) {
        return !firstViolation(strategy, bars).has_value();
    }
};

} // namespace strategy
} // namespace replaylab
