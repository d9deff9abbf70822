#include "strategy/IStrategy.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace replaylab {
namespace strategy {

std::vector<double> BarWindow::closes() const {
    return analytics::TechnicalIndicators::extractClosePrices(first_, size_);
}

std::vector<Signal> IStrategy::generateSignals(const BarSeries& bars) const {
    std::vector<Signal> signals;
    signals.reserve(bars.size());

    const size_t max_window = std::max<size_t>(1, lookback());
    for (size_t i = 0; i < bars.size(); ++i) {
        const size_t window_size = std::min(max_window, i + 1);
        const Bar* first = bars.data() + (i + 1 - window_size);
        signals.push_back(signalAt(BarWindow(first, window_size, i)));
    }
    return signals;
}

} // namespace strategy
} // namespace replaylab
