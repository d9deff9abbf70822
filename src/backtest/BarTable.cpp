#include "backtest/BarTable.h"

namespace replaylab {
namespace backtest {

const std::vector<std::string>& BarTable::requiredColumns() {
    static const std::vector<std::string> required{"open", "high", "low", "close", "volume"};
    return required;
}

void BarTable::appendBar(const Bar& bar) {
    timestamps.push_back(bar.timestamp);
    columns["open"].push_back(bar.open);
    columns["high"].push_back(bar.high);
    columns["low"].push_back(bar.low);
    columns["close"].push_back(bar.close);
    columns["volume"].push_back(bar.volume);
}

} // namespace backtest
} // namespace replaylab
