#pragma once

#include <string>
#include "backtest/BarTable.h"

namespace replaylab {
namespace backtest {

class DataHistory {
public:
    // Load bars from a CSV file.
    // With a header row columns are matched by name (timestamp|time|date|datetime,
    // open, high, low, close, volume); without one the order is
    // timestamp,open,high,low,close,volume. Empty, nan and null cells become gaps.
    static BarTable loadCSV(const std::string& file_path);

    // Load bars from a JSON array of objects (timestamp/t, open/o, high/h,
    // low/l, close/c, volume/v). null values become gaps. File order is kept.
    static BarTable loadJSON(const std::string& file_path);

    // Dispatch on extension
    static BarTable load(const std::string& file_path);

    // Keep rows with start <= timestamp <= end. Either bound may be empty.
    // A date-only end bound covers the whole day.
    static BarTable filterByDate(const BarTable& table,
                                 const std::string& start_date,
                                 const std::string& end_date);
};

} // namespace backtest
} // namespace replaylab
