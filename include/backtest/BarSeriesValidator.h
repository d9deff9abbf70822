#pragma once

#include "backtest/BarTable.h"
#include "common/Types.h"

namespace replaylab {
namespace backtest {

// Input checks run once at the start of every backtest.
// Failures throw ValidationError:
//   MISSING_COLUMNS     any of open/high/low/close/volume absent
//   NULL_VALUES         a gap (missing cell, NaN) in a required field or timestamp
//   NON_MONOTONIC_TIME  timestamps not strictly increasing
//   INVALID_VALUE       negative or infinite price/volume
class BarSeriesValidator {
public:
    static void validate(const BarTable& table);
    static void validate(const BarSeries& bars);

    // Validates, then converts to row form
    static BarSeries toBars(const BarTable& table);
};

} // namespace backtest
} // namespace replaylab
