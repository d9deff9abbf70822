#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace replaylab {
namespace backtest {

// Column-oriented OHLCV table as delivered by a loader, before validation.
// A missing cell is std::nullopt.
struct BarTable {
    std::vector<std::optional<TimestampMs>> timestamps;
    std::map<std::string, std::vector<std::optional<double>>> columns;

    static const std::vector<std::string>& requiredColumns();

    size_t rows() const { return timestamps.size(); }
    bool hasColumn(const std::string& name) const { return columns.count(name) > 0; }

    // Appends a fully populated row for every required column
    void appendBar(const Bar& bar);
};

} // namespace backtest
} // namespace replaylab
