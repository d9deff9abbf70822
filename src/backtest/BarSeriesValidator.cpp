#include "backtest/BarSeriesValidator.h"
#include "common/Errors.h"

#include <cmath>
#include <string>

namespace replaylab {
namespace backtest {

namespace {
void checkValue(double value, const char* field, size_t row) {
    if (std::isnan(value)) {
        throw ValidationError(ValidationError::Kind::NULL_VALUES,
                              std::string("null value in column '") + field + "' at row " + std::to_string(row),
                              row, {field});
    }
    if (!std::isfinite(value) || value < 0.0) {
        throw ValidationError(ValidationError::Kind::INVALID_VALUE,
                              std::string("column '") + field + "' must be a non-negative finite number at row " +
                              std::to_string(row),
                              row, {field});
    }
}

void checkOrder(TimestampMs previous, TimestampMs current, size_t row) {
    if (current <= previous) {
        throw ValidationError(ValidationError::Kind::NON_MONOTONIC_TIME,
                              "timestamps must be strictly increasing (row " + std::to_string(row) + ")",
                              row, {"timestamp"});
    }
}
} // namespace

void BarSeriesValidator::validate(const BarTable& table) {
    std::vector<std::string> missing;
    for (const auto& name : BarTable::requiredColumns()) {
        if (!table.hasColumn(name)) {
            missing.push_back(name);
        }
    }
    if (!missing.empty()) {
        std::string joined;
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) joined += ", ";
            joined += missing[i];
        }
        throw ValidationError(ValidationError::Kind::MISSING_COLUMNS,
                              "missing required columns: " + joined, 0, missing);
    }

    const size_t rows = table.rows();
    for (const auto& name : BarTable::requiredColumns()) {
        if (table.columns.at(name).size() != rows) {
            throw ValidationError(ValidationError::Kind::NULL_VALUES,
                                  "column '" + name + "' has " + std::to_string(table.columns.at(name).size()) +
                                  " values for " + std::to_string(rows) + " rows",
                                  0, {name});
        }
    }

    for (size_t row = 0; row < rows; ++row) {
        if (!table.timestamps[row]) {
            throw ValidationError(ValidationError::Kind::NULL_VALUES,
                                  "null timestamp at row " + std::to_string(row), row, {"timestamp"});
        }
        for (const auto& name : BarTable::requiredColumns()) {
            const auto& cell = table.columns.at(name)[row];
            if (!cell) {
                throw ValidationError(ValidationError::Kind::NULL_VALUES,
                                      "null value in column '" + name + "' at row " + std::to_string(row),
                                      row, {name});
            }
            checkValue(*cell, name.c_str(), row);
        }
        if (row > 0) {
            checkOrder(*table.timestamps[row - 1], *table.timestamps[row], row);
        }
    }
}

void BarSeriesValidator::validate(const BarSeries& bars) {
    for (size_t row = 0; row < bars.size(); ++row) {
        const Bar& bar = bars[row];
        checkValue(bar.open, "open", row);
        checkValue(bar.high, "high", row);
        checkValue(bar.low, "low", row);
        checkValue(bar.close, "close", row);
        checkValue(bar.volume, "volume", row);
        if (row > 0) {
            checkOrder(bars[row - 1].timestamp, bar.timestamp, row);
        }
    }
}

BarSeries BarSeriesValidator::toBars(const BarTable& table) {
    validate(table);

    const auto& open = table.columns.at("open");
    const auto& high = table.columns.at("high");
    const auto& low = table.columns.at("low");
    const auto& close = table.columns.at("close");
    const auto& volume = table.columns.at("volume");

    BarSeries bars;
    bars.reserve(table.rows());
    for (size_t row = 0; row < table.rows(); ++row) {
        bars.emplace_back(*table.timestamps[row], *open[row], *high[row], *low[row], *close[row], *volume[row]);
    }
    return bars;
}

} // namespace backtest
} // namespace replaylab
