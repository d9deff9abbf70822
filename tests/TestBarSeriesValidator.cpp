#include "backtest/BarSeriesValidator.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using replaylab::Bar;
using replaylab::BarSeries;
using replaylab::ValidationError;
using replaylab::backtest::BarSeriesValidator;
using replaylab::backtest::BarTable;

namespace {
constexpr long long T0 = 1704067200000LL;  // 2024-01-01T00:00:00Z
constexpr long long HOUR = 3600000LL;

BarTable makeTable(size_t rows) {
    BarTable table;
    for (size_t i = 0; i < rows; ++i) {
        const double c = 100.0 + static_cast<double>(i);
        table.appendBar(Bar(T0 + static_cast<long long>(i) * HOUR, c, c + 1.0, c - 1.0, c, 1000.0));
    }
    return table;
}

ValidationError::Kind expectFailure(const BarTable& table) {
    try {
        BarSeriesValidator::validate(table);
    } catch (const ValidationError& e) {
        return e.kind();
    }
    assert(false && "validation should have failed");
    return ValidationError::Kind::INVALID_VALUE;
}
}

int main() {
    // well-formed input passes and converts row for row
    {
        const auto table = makeTable(5);
        BarSeriesValidator::validate(table);
        const auto bars = BarSeriesValidator::toBars(table);
        assert(bars.size() == 5);
        assert(bars[2].timestamp == T0 + 2 * HOUR);
        assert(bars[2].close == 102.0);
        assert(bars[2].high == 103.0);
    }

    // an empty table is structurally valid; the engine rejects it later
    {
        BarTable table;
        for (const auto& name : BarTable::requiredColumns()) {
            table.columns[name];
        }
        BarSeriesValidator::validate(table);
    }

    // every missing column is reported at once
    {
        auto table = makeTable(3);
        table.columns.erase("close");
        table.columns.erase("volume");
        bool threw = false;
        try {
            BarSeriesValidator::validate(table);
        } catch (const ValidationError& e) {
            threw = true;
            assert(e.kind() == ValidationError::Kind::MISSING_COLUMNS);
            assert(e.columns().size() == 2);
            assert(e.columns()[0] == "close");
            assert(e.columns()[1] == "volume");
        }
        assert(threw);
    }

    // gap in a price column
    {
        auto table = makeTable(4);
        table.columns["close"][2] = std::nullopt;
        bool threw = false;
        try {
            BarSeriesValidator::validate(table);
        } catch (const ValidationError& e) {
            threw = true;
            assert(e.kind() == ValidationError::Kind::NULL_VALUES);
            assert(e.row() == 2);
            assert(e.columns().size() == 1 && e.columns()[0] == "close");
        }
        assert(threw);
    }

    // NaN counts as a gap, as does a missing timestamp
    {
        auto table = makeTable(3);
        table.columns["volume"][1] = std::numeric_limits<double>::quiet_NaN();
        assert(expectFailure(table) == ValidationError::Kind::NULL_VALUES);

        auto no_time = makeTable(3);
        no_time.timestamps[0] = std::nullopt;
        assert(expectFailure(no_time) == ValidationError::Kind::NULL_VALUES);
    }

    // ragged columns
    {
        auto table = makeTable(3);
        table.columns["open"].pop_back();
        assert(expectFailure(table) == ValidationError::Kind::NULL_VALUES);
    }

    // duplicate and decreasing timestamps
    {
        auto dup = makeTable(4);
        dup.timestamps[2] = dup.timestamps[1];
        bool threw = false;
        try {
            BarSeriesValidator::validate(dup);
        } catch (const ValidationError& e) {
            threw = true;
            assert(e.kind() == ValidationError::Kind::NON_MONOTONIC_TIME);
            assert(e.row() == 2);
        }
        assert(threw);

        BarSeries bars{
            Bar(T0 + HOUR, 1, 1, 1, 1, 1),
            Bar(T0, 1, 1, 1, 1, 1)
        };
        threw = false;
        try {
            BarSeriesValidator::validate(bars);
        } catch (const ValidationError& e) {
            threw = true;
            assert(e.kind() == ValidationError::Kind::NON_MONOTONIC_TIME);
        }
        assert(threw);
    }

    // negative and infinite values
    {
        auto negative = makeTable(3);
        negative.columns["low"][0] = -1.0;
        assert(expectFailure(negative) == ValidationError::Kind::INVALID_VALUE);

        BarSeries bars{
            Bar(T0, 1, 1, 1, 1, 1),
            Bar(T0 + HOUR, 1, std::numeric_limits<double>::infinity(), 1, 1, 1)
        };
        bool threw = false;
        try {
            BarSeriesValidator::validate(bars);
        } catch (const ValidationError& e) {
            threw = true;
            assert(e.kind() == ValidationError::Kind::INVALID_VALUE);
            assert(e.row() == 1);
        }
        assert(threw);
    }

    // toBars refuses invalid input
    {
        auto table = makeTable(3);
        table.columns["high"][1] = std::nullopt;
        bool threw = false;
        try {
            (void)BarSeriesValidator::toBars(table);
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] BarSeriesValidator PASSED\n";
    return 0;
}
