#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace replaylab {
namespace utils {

class TimeUtils {
public:
    // YYYY-MM-DDTHH:MM:SS.mmmZ
    static std::string toIso8601(TimestampMs ts_ms);

    // Accepts YYYY-MM-DD, YYYY-MM-DD[T ]HH:MM[:SS[.fff]] with optional Z / +HH:MM offset
    static std::optional<TimestampMs> parseIso8601(const std::string& text);

    // Epoch numbers in seconds are promoted to milliseconds
    static std::optional<TimestampMs> parseTimestamp(const std::string& text);

    static TimestampMs toMsTimestamp(long long ts);

    static TimestampMs nowMs();

    // Compact wall clock stamp for file names: YYYYmmdd_HHMMSS
    static std::string nowCompactUtc();

    static double hoursBetween(TimestampMs from, TimestampMs to) {
        return static_cast<double>(to - from) / 3600000.0;
    }
};

} // namespace utils
} // namespace replaylab
