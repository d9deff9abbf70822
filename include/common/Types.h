#pragma once

#include <string>
#include <vector>

namespace replaylab {

using Price = double;
using Volume = double;
using Amount = double;

// Milliseconds since the Unix epoch (UTC)
using TimestampMs = long long;

// Trading signal / position side. The numeric value is the PnL direction.
enum class Signal : int {
    Short = -1,
    Flat = 0,
    Long = 1
};

inline int sideValue(Signal s) { return static_cast<int>(s); }

inline const char* signalToString(Signal s) {
    switch (s) {
        case Signal::Short: return "short";
        case Signal::Flat: return "flat";
        case Signal::Long: return "long";
    }
    return "flat";
}

enum class ExitReason {
    SIGNAL,
    STOP_LOSS,
    FINAL
};

inline const char* exitReasonToString(ExitReason r) {
    switch (r) {
        case ExitReason::SIGNAL: return "signal";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::FINAL: return "final";
    }
    return "signal";
}

enum class SizingPolicy {
    FIXED_INITIAL,  // fraction of initial capital, never compounded
    COMPOUNDING     // fraction of realized capital at entry
};

struct Bar {
    TimestampMs timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(TimestampMs t, double o, double h, double l, double c, double v)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

using BarSeries = std::vector<Bar>;

} // namespace replaylab
