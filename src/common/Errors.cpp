#include "common/Errors.h"

namespace replaylab {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION: return "VALIDATION";
        case ErrorCode::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case ErrorCode::SIGNAL_ALIGNMENT: return "SIGNAL_ALIGNMENT";
        case ErrorCode::CONFIGURATION: return "CONFIGURATION";
        case ErrorCode::IO: return "IO";
    }
    return "VALIDATION";
}

InsufficientDataError::InsufficientDataError(std::size_t bar_count)
    : BacktestError(ErrorCode::INSUFFICIENT_DATA,
                    "at least 2 bars are required to simulate, got " + std::to_string(bar_count))
    , bar_count_(bar_count) {}

SignalAlignmentError::SignalAlignmentError(std::size_t expected, std::size_t actual)
    : BacktestError(ErrorCode::SIGNAL_ALIGNMENT,
                    "strategy produced " + std::to_string(actual) +
                    " signals for " + std::to_string(expected) + " bars")
    , expected_(expected)
    , actual_(actual) {}

} // namespace replaylab
