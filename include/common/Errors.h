#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace replaylab {

enum class ErrorCode {
    VALIDATION,
    INSUFFICIENT_DATA,
    SIGNAL_ALIGNMENT,
    CONFIGURATION,
    IO
};

const char* errorCodeToString(ErrorCode code);

// Base of every error a run can surface. All of them are fatal to the run.
class BacktestError : public std::runtime_error {
public:
    BacktestError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ValidationError : public BacktestError {
public:
    enum class Kind {
        MISSING_COLUMNS,
        NULL_VALUES,
        NON_MONOTONIC_TIME,
        INVALID_VALUE,
        STRATEGY_FAILURE
    };

    ValidationError(Kind kind, const std::string& message, std::size_t row = 0,
                    std::vector<std::string> columns = {})
        : BacktestError(ErrorCode::VALIDATION, message)
        , kind_(kind)
        , row_(row)
        , columns_(std::move(columns)) {}

    Kind kind() const { return kind_; }
    // Offending row index (0 when not applicable)
    std::size_t row() const { return row_; }
    const std::vector<std::string>& columns() const { return columns_; }

private:
    Kind kind_;
    std::size_t row_;
    std::vector<std::string> columns_;
};

class InsufficientDataError : public BacktestError {
public:
    explicit InsufficientDataError(std::size_t bar_count);

    std::size_t barCount() const { return bar_count_; }

private:
    std::size_t bar_count_;
};

class SignalAlignmentError : public BacktestError {
public:
    SignalAlignmentError(std::size_t expected, std::size_t actual);

    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

private:
    std::size_t expected_;
    std::size_t actual_;
};

class ConfigurationError : public BacktestError {
public:
    ConfigurationError(const std::string& parameter, const std::string& message)
        : BacktestError(ErrorCode::CONFIGURATION, message), parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

class DataIoError : public BacktestError {
public:
    explicit DataIoError(const std::string& message)
        : BacktestError(ErrorCode::IO, message) {}
};

} // namespace replaylab
