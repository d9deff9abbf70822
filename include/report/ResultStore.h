#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/BacktestResult.h"

namespace replaylab {
namespace report {

struct ResultMetadata {
    std::string symbol;
    std::string strategy;
    std::string start_date;
    std::string end_date;
    std::string generated_at;   // ISO-8601, filled on save when empty
};

struct StoredResult {
    ResultMetadata metadata;
    backtest::BacktestResult result;
};

// Persists results as JSON files named backtest_<symbol>_<YYYYmmdd_HHMMSS>.json.
// Timestamps are ISO-8601 UTC, money is plain decimal numbers.
class ResultStore {
public:
    explicit ResultStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const { return directory_; }

    static nlohmann::json toJson(const backtest::BacktestResult& result, const ResultMetadata& metadata);
    // Throws DataIoError when required fields are missing or malformed
    static StoredResult fromJson(const nlohmann::json& j);

    // Returns the written file path. Throws DataIoError on write failure.
    std::filesystem::path save(const backtest::BacktestResult& result, ResultMetadata metadata) const;

    // filename is relative to the store directory unless absolute
    StoredResult load(const std::string& filename) const;

    // backtest_*.json file names, sorted
    std::vector<std::string> listAvailable() const;

private:
    std::filesystem::path directory_;
};

} // namespace report
} // namespace replaylab
