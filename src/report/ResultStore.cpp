#include "report/ResultStore.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace replaylab {
namespace report {

namespace {
const char* FILE_PREFIX = "backtest_";
const char* FILE_SUFFIX = ".json";

std::string safeFileToken(const std::string& value) {
    std::string out = value.empty() ? std::string("unknown") : value;
    for (char& c : out) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '.';
        if (!ok) c = '_';
    }
    return out;
}

TimestampMs isoField(const nlohmann::json& j, const char* key) {
    const auto text = j.at(key).get<std::string>();
    const auto ts = utils::TimeUtils::parseIso8601(text);
    if (!ts) {
        throw DataIoError(std::string("invalid timestamp in field '") + key + "': " + text);
    }
    return *ts;
}

Signal signalFromString(const std::string& value) {
    if (value == "long") return Signal::Long;
    if (value == "short") return Signal::Short;
    if (value == "flat") return Signal::Flat;
    throw DataIoError("unknown side: " + value);
}

ExitReason exitReasonFromString(const std::string& value) {
    if (value == "signal") return ExitReason::SIGNAL;
    if (value == "stop_loss") return ExitReason::STOP_LOSS;
    if (value == "final") return ExitReason::FINAL;
    throw DataIoError("unknown exit reason: " + value);
}
} // namespace

ResultStore::ResultStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
}

nlohmann::json ResultStore::toJson(const backtest::BacktestResult& result, const ResultMetadata& metadata) {
    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : result.trades()) {
        nlohmann::json item;
        item["entry_time"] = utils::TimeUtils::toIso8601(t.entry_time);
        item["entry_price"] = t.entry_price;
        item["exit_time"] = utils::TimeUtils::toIso8601(t.exit_time);
        item["exit_price"] = t.exit_price;
        item["side"] = signalToString(t.side);
        item["size"] = t.size;
        item["gross_pnl"] = t.gross_pnl;
        item["commission"] = t.commission;
        item["net_pnl"] = t.net_pnl;
        item["exit_reason"] = exitReasonToString(t.exit_reason);
        trades.push_back(std::move(item));
    }

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& p : result.equityCurve()) {
        nlohmann::json item;
        item["timestamp"] = utils::TimeUtils::toIso8601(p.timestamp);
        item["realized_capital"] = p.realized_capital;
        item["mark_to_market_value"] = p.mark_to_market_value;
        item["position_side"] = signalToString(p.position_side);
        curve.push_back(std::move(item));
    }

    nlohmann::json metrics = nlohmann::json::object();
    for (const auto& kv : result.metrics()) {
        metrics[kv.first] = kv.second;
    }

    nlohmann::json j;
    j["metadata"] = {
        {"symbol", metadata.symbol},
        {"strategy", metadata.strategy.empty() ? result.strategyName() : metadata.strategy},
        {"start_date", metadata.start_date},
        {"end_date", metadata.end_date},
        {"generated_at", metadata.generated_at}
    };
    j["results"] = {
        {"trades", trades},
        {"equity_curve", curve},
        {"metrics", metrics}
    };
    return j;
}

StoredResult ResultStore::fromJson(const nlohmann::json& j) {
    try {
        const auto& meta = j.at("metadata");
        const auto& res = j.at("results");

        StoredResult stored;
        stored.metadata.symbol = meta.value("symbol", std::string());
        stored.metadata.strategy = meta.value("strategy", std::string());
        stored.metadata.start_date = meta.value("start_date", std::string());
        stored.metadata.end_date = meta.value("end_date", std::string());
        stored.metadata.generated_at = meta.value("generated_at", std::string());

        std::vector<backtest::Trade> trades;
        for (const auto& item : res.at("trades")) {
            backtest::Trade t;
            t.entry_time = isoField(item, "entry_time");
            t.entry_price = item.at("entry_price").get<double>();
            t.exit_time = isoField(item, "exit_time");
            t.exit_price = item.at("exit_price").get<double>();
            t.side = signalFromString(item.at("side").get<std::string>());
            t.size = item.at("size").get<double>();
            t.gross_pnl = item.at("gross_pnl").get<double>();
            t.commission = item.at("commission").get<double>();
            t.net_pnl = item.at("net_pnl").get<double>();
            t.exit_reason = exitReasonFromString(item.at("exit_reason").get<std::string>());
            trades.push_back(t);
        }

        std::vector<backtest::EquityPoint> curve;
        for (const auto& item : res.at("equity_curve")) {
            backtest::EquityPoint p;
            p.timestamp = isoField(item, "timestamp");
            p.realized_capital = item.at("realized_capital").get<double>();
            p.mark_to_market_value = item.at("mark_to_market_value").get<double>();
            p.position_side = signalFromString(item.at("position_side").get<std::string>());
            curve.push_back(p);
        }

        backtest::MetricsMap metrics;
        for (const auto& kv : res.at("metrics").items()) {
            metrics[kv.key()] = kv.value().is_number() ? kv.value().get<double>() : 0.0;
        }

        stored.result = backtest::BacktestResult(stored.metadata.strategy, std::move(trades),
                                                 std::move(curve), std::move(metrics));
        return stored;
    } catch (const nlohmann::json::exception& e) {
        throw DataIoError(std::string("malformed backtest result: ") + e.what());
    }
}

std::filesystem::path ResultStore::save(const backtest::BacktestResult& result, ResultMetadata metadata) const {
    if (metadata.generated_at.empty()) {
        metadata.generated_at = utils::TimeUtils::toIso8601(utils::TimeUtils::nowMs());
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw DataIoError("cannot create results directory " + directory_.string() + ": " + ec.message());
    }

    const std::string stem = FILE_PREFIX + safeFileToken(metadata.symbol) + "_" + utils::TimeUtils::nowCompactUtc();
    std::filesystem::path path = directory_ / (stem + FILE_SUFFIX);
    for (int n = 1; std::filesystem::exists(path); ++n) {
        path = directory_ / (stem + "_" + std::to_string(n) + FILE_SUFFIX);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw DataIoError("cannot write backtest result: " + path.string());
    }
    out << toJson(result, metadata).dump(2) << "\n";
    if (!out) {
        throw DataIoError("write failed: " + path.string());
    }

    LOG_INFO("Backtest result saved: {}", path.string());
    return path;
}

StoredResult ResultStore::load(const std::string& filename) const {
    std::filesystem::path path(filename);
    if (!path.is_absolute()) {
        path = directory_ / path;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw DataIoError("backtest result not found: " + path.string());
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw DataIoError("malformed JSON in " + path.string() + ": " + e.what());
    }
    return fromJson(j);
}

std::vector<std::string> ResultStore::listAvailable() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return names;
    }

    const std::string prefix(FILE_PREFIX);
    const std::string suffix(FILE_SUFFIX);
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.size() >= prefix.size() + suffix.size() &&
            name.compare(0, prefix.size(), prefix) == 0 &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace report
} // namespace replaylab
