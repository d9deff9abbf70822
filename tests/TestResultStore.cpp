#include "backtest/BacktestEngine.h"
#include "common/Errors.h"
#include "report/ResultStore.h"

#include <spdlog/spdlog.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace replaylab;
using report::ResultMetadata;
using report::ResultStore;

namespace {
constexpr long long T0 = 1704067200000LL;
constexpr long long HOUR = 3600000LL;

backtest::BacktestResult sampleResult() {
    const double closes[] = {100, 102, 101, 105, 103, 99, 98};
    BarSeries bars;
    for (size_t i = 0; i < 7; ++i) {
        const double c = closes[i];
        bars.emplace_back(T0 + static_cast<long long>(i) * HOUR, c, c + 1.0, c - 1.0, c, 1000.0);
    }
    const Signal F = Signal::Flat, L = Signal::Long, S = Signal::Short;
    backtest::BacktestEngine engine;
    return engine.runWithSignals({F, L, L, F, S, S, S}, bars, backtest::BacktestConfig(), "sma_crossover");
}
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    const auto result = sampleResult();
    assert(result.trades().size() == 2);

    ResultMetadata meta;
    meta.symbol = "BTC/USDT";
    meta.strategy = "sma_crossover";
    meta.start_date = "2024-01-01";
    meta.end_date = "2024-01-02";
    meta.generated_at = "2024-02-01T12:00:00.000Z";

    // document layout
    {
        const auto j = ResultStore::toJson(result, meta);
        assert(j["metadata"]["symbol"] == "BTC/USDT");
        assert(j["metadata"]["strategy"] == "sma_crossover");
        assert(j["metadata"]["generated_at"] == "2024-02-01T12:00:00.000Z");

        const auto& trades = j["results"]["trades"];
        assert(trades.size() == 2);
        assert(trades[0]["entry_time"] == "2024-01-01T01:00:00.000Z");
        assert(trades[0]["side"] == "long");
        assert(trades[0]["exit_reason"] == "signal");
        assert(trades[1]["side"] == "short");
        assert(trades[1]["exit_reason"] == "final");
        assert(trades[0]["net_pnl"].is_number_float());

        assert(j["results"]["equity_curve"].size() == 6);
        assert(j["results"]["metrics"].contains("sharpe_ratio"));
        assert(j["results"]["metrics"].contains("max_drawdown"));

        // stable for identical input
        assert(ResultStore::toJson(result, meta).dump() == j.dump());
    }

    const auto dir = std::filesystem::temp_directory_path() / "replaylab_store_test";
    std::filesystem::remove_all(dir);
    ResultStore store(dir);

    // save, list, load
    {
        assert(store.listAvailable().empty());

        const auto first = store.save(result, meta);
        const auto second = store.save(result, meta);
        assert(std::filesystem::exists(first));
        assert(first != second);
        const std::string name = first.filename().string();
        assert(name.rfind("backtest_BTC_USDT_", 0) == 0);
        assert(name.size() > 5 && name.substr(name.size() - 5) == ".json");

        {
            std::ofstream other(dir / "notes.txt");
            other << "not a result";
        }
        const auto names = store.listAvailable();
        assert(names.size() == 2);
        assert(names[0] < names[1]);

        const auto loaded = store.load(name);
        assert(loaded.metadata.symbol == "BTC/USDT");
        assert(loaded.metadata.start_date == "2024-01-01");
        assert(loaded.result.trades().size() == result.trades().size());
        for (size_t i = 0; i < result.trades().size(); ++i) {
            const auto& a = result.trades()[i];
            const auto& b = loaded.result.trades()[i];
            assert(a.entry_time == b.entry_time);
            assert(a.exit_time == b.exit_time);
            assert(a.side == b.side);
            assert(a.exit_reason == b.exit_reason);
            assert(a.net_pnl == b.net_pnl);
        }
        assert(loaded.result.equityCurve().size() == result.equityCurve().size());
        assert(loaded.result.metric("final_equity") == result.metric("final_equity"));

        // absolute path works too
        assert(store.load(first.string()).result.trades().size() == 2);
    }

    // save fills generated_at when the caller leaves it empty
    {
        ResultMetadata bare;
        bare.symbol = "ETH";
        const auto path = store.save(result, bare);
        const auto loaded = store.load(path.filename().string());
        assert(!loaded.metadata.generated_at.empty());
        assert(loaded.metadata.strategy == "sma_crossover");
    }

    // failures
    {
        bool threw = false;
        try {
            store.load("backtest_missing.json");
        } catch (const DataIoError&) {
            threw = true;
        }
        assert(threw);

        {
            std::ofstream broken(dir / "backtest_broken.json");
            broken << "{\"metadata\": {}}";
        }
        threw = false;
        try {
            store.load("backtest_broken.json");
        } catch (const DataIoError&) {
            threw = true;
        }
        assert(threw);
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] ResultStore PASSED\n";
    return 0;
}
