#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "report/ResultStore.h"
#include "strategy/StrategyRegistry.h"

using namespace replaylab;

namespace {

void printUsage() {
    std::cout << "Usage:\n"
              << "  replaylab --backtest <bars.csv|bars.json> [options]\n"
              << "  replaylab --list-strategies\n"
              << "  replaylab --list-results [--config <path>]\n"
              << "\nOptions:\n"
              << "  --strategy <name>          sma_crossover | rsi_threshold | macd_crossover\n"
              << "  --initial-capital <amount>\n"
              << "  --commission <rate>        per side, e.g. 0.001\n"
              << "  --stop-loss <pct>          enable stop-loss at pct, e.g. 0.02\n"
              << "  --compounding              size positions from realized capital\n"
              << "  --symbol <symbol>          label used for saved results\n"
              << "  --start <YYYY-MM-DD>       first bar date (inclusive)\n"
              << "  --end <YYYY-MM-DD>         last bar date (inclusive)\n"
              << "  --json                     print the full result as JSON\n"
              << "  --save                     write the result under the results directory\n"
              << "  --config <path>            config file (default config/config.json)\n";
}

double parseNumberArg(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    throw ConfigurationError(flag, "invalid value for " + flag + ": " + value);
}

int exitCodeFor(const BacktestError& e) {
    switch (e.code()) {
        case ErrorCode::VALIDATION:
        case ErrorCode::INSUFFICIENT_DATA:
        case ErrorCode::CONFIGURATION:
        case ErrorCode::IO:
            return 2;
        case ErrorCode::SIGNAL_ALIGNMENT:
            return 1;
    }
    return 1;
}

void printSummary(const std::string& symbol, const backtest::BacktestResult& result) {
    const auto& m = result.metrics();
    auto metric = [&](const char* key) {
        auto it = m.find(key);
        return it != m.end() ? it->second : 0.0;
    };

    std::cout << "\nBacktest result: " << result.strategyName();
    if (!symbol.empty()) {
        std::cout << " on " << symbol;
    }
    std::cout << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial capital:  " << metric("initial_capital") << "\n";
    std::cout << "Final equity:     " << metric("final_equity") << "\n";
    std::cout << "Total return:     " << metric("total_return") * 100.0 << "%\n";
    std::cout << "Max drawdown:     " << metric("max_drawdown") * 100.0 << "%\n";
    std::cout << std::setprecision(3);
    std::cout << "Sharpe ratio:     " << metric("sharpe_ratio") << "\n";
    std::cout << std::setprecision(2);
    std::cout << "Trades:           " << static_cast<long long>(metric("total_trades"))
              << " (win " << static_cast<long long>(metric("winning_trades"))
              << " / loss " << static_cast<long long>(metric("losing_trades")) << ")\n";
    std::cout << "Win rate:         " << metric("win_rate") * 100.0 << "%\n";
    std::cout << "Avg duration:     " << metric("avg_trade_duration_hours") << " h\n";
    std::cout << "Profit factor:    " << std::setprecision(3) << metric("profit_factor") << "\n";
    std::cout << std::setprecision(2);
    std::cout << "Expectancy:       " << metric("expectancy") << " /trade\n";
    std::cout << "Commission paid:  " << metric("total_commission") << "\n";
    std::cout << "Exits:            signal=" << static_cast<long long>(metric("signal_exits"))
              << " stop_loss=" << static_cast<long long>(metric("stop_loss_exits"))
              << " final=" << static_cast<long long>(metric("final_exits")) << "\n";
    std::cout << "---------------------------------------------\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        printUsage();
        return 0;
    }
    if (command == "--list-strategies") {
        for (const auto& name : strategy::StrategyRegistry::availableStrategies()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    try {
        std::string config_path = (utils::PathUtils::getConfigDir() / "config.json").string();
        std::string bars_path;
        std::string cli_strategy;
        std::string symbol;
        std::string start_date;
        std::string end_date;
        double cli_initial_capital = -1.0;
        double cli_commission = -1.0;
        double cli_stop_loss = -1.0;
        bool cli_compounding = false;
        bool json_mode = false;
        bool save_result = false;

        int first_option = 2;
        if (command == "--backtest") {
            if (argc < 3) {
                printUsage();
                return 1;
            }
            bars_path = argv[2];
            first_option = 3;
        } else if (command != "--list-results") {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage();
            return 1;
        }

        for (int i = first_option; i < argc; ++i) {
            const std::string arg = argv[i];
            const bool has_value = (i + 1 < argc);
            if (arg == "--json") {
                json_mode = true;
            } else if (arg == "--save") {
                save_result = true;
            } else if (arg == "--compounding") {
                cli_compounding = true;
            } else if (arg == "--config" && has_value) {
                config_path = argv[++i];
            } else if (arg == "--strategy" && has_value) {
                cli_strategy = argv[++i];
            } else if (arg == "--symbol" && has_value) {
                symbol = argv[++i];
            } else if (arg == "--start" && has_value) {
                start_date = argv[++i];
            } else if (arg == "--end" && has_value) {
                end_date = argv[++i];
            } else if (arg == "--initial-capital" && has_value) {
                cli_initial_capital = parseNumberArg(arg, argv[++i]);
            } else if (arg == "--commission" && has_value) {
                cli_commission = parseNumberArg(arg, argv[++i]);
            } else if (arg == "--stop-loss" && has_value) {
                cli_stop_loss = parseNumberArg(arg, argv[++i]);
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                printUsage();
                return 1;
            }
        }

        auto& config = Config::getInstance();
        config.load(config_path);

        // JSON output owns stdout, so console logging stays quiet there
        Logger::getInstance().initialize(config.getLogDirectory(), json_mode ? "warn" : config.getLogLevel());

        report::ResultStore store(config.getResultsDirectory());

        if (command == "--list-results") {
            for (const auto& name : store.listAvailable()) {
                std::cout << name << "\n";
            }
            return 0;
        }

        auto bt_config = config.getBacktestConfig();
        if (cli_initial_capital >= 0.0) {
            bt_config.initial_capital = cli_initial_capital;
        }
        if (cli_commission >= 0.0) {
            bt_config.commission_rate = cli_commission;
        }
        if (cli_stop_loss >= 0.0) {
            bt_config.use_stop_loss = true;
            bt_config.stop_loss_pct = cli_stop_loss;
        }
        if (cli_compounding) {
            bt_config.sizing_policy = SizingPolicy::COMPOUNDING;
        }
        bt_config.validate();

        const std::string strategy_name = cli_strategy.empty() ? config.getDefaultStrategy() : cli_strategy;
        auto strat = strategy::StrategyRegistry::create(strategy_name, config);

        LOG_INFO("Starting backtest with file: {}", bars_path);
        auto table = backtest::DataHistory::load(bars_path);
        if (!start_date.empty() || !end_date.empty()) {
            table = backtest::DataHistory::filterByDate(table, start_date, end_date);
        }

        backtest::BacktestEngine engine;
        const auto result = engine.run(*strat, table, bt_config);

        report::ResultMetadata metadata;
        metadata.symbol = symbol.empty() ? std::filesystem::path(bars_path).stem().string() : symbol;
        metadata.strategy = strat->getName();
        metadata.start_date = start_date;
        metadata.end_date = end_date;

        if (save_result) {
            const auto saved = store.save(result, metadata);
            if (!json_mode) {
                std::cout << "Saved: " << saved.string() << "\n";
            }
        }

        if (json_mode) {
            std::cout << report::ResultStore::toJson(result, metadata).dump(2) << "\n";
            return 0;
        }

        printSummary(metadata.symbol, result);
        return 0;
    } catch (const BacktestError& e) {
        LOG_ERROR("Backtest aborted ({}): {}", errorCodeToString(e.code()), e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return exitCodeFor(e);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
