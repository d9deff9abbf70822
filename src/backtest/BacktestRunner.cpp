#include "backtest/BacktestRunner.h"
#include "common/Logger.h"

#include <exception>
#include <future>
#include <stdexcept>

namespace replaylab {
namespace backtest {

std::vector<BacktestResult> BacktestRunner::runAll(const std::vector<BacktestJob>& jobs) {
    for (const auto& job : jobs) {
        if (!job.strategy || !job.bars) {
            throw std::invalid_argument("backtest job '" + job.label + "' has no strategy or bars");
        }
    }

    LOG_INFO("Running {} backtest jobs", jobs.size());

    std::vector<std::future<BacktestResult>> futures;
    futures.reserve(jobs.size());
    for (const auto& job : jobs) {
        futures.push_back(std::async(std::launch::async, [&job]() {
            BacktestEngine engine;
            return engine.run(*job.strategy, *job.bars, job.config);
        }));
    }

    std::vector<BacktestResult> results;
    results.reserve(jobs.size());
    std::exception_ptr first_error;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            LOG_ERROR("Backtest job '{}' failed: {}", jobs[i].label, e.what());
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return results;
}

} // namespace backtest
} // namespace replaylab
