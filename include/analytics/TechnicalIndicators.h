#pragma once

#include <cstddef>
#include <vector>
#include "common/Types.h"

namespace replaylab {
namespace analytics {

// Indicator formulas used by the example strategies.
// Every function only reads the values it is given; callers pass past data only.
class TechnicalIndicators {
public:
    // RSI with Wilder smoothing. 50 when there is not enough data,
    // 100 when there were no losses over the window.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    struct MACDResult {
        double macd;        // fast EMA - slow EMA
        double signal;      // EMA of the MACD line
        double histogram;   // macd - signal
        bool valid;         // false until slow + signal_period prices are available

        MACDResult() : macd(0), signal(0), histogram(0), valid(false) {}
    };
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);

    // EMA seeded with the SMA of the first period values
    static double calculateEMA(const std::vector<double>& prices, int period);
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    // Mean of the last period values, 0 when fewer are available
    static double calculateSMA(const std::vector<double>& prices, int period);

    static double calculateMean(const std::vector<double>& values);
    // Sample standard deviation (n - 1), 0 for fewer than two values
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);

    static std::vector<double> extractClosePrices(const Bar* bars, size_t count);
};

} // namespace analytics
} // namespace replaylab
