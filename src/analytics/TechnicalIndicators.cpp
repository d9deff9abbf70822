#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace replaylab {
namespace analytics {

double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // Seed with the plain average of the first period changes
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    // Wilder smoothing for the rest
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss < 0.0000001) {
        // No movement at all reads as neutral
        return (avg_gain < 0.0000001) ? 50.0 : 100.0;
    }

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;

    if (fast <= 0 || slow <= 0 || signal_period <= 0 ||
        prices.size() < static_cast<size_t>(slow + signal_period)) {
        return result;
    }

    auto fast_ema_vec = calculateEMAVector(prices, fast);
    auto slow_ema_vec = calculateEMAVector(prices, slow);
    if (fast_ema_vec.empty() || slow_ema_vec.empty()) return result;

    // Align both EMA series on their most recent values
    std::vector<double> macd_series;
    size_t min_size = std::min(fast_ema_vec.size(), slow_ema_vec.size());
    size_t offset_fast = fast_ema_vec.size() - min_size;
    size_t offset_slow = slow_ema_vec.size() - min_size;
    macd_series.reserve(min_size);

    for (size_t i = 0; i < min_size; ++i) {
        macd_series.push_back(fast_ema_vec[offset_fast + i] - slow_ema_vec[offset_slow + i]);
    }

    if (macd_series.size() < static_cast<size_t>(signal_period)) return result;

    result.macd = macd_series.back();
    result.signal = calculateEMA(macd_series, signal_period);
    result.histogram = result.macd - result.signal;
    result.valid = true;

    return result;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    if (prices.empty() || period <= 0) return 0.0;
    if (prices.size() < static_cast<size_t>(period)) return prices.back();

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += prices[i];
    }
    ema /= period;

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
    }

    return ema;
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return ema_values;

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;

    ema_values.reserve(prices.size() - period + 1);
    ema_values.push_back(ema);

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.size() < 2) return 0.0;

    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

std::vector<double> TechnicalIndicators::extractClosePrices(const Bar* bars, size_t count) {
    std::vector<double> prices;
    prices.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        prices.push_back(bars[i].close);
    }

    return prices;
}

} // namespace analytics
} // namespace replaylab
