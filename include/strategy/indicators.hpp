/**
 * @file indicators.hpp
 * @brief Technical indicators over a price window (oldest first).
 */

#ifndef BACKTESTER_STRATEGY_INDICATORS_HPP
#define BACKTESTER_STRATEGY_INDICATORS_HPP

#include <cstddef>
#include <vector>

namespace backtester
{
    namespace strategy
    {

        /**
         * @struct BollingerBands
         * @brief Middle band (SMA) and bands at +/- k population standard deviations.
         */
        struct BollingerBands
        {
            double upper = 0.0;
            double middle = 0.0;
            double lower = 0.0;
        };

        /**
         * @brief Simple moving average of the last `period` prices.
         * @return The mean, or the last price when fewer than `period` prices
         *         exist (0 for an empty window).
         */
        double simple_moving_average(const std::vector<double> &prices, size_t period);

        /**
         * @brief Relative strength index with Wilder smoothing.
         *
         * The seed averages are the mean gain/loss of the last `period` changes;
         * Wilder smoothing is then applied over changes from index `period` on.
         *
         * @return RSI in [0, 100]; 50 when fewer than period + 1 prices exist;
         *         100 when the average loss is zero.
         */
        double relative_strength_index(const std::vector<double> &prices, size_t period);

        /**
         * @brief Bollinger bands over the last `period` prices.
         * @pre prices.size() >= period and period > 0.
         */
        BollingerBands bollinger_bands(const std::vector<double> &prices, size_t period, double std_multiplier);

    } // namespace strategy
} // namespace backtester

#endif // BACKTESTER_STRATEGY_INDICATORS_HPP
