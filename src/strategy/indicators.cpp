/**
 * @file indicators.cpp
 * @brief Moving average, RSI and Bollinger band calculations
 */

#include "strategy/indicators.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>

namespace backtester
{
    namespace strategy
    {

        double simple_moving_average(const std::vector<double> &prices, size_t period)
        {
            if (prices.empty())
                return 0.0;
            if (period == 0 || prices.size() < period)
                return prices.back();
            double sum = std::accumulate(prices.end() - static_cast<std::ptrdiff_t>(period), prices.end(), 0.0);
            return sum / static_cast<double>(period);
        }

        double relative_strength_index(const std::vector<double> &prices, size_t period)
        {
            if (period == 0 || prices.size() < period + 1)
                return 50.0;

            std::vector<double> gains;
            std::vector<double> losses;
            gains.reserve(prices.size() - 1);
            losses.reserve(prices.size() - 1);
            for (size_t i = 1; i < prices.size(); ++i)
            {
                double change = prices[i] - prices[i - 1];
                gains.push_back(change > 0.0 ? change : 0.0);
                losses.push_back(change < 0.0 ? -change : 0.0);
            }

            const double p = static_cast<double>(period);
            double avg_gain = std::accumulate(gains.end() - static_cast<std::ptrdiff_t>(period), gains.end(), 0.0) / p;
            double avg_loss = std::accumulate(losses.end() - static_cast<std::ptrdiff_t>(period), losses.end(), 0.0) / p;

            for (size_t i = period; i < gains.size(); ++i)
            {
                avg_gain = ((avg_gain * (p - 1.0)) + gains[i]) / p;
                avg_loss = ((avg_loss * (p - 1.0)) + losses[i]) / p;
            }

            if (avg_loss == 0.0)
                return 100.0;
            double rs = avg_gain / avg_loss;
            return 100.0 - (100.0 / (1.0 + rs));
        }

        BollingerBands bollinger_bands(const std::vector<double> &prices, size_t period, double std_multiplier)
        {
            if (period == 0 || prices.size() < period)
            {
                throw std::invalid_argument("bollinger_bands requires at least 'period' prices");
            }

            auto first = prices.end() - static_cast<std::ptrdiff_t>(period);
            const double p = static_cast<double>(period);
            double middle = std::accumulate(first, prices.end(), 0.0) / p;

            double sum_sq = 0.0;
            for (auto it = first; it != prices.end(); ++it)
                sum_sq += (*it - middle) * (*it - middle);
            double sd = std::sqrt(sum_sq / p);

            BollingerBands bands;
            bands.middle = middle;
            bands.upper = middle + sd * std_multiplier;
            bands.lower = middle - sd * std_multiplier;
            return bands;
        }

    } // namespace strategy
} // namespace backtester
