/**
 * @file synthetic_data_generator.cpp
 * @brief Implementation of SyntheticDataGenerator.
 */

#include "data/synthetic_data_generator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace backtester
{
    namespace data
    {

        namespace
        {

            constexpr double PI = 3.14159265358979323846;
            constexpr double MINUTES_PER_YEAR = 60.0 * 24.0 * 365.0;

            void validate_interval(int interval_minutes)
            {
                if (interval_minutes <= 0)
                {
                    throw std::invalid_argument(
                        "Expected positive value for parameter 'interval_minutes', got: " + std::to_string(interval_minutes));
                }
            }

        } // anonymous namespace

        double SyntheticDataGenerator::uniform(std::mt19937_64 &rng)
        {
            std::uniform_real_distribution<double> dist(0.0, 1.0);
            return dist(rng);
        }

        double SyntheticDataGenerator::time_step_years(int interval_minutes)
        {
            return static_cast<double>(interval_minutes) / MINUTES_PER_YEAR;
        }

        double SyntheticDataGenerator::normal_random(std::mt19937_64 &rng)
        {
            double u = 0.0;
            double v = 0.0;
            while (u == 0.0)
                u = uniform(rng);
            while (v == 0.0)
                v = uniform(rng);
            return std::sqrt(-2.0 * std::log(u)) * std::cos(2.0 * PI * v);
        }

        // ===================================================================
        // Single asset
        // ===================================================================

        std::vector<MarketData> SyntheticDataGenerator::generate_ohlc_data(
            const std::string &symbol,
            const Timestamp &start,
            const Timestamp &end,
            int interval_minutes,
            double initial_price,
            double volatility,
            double trend,
            double volume_base,
            std::uint64_t seed)
        {
            validate_interval(interval_minutes);
            if (!(initial_price > 0.0))
            {
                std::ostringstream ss;
                ss << initial_price;
                throw std::invalid_argument("Expected positive value for parameter 'initial_price', got: " + ss.str());
            }
            if (volatility < 0.0)
            {
                std::ostringstream ss;
                ss << volatility;
                throw std::invalid_argument("Expected non-negative value for parameter 'volatility', got: " + ss.str());
            }

            std::mt19937_64 rng(seed);
            std::vector<MarketData> data;
            const auto step = std::chrono::minutes(interval_minutes);
            const double dt = time_step_years(interval_minutes);
            double last_price = initial_price;

            for (Timestamp t = start; t <= end; t += step)
            {
                double shock = normal_random(rng) * std::sqrt(dt);
                double change = trend * dt + volatility * shock;
                double close = last_price * std::exp(change);
                double open = last_price;

                double max_price = std::max(open, close);
                double min_price = std::min(open, close);
                double range = std::abs(close - open);

                MarketData bar;
                bar.timestamp = t;
                bar.symbol = symbol;
                bar.open = open;
                bar.close = close;
                bar.high = max_price + uniform(rng) * range * 0.5;
                bar.low = min_price - uniform(rng) * range * 0.5;

                double move = std::abs((close - open) / open);
                double volume_multiplier = 1.0 + move * 2.0 + (uniform(rng) - 0.5) * 0.5;
                bar.volume = std::max(0.0, std::round(volume_base * volume_multiplier));
                bar.vwap = (bar.high + bar.low + bar.close) / 3.0;

                data.push_back(bar);
                last_price = close;
            }

            return data;
        }

        // ===================================================================
        // Correlated assets
        // ===================================================================

        std::vector<MarketData> SyntheticDataGenerator::generate_correlated_data(
            const std::vector<std::string> &symbols,
            const Timestamp &start,
            const Timestamp &end,
            const Eigen::MatrixXd &correlation_matrix,
            const CorrelatedAssetParams &params,
            int interval_minutes,
            std::uint64_t seed)
        {
            const Eigen::Index n = static_cast<Eigen::Index>(symbols.size());
            if (n == 0 ||
                correlation_matrix.rows() != n ||
                correlation_matrix.cols() != n ||
                params.initial_prices.size() != n ||
                params.volatilities.size() != n ||
                params.trends.size() != n)
            {
                throw std::invalid_argument("Dimension mismatch in parameters");
            }
            validate_interval(interval_minutes);

            Eigen::LLT<Eigen::MatrixXd> llt(correlation_matrix);
            if (llt.info() != Eigen::Success)
            {
                throw std::invalid_argument("Correlation matrix is not positive definite");
            }
            const Eigen::MatrixXd lower = llt.matrixL();

            std::mt19937_64 rng(seed);
            std::vector<MarketData> all;
            const auto step = std::chrono::minutes(interval_minutes);
            const double dt = time_step_years(interval_minutes);
            Eigen::VectorXd last_prices = params.initial_prices;
            Eigen::VectorXd independent(n);

            for (Timestamp t = start; t <= end; t += step)
            {
                for (Eigen::Index i = 0; i < n; ++i)
                    independent[i] = normal_random(rng);
                Eigen::VectorXd correlated = lower * independent;

                for (Eigen::Index i = 0; i < n; ++i)
                {
                    double shock = correlated[i] * std::sqrt(dt);
                    double change = params.trends[i] * dt + params.volatilities[i] * shock;
                    double open = last_prices[i];
                    double close = open * std::exp(change);
                    double range = std::abs(close - open);

                    MarketData bar;
                    bar.timestamp = t;
                    bar.symbol = symbols[static_cast<size_t>(i)];
                    bar.open = open;
                    bar.close = close;
                    bar.high = std::max(open, close) + uniform(rng) * range * 0.3;
                    bar.low = std::min(open, close) - uniform(rng) * range * 0.3;
                    bar.volume = std::max(0.0, std::round(1000000.0 * (1.0 + uniform(rng))));
                    bar.vwap = (bar.high + bar.low + bar.close) / 3.0;

                    all.push_back(bar);
                    last_prices[i] = close;
                }
            }

            // already in timestamp order; stable sort keeps symbol order per timestamp
            std::stable_sort(all.begin(), all.end(),
                             [](const MarketData &a, const MarketData &b)
                             { return a.timestamp < b.timestamp; });
            return all;
        }

        // ===================================================================
        // Crash scenario
        // ===================================================================

        std::vector<MarketData> SyntheticDataGenerator::generate_crash_scenario(
            const std::string &symbol,
            const Timestamp &normal_start,
            const Timestamp &crash_start,
            const Timestamp &crash_end,
            const Timestamp &recovery_end,
            int interval_minutes,
            std::uint64_t seed)
        {
            if (!(normal_start <= crash_start && crash_start <= crash_end && crash_end <= recovery_end))
            {
                throw std::invalid_argument(
                    "Crash scenario phases must satisfy normal_start <= crash_start <= crash_end <= recovery_end");
            }

            std::vector<MarketData> data = generate_ohlc_data(
                symbol, normal_start, crash_start, interval_minutes, 100.0, 0.015, 0.0002, 1000000.0, seed);
            double pre_crash = data.back().close;

            std::vector<MarketData> crash = generate_ohlc_data(
                symbol, crash_start, crash_end, interval_minutes, pre_crash, 0.08, -0.02, 2000000.0, seed + 1);
            double post_crash = crash.back().close;
            data.insert(data.end(), crash.begin(), crash.end());

            std::vector<MarketData> recovery = generate_ohlc_data(
                symbol, crash_end, recovery_end, interval_minutes, post_crash, 0.04, 0.001, 1500000.0, seed + 2);
            data.insert(data.end(), recovery.begin(), recovery.end());

            return data;
        }

    } // namespace data
} // namespace backtester
