/**
 * @file synthetic_data_generator.hpp
 * @brief Synthetic OHLCV bar generation for testing and scenario analysis.
 *
 * Prices follow geometric Brownian motion:
 *
 *   close = open * exp(trend * dt + volatility * sqrt(dt) * Z)
 *
 * with Z a standard normal draw (Box-Muller) and dt the bar interval in
 * years (minutes / 525600). All generators take an explicit seed so a
 * series can be regenerated bit for bit.
 */

#ifndef BACKTESTER_DATA_SYNTHETIC_DATA_GENERATOR_HPP
#define BACKTESTER_DATA_SYNTHETIC_DATA_GENERATOR_HPP

#include "data/market_data.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace backtester
{
    namespace data
    {

        /**
         * @struct CorrelatedAssetParams
         * @brief Per-asset parameters for correlated generation (one entry per symbol).
         */
        struct CorrelatedAssetParams
        {
            Eigen::VectorXd initial_prices; ///< Starting price per asset
            Eigen::VectorXd volatilities;   ///< Annualized volatility per asset
            Eigen::VectorXd trends;         ///< Annualized drift per asset
        };

        /**
         * @class SyntheticDataGenerator
         * @brief Static generators for single-asset, correlated and crash series.
         *
         * Usage:
         * @code
         *   auto bars = SyntheticDataGenerator::generate_ohlc_data(
         *       "BTC", parse_timestamp("2024-01-01"), parse_timestamp("2024-01-31"), 1440);
         *   HistoricalDataSimulator sim(bars);
         * @endcode
         */
        class SyntheticDataGenerator
        {
        public:
            static constexpr std::uint64_t DEFAULT_SEED = 42;

            /**
             * @brief Generate a single-asset GBM series.
             * @param symbol Symbol stamped on every bar.
             * @param start First bar timestamp.
             * @param end Last timestamp (inclusive).
             * @param interval_minutes Bar spacing in minutes (must be > 0).
             * @param initial_price Open of the first bar (must be > 0).
             * @param volatility Annualized volatility (>= 0).
             * @param trend Annualized drift.
             * @param volume_base Volume of a bar with no price move.
             * @param seed RNG seed.
             * @throws std::invalid_argument on invalid parameters.
             *
             * @note High/low extend the open/close range by up to half the bar's
             *       absolute move. Volume grows with the magnitude of the move.
             */
            static std::vector<MarketData> generate_ohlc_data(
                const std::string &symbol,
                const Timestamp &start,
                const Timestamp &end,
                int interval_minutes = 1,
                double initial_price = 100.0,
                double volatility = 0.02,
                double trend = 0.0001,
                double volume_base = 1000000.0,
                std::uint64_t seed = DEFAULT_SEED);

            /**
             * @brief Generate correlated multi-asset GBM series.
             *
             * Independent standard-normal shocks are mapped through the Cholesky
             * factor L of the correlation matrix (shocks = L * z) before each
             * asset's price is evolved. Output is sorted by timestamp, with
             * symbols in input order within a timestamp.
             *
             * @throws std::invalid_argument if the symbol count, matrix dimensions
             *         and parameter vector sizes disagree, or if the matrix is not
             *         positive definite. Validation runs before any generation.
             */
            static std::vector<MarketData> generate_correlated_data(
                const std::vector<std::string> &symbols,
                const Timestamp &start,
                const Timestamp &end,
                const Eigen::MatrixXd &correlation_matrix,
                const CorrelatedAssetParams &params,
                int interval_minutes = 1,
                std::uint64_t seed = DEFAULT_SEED);

            /**
             * @brief Generate a normal / crash / recovery scenario.
             *
             * Phases, each seeded with the previous phase's final close:
             *   - normal:   [normal_start, crash_start], vol 0.015, trend 0.0002
             *   - crash:    [crash_start, crash_end], vol 0.08, trend -0.02, volume 2M
             *   - recovery: [crash_end, recovery_end], vol 0.04, trend 0.001, volume 1.5M
             *
             * @throws std::invalid_argument if the phase boundaries are not ordered.
             */
            static std::vector<MarketData> generate_crash_scenario(
                const std::string &symbol,
                const Timestamp &normal_start,
                const Timestamp &crash_start,
                const Timestamp &crash_end,
                const Timestamp &recovery_end,
                int interval_minutes = 1,
                std::uint64_t seed = DEFAULT_SEED);

            /**
             * @brief Standard normal draw via the Box-Muller transform.
             */
            static double normal_random(std::mt19937_64 &rng);

        private:
            static double uniform(std::mt19937_64 &rng);
            static double time_step_years(int interval_minutes);
        };

    } // namespace data
} // namespace backtester

#endif // BACKTESTER_DATA_SYNTHETIC_DATA_GENERATOR_HPP
