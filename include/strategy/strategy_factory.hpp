/**
 * @file strategy_factory.hpp
 * @brief Factory for creating strategies from configuration
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "strategy": {
 *     "type": "sma_crossover",
 *     "parameters": { "short_period": 5, "long_period": 20 }
 *   }
 * }
 * @endcode
 */

#pragma once

#include "strategy/strategy.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace backtester
{
    namespace strategy
    {

        /**
         * @class StrategyFactory
         * @brief Builds built-in strategies by name.
         *
         * Supported types (case-insensitive):
         * - "buy_and_hold": symbol
         * - "sma_crossover": short_period, long_period
         * - "rsi_mean_reversion": period, oversold_threshold, overbought_threshold
         * - "momentum": lookback_period, momentum_threshold
         * - "bollinger_bands": period, std_multiplier
         * - "multi_factor": voting (see VotingPolicy)
         *
         * Missing parameters take the strategy defaults.
         */
        class StrategyFactory
        {
        public:
            /**
             * @brief Create a strategy from type string and JSON parameters
             * @throws std::invalid_argument if type is unknown or a parameter is invalid
             */
            static std::unique_ptr<Strategy> create(const std::string &type,
                                                    const nlohmann::json &params = nlohmann::json::object());

            /**
             * @brief Create from a section of the form {"type": ..., "parameters": {...}}
             * @throws std::invalid_argument if 'type' is missing
             */
            static std::unique_ptr<Strategy> from_json(const nlohmann::json &section);

            static std::vector<std::string> get_supported_types();

        private:
            static std::string normalize_type(const std::string &type);
        };

    } // namespace strategy
} // namespace backtester
