/**
 * @file market_simulator.hpp
 * @brief Abstract interface for bar sources replayed by the backtest engine.
 *
 * A MarketSimulator is a single-pass cursor over MarketData bars. Concrete
 * implementations replay stored history or stream bars produced at runtime.
 */

#pragma once

#include "data/market_data.hpp"

#include <optional>
#include <string>
#include <vector>

namespace backtester
{
    namespace data
    {

        /**
         * @class MarketSimulator
         * @brief Pull interface over an ordered stream of bars.
         *
         * Usage Example:
         * @code
         * HistoricalDataSimulator sim(bars);
         * while (sim.has_more_data()) {
         *     auto bar = sim.get_next_bar();
         * }
         * @endcode
         */
        class MarketSimulator
        {
        public:
            virtual ~MarketSimulator() = default;

            /**
             * @brief Whether another bar can be pulled.
             */
            virtual bool has_more_data() const = 0;

            /**
             * @brief Pull the next bar and advance the cursor.
             * @return The bar, or std::nullopt if none is available right now.
             *
             * @note Not idempotent: every successful call consumes one bar.
             */
            virtual std::optional<MarketData> get_next_bar() = 0;

            /**
             * @brief Timestamp of the most recently consumed bar.
             */
            virtual Timestamp get_current_timestamp() const = 0;

            /**
             * @brief Symbols this source produces.
             */
            virtual std::vector<std::string> get_symbols() const = 0;

            /**
             * @brief Rewind the cursor to the first bar.
             */
            virtual void reset() = 0;
        };

    } // namespace data
} // namespace backtester
