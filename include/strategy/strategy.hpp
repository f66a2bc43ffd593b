/**
 * @file strategy.hpp
 * @brief Interface implemented by every trading strategy.
 *
 * A strategy receives each bar together with a read-only view of the
 * portfolio and answers with zero or more Signals. It never mutates the
 * portfolio; all intent flows through the returned signals.
 */

#pragma once

#include "backtest/portfolio.hpp"
#include "data/market_data.hpp"
#include "strategy/signal.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace backtester
{
    namespace strategy
    {

        /**
         * @class Strategy
         * @brief Abstract strategy with optional lifecycle hooks.
         *
         * Only on_bar() is required. initialize(), on_trade() and finalize()
         * default to no-ops.
         *
         * Usage Example:
         * @code
         * auto strategy = StrategyFactory::create("sma_crossover", {{"short_period", 5}});
         * strategy->initialize({"BTC"});
         * auto signals = strategy->on_bar(bar, portfolio);
         * @endcode
         */
        class Strategy
        {
        public:
            Strategy(std::string name, nlohmann::json parameters = nlohmann::json::object())
                : name_(std::move(name)), parameters_(std::move(parameters)) {}

            virtual ~Strategy() = default;

            /**
             * @brief Produce signals for one bar.
             * @param data Current bar.
             * @param portfolio Read-only portfolio state, already marked to this bar.
             * @return Signals to execute in order.
             */
            virtual std::vector<Signal> on_bar(const MarketData &data,
                                               const backtest::Portfolio &portfolio) = 0;

            /** @brief Called once at the start of each run. */
            virtual void initialize(const std::vector<std::string> & /*symbols*/) {}

            /** @brief Called after every executed trade, in execution order. */
            virtual void on_trade(const backtest::Trade & /*trade*/,
                                  const backtest::Portfolio & /*portfolio*/) {}

            /** @brief Called once after the last bar. */
            virtual void finalize(const backtest::Portfolio & /*portfolio*/) {}

            const std::string &get_name() const { return name_; }
            const nlohmann::json &get_parameters() const { return parameters_; }

        protected:
            std::string name_;
            nlohmann::json parameters_;
        };

    } // namespace strategy
} // namespace backtester
