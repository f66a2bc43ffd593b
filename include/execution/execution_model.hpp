/**
 * @file execution_model.hpp
 * @brief Conversion of strategy signals into priced fills.
 *
 * An execution model decides fill price, quantity, slippage and
 * commission for one signal on one bar. Insufficient cash or shares are
 * never errors: the quantity is resolved to what can be done and a
 * non-positive result yields no trade.
 */

#pragma once

#include "backtest/backtest_config.hpp"
#include "backtest/portfolio.hpp"
#include "data/market_data.hpp"
#include "strategy/signal.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace backtester
{
    namespace execution
    {

        /**
         * @class ExecutionModel
         * @brief Abstract fill simulator.
         *
         * Trade ids are sequential per model instance ("T000001", "T000002", ...)
         * and restart after reset().
         */
        class ExecutionModel
        {
        public:
            /** Fraction of cash spent by a buy that specifies no size. */
            static constexpr double DEFAULT_CASH_FRACTION = 0.1;
            /** Fixed minimum commission per trade (currency). */
            static constexpr double MIN_COMMISSION = 1.0;

            /**
             * @param commission_rate Commission as a fraction of notional (>= 0)
             * @param slippage_rate Base slippage as a fraction of price (>= 0)
             * @throws std::invalid_argument if a rate is negative
             */
            ExecutionModel(double commission_rate, double slippage_rate);
            explicit ExecutionModel(const backtest::BacktestConfig &config);
            virtual ~ExecutionModel() = default;

            /**
             * @brief Price and size a signal against the current bar.
             * @return The proposed fill, or std::nullopt for hold signals and
             *         signals that resolve to a non-positive quantity.
             */
            virtual std::optional<backtest::Trade> execute_signal(const strategy::Signal &signal,
                                                                  const MarketData &data,
                                                                  const backtest::Portfolio &portfolio) = 0;

            /** @brief Slippage per unit (currency) for a signal on this bar. */
            virtual double calculate_slippage(const strategy::Signal &signal, const MarketData &data) const = 0;

            /** @brief Commission (currency) charged for a fill. */
            virtual double calculate_commission(const backtest::Trade &trade) const = 0;

            virtual std::string get_name() const = 0;

            /** @brief Restart trade ids and drop any rolling state. */
            virtual void reset() { next_id_ = 1; }

            double commission_rate() const { return commission_rate_; }
            double slippage_rate() const { return slippage_rate_; }

            /**
             * @brief Create a model by name ("realistic" or "advanced", case-insensitive).
             * @throws std::invalid_argument if the type is unknown
             */
            static std::unique_ptr<ExecutionModel> create(const std::string &type,
                                                          const backtest::BacktestConfig &config);

        protected:
            double commission_rate_;
            double slippage_rate_;

            /**
             * @brief Resolve the quantity of an under-specified signal.
             *
             * Explicit quantity wins; otherwise floor(target_weight * total value / price);
             * otherwise floor(10% of cash / price) for buys or the full held
             * quantity for sells.
             */
            static double resolve_quantity(const strategy::Signal &signal,
                                           const backtest::Portfolio &portfolio,
                                           double price);

            /** @brief Base price of a signal: its own price when positive, else the bar close. */
            static double reference_price(const strategy::Signal &signal, const MarketData &data);

            std::string next_trade_id();

            backtest::Trade make_trade(const strategy::Signal &signal, const MarketData &data,
                                       double quantity, double price, double slippage);

        private:
            std::uint64_t next_id_ = 1;
        };

    } // namespace execution
} // namespace backtester
