/**
 * @file multi_factor.hpp
 * @brief Ensemble strategy combining sub-strategy signals by vote.
 */

#pragma once

#include "strategy/strategy.hpp"

#include <memory>
#include <vector>

namespace backtester
{
    namespace strategy
    {

        /**
         * @struct VotingPolicy
         * @brief Rules used by MultiFactorStrategy to merge sub-strategy signals.
         *
         * Buy: at least min_buy_votes buy signals. Confidence and target weight
         * are averaged (missing values count as default_confidence and
         * default_weight) and the weight is capped at max_buy_weight.
         *
         * Sell: at least min_sell_votes sell signals, or any single sell signal
         * whose confidence exceeds sell_confidence_override. The quantity is
         * the largest quantity requested among the sell signals.
         */
        struct VotingPolicy
        {
            size_t min_buy_votes = 2;
            size_t min_sell_votes = 2;
            double max_buy_weight = 0.25;
            double default_confidence = 0.5;
            double default_weight = 0.1;
            double sell_confidence_override = 0.8;

            /**
             * @brief Merge the signals of one bar.
             * @param signals All sub-strategy signals for the bar
             * @param symbol Symbol of the bar
             * @param strategy_id Identifier stamped on the merged signals
             * @return Zero, one or two merged signals (buy first, then sell)
             */
            std::vector<Signal> combine(const std::vector<Signal> &signals,
                                        const std::string &symbol,
                                        const std::string &strategy_id) const;

            static VotingPolicy from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @class MultiFactorStrategy
         * @brief Runs several strategies on every bar and votes on their signals.
         *
         * The default ensemble is SMA crossover (10/30), RSI mean reversion
         * (14, 25/75) and momentum (20, 3%). Lifecycle hooks are forwarded to
         * every sub-strategy.
         */
        class MultiFactorStrategy : public Strategy
        {
        public:
            explicit MultiFactorStrategy(VotingPolicy policy = VotingPolicy());
            MultiFactorStrategy(std::vector<std::unique_ptr<Strategy>> strategies,
                                VotingPolicy policy = VotingPolicy());

            std::vector<Signal> on_bar(const MarketData &data,
                                       const backtest::Portfolio &portfolio) override;
            void initialize(const std::vector<std::string> &symbols) override;
            void on_trade(const backtest::Trade &trade, const backtest::Portfolio &portfolio) override;
            void finalize(const backtest::Portfolio &portfolio) override;

            const VotingPolicy &policy() const { return policy_; }
            size_t strategy_count() const { return strategies_.size(); }

        private:
            std::vector<std::unique_ptr<Strategy>> strategies_;
            VotingPolicy policy_;

            void update_parameters();
        };

    } // namespace strategy
} // namespace backtester
