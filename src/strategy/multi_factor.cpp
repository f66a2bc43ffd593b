/**
 * @file multi_factor.cpp
 * @brief Implementation of the voting multi-factor strategy
 */

#include "strategy/multi_factor.hpp"
#include "strategy/momentum.hpp"
#include "strategy/rsi_mean_reversion.hpp"
#include "strategy/sma_crossover.hpp"

#include <algorithm>
#include <stdexcept>

namespace backtester
{
    namespace strategy
    {

        std::vector<Signal> VotingPolicy::combine(const std::vector<Signal> &signals,
                                                  const std::string &symbol,
                                                  const std::string &strategy_id) const
        {
            std::vector<Signal> combined;
            if (signals.empty())
                return combined;

            std::vector<const Signal *> buys;
            std::vector<const Signal *> sells;
            for (const auto &s : signals)
            {
                if (s.action == SignalAction::BUY)
                    buys.push_back(&s);
                else if (s.action == SignalAction::SELL)
                    sells.push_back(&s);
            }

            if (!buys.empty() && buys.size() >= min_buy_votes)
            {
                double confidence_sum = 0.0;
                double weight_sum = 0.0;
                for (const Signal *s : buys)
                {
                    confidence_sum += s->confidence.value_or(default_confidence);
                    weight_sum += s->target_weight.value_or(default_weight);
                }
                const double n = static_cast<double>(buys.size());

                Signal merged;
                merged.symbol = symbol;
                merged.action = SignalAction::BUY;
                merged.target_weight = std::min(weight_sum / n, max_buy_weight);
                merged.strategy_id = strategy_id;
                merged.confidence = confidence_sum / n;
                merged.reason = "Multi-factor buy: " + std::to_string(buys.size()) + " strategies agree";
                combined.push_back(merged);
            }

            bool high_conviction = std::any_of(sells.begin(), sells.end(), [this](const Signal *s)
                                               { return s->confidence.value_or(0.0) > sell_confidence_override; });

            if (!sells.empty() && (sells.size() >= min_sell_votes || high_conviction))
            {
                double max_quantity = 0.0;
                double confidence_sum = 0.0;
                for (const Signal *s : sells)
                {
                    max_quantity = std::max(max_quantity, s->quantity.value_or(0.0));
                    confidence_sum += s->confidence.value_or(default_confidence);
                }

                Signal merged;
                merged.symbol = symbol;
                merged.action = SignalAction::SELL;
                // no explicit quantity leaves sizing to the execution model (full position)
                if (max_quantity > 0.0)
                    merged.quantity = max_quantity;
                merged.strategy_id = strategy_id;
                merged.confidence = confidence_sum / static_cast<double>(sells.size());
                merged.reason = "Multi-factor sell: " + std::to_string(sells.size()) + " strategies agree";
                combined.push_back(merged);
            }

            return combined;
        }

        VotingPolicy VotingPolicy::from_json(const nlohmann::json &j)
        {
            VotingPolicy policy;
            policy.min_buy_votes = j.value("min_buy_votes", policy.min_buy_votes);
            policy.min_sell_votes = j.value("min_sell_votes", policy.min_sell_votes);
            policy.max_buy_weight = j.value("max_buy_weight", policy.max_buy_weight);
            policy.default_confidence = j.value("default_confidence", policy.default_confidence);
            policy.default_weight = j.value("default_weight", policy.default_weight);
            policy.sell_confidence_override = j.value("sell_confidence_override", policy.sell_confidence_override);

            if (policy.min_buy_votes == 0 || policy.min_sell_votes == 0)
            {
                throw std::invalid_argument("Voting thresholds must be at least 1");
            }
            if (policy.max_buy_weight <= 0.0 || policy.max_buy_weight > 1.0)
            {
                throw std::invalid_argument("max_buy_weight must be in (0, 1], got: " +
                                            std::to_string(policy.max_buy_weight));
            }
            return policy;
        }

        nlohmann::json VotingPolicy::to_json() const
        {
            return {
                {"min_buy_votes", min_buy_votes},
                {"min_sell_votes", min_sell_votes},
                {"max_buy_weight", max_buy_weight},
                {"default_confidence", default_confidence},
                {"default_weight", default_weight},
                {"sell_confidence_override", sell_confidence_override}};
        }

        MultiFactorStrategy::MultiFactorStrategy(VotingPolicy policy)
            : Strategy("Multi-Factor"), policy_(policy)
        {
            strategies_.push_back(std::make_unique<SmaCrossoverStrategy>(10, 30));
            strategies_.push_back(std::make_unique<RsiMeanReversionStrategy>(14, 25.0, 75.0));
            strategies_.push_back(std::make_unique<MomentumStrategy>(20, 0.03));
            update_parameters();
        }

        MultiFactorStrategy::MultiFactorStrategy(std::vector<std::unique_ptr<Strategy>> strategies,
                                                 VotingPolicy policy)
            : Strategy("Multi-Factor"), strategies_(std::move(strategies)), policy_(policy)
        {
            if (strategies_.empty())
            {
                throw std::invalid_argument("MultiFactorStrategy requires at least one sub-strategy");
            }
            for (const auto &s : strategies_)
            {
                if (!s)
                    throw std::invalid_argument("MultiFactorStrategy sub-strategy must not be null");
            }
            update_parameters();
        }

        void MultiFactorStrategy::update_parameters()
        {
            nlohmann::json members = nlohmann::json::array();
            for (const auto &s : strategies_)
            {
                members.push_back({{"name", s->get_name()}, {"parameters", s->get_parameters()}});
            }
            parameters_ = {{"strategies", members}, {"voting", policy_.to_json()}};
        }

        std::vector<Signal> MultiFactorStrategy::on_bar(const MarketData &data,
                                                        const backtest::Portfolio &portfolio)
        {
            std::vector<Signal> all_signals;
            for (auto &s : strategies_)
            {
                auto signals = s->on_bar(data, portfolio);
                all_signals.insert(all_signals.end(), signals.begin(), signals.end());
            }
            return policy_.combine(all_signals, data.symbol, name_);
        }

        void MultiFactorStrategy::initialize(const std::vector<std::string> &symbols)
        {
            for (auto &s : strategies_)
                s->initialize(symbols);
        }

        void MultiFactorStrategy::on_trade(const backtest::Trade &trade, const backtest::Portfolio &portfolio)
        {
            for (auto &s : strategies_)
                s->on_trade(trade, portfolio);
        }

        void MultiFactorStrategy::finalize(const backtest::Portfolio &portfolio)
        {
            for (auto &s : strategies_)
                s->finalize(portfolio);
        }

    } // namespace strategy
} // namespace backtester
