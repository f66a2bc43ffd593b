/**
 * @file strategy_factory.cpp
 * @brief Implementation of StrategyFactory
 */

#include "strategy/strategy_factory.hpp"
#include "strategy/bollinger_bands.hpp"
#include "strategy/buy_and_hold.hpp"
#include "strategy/momentum.hpp"
#include "strategy/multi_factor.hpp"
#include "strategy/rsi_mean_reversion.hpp"
#include "strategy/sma_crossover.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

namespace backtester
{
    namespace strategy
    {

        std::string StrategyFactory::normalize_type(const std::string &type)
        {
            std::string normalized = type;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            std::replace(normalized.begin(), normalized.end(), '-', '_');
            return normalized;
        }

        std::unique_ptr<Strategy> StrategyFactory::create(const std::string &type,
                                                          const nlohmann::json &params)
        {
            const nlohmann::json p = params.is_object() ? params : nlohmann::json::object();
            std::string normalized = normalize_type(type);

            if (normalized == "buy_and_hold")
            {
                std::optional<std::string> symbol;
                if (p.contains("symbol") && p["symbol"].is_string())
                    symbol = p["symbol"].get<std::string>();
                return std::make_unique<BuyAndHoldStrategy>(symbol);
            }
            else if (normalized == "sma_crossover")
            {
                return std::make_unique<SmaCrossoverStrategy>(
                    p.value("short_period", 10),
                    p.value("long_period", 30));
            }
            else if (normalized == "rsi_mean_reversion")
            {
                return std::make_unique<RsiMeanReversionStrategy>(
                    p.value("period", 14),
                    p.value("oversold_threshold", 30.0),
                    p.value("overbought_threshold", 70.0));
            }
            else if (normalized == "momentum")
            {
                return std::make_unique<MomentumStrategy>(
                    p.value("lookback_period", 20),
                    p.value("momentum_threshold", 0.05));
            }
            else if (normalized == "bollinger_bands")
            {
                return std::make_unique<BollingerBandsStrategy>(
                    p.value("period", 20),
                    p.value("std_multiplier", 2.0));
            }
            else if (normalized == "multi_factor")
            {
                VotingPolicy policy;
                if (p.contains("voting"))
                    policy = VotingPolicy::from_json(p["voting"]);
                return std::make_unique<MultiFactorStrategy>(policy);
            }

            throw std::invalid_argument(
                "Unknown strategy type: '" + type + "'. "
                "Valid options: buy_and_hold, sma_crossover, rsi_mean_reversion, momentum, bollinger_bands, multi_factor");
        }

        std::unique_ptr<Strategy> StrategyFactory::from_json(const nlohmann::json &section)
        {
            if (!section.contains("type") || !section["type"].is_string())
            {
                throw std::invalid_argument("Strategy configuration must specify 'type'");
            }
            nlohmann::json params = section.value("parameters", nlohmann::json::object());
            return create(section["type"].get<std::string>(), params);
        }

        std::vector<std::string> StrategyFactory::get_supported_types()
        {
            return {"buy_and_hold", "sma_crossover", "rsi_mean_reversion",
                    "momentum", "bollinger_bands", "multi_factor"};
        }

    } // namespace strategy
} // namespace backtester
