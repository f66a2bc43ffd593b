#include <catch2/catch.hpp>
#include "strategy/bollinger_bands.hpp"
#include "strategy/buy_and_hold.hpp"
#include "strategy/indicators.hpp"
#include "strategy/momentum.hpp"
#include "strategy/multi_factor.hpp"
#include "strategy/price_history.hpp"
#include "strategy/rsi_mean_reversion.hpp"
#include "strategy/sma_crossover.hpp"
#include "strategy/strategy_factory.hpp"
#include <cmath>

using namespace backtester;
using namespace backtester::strategy;
using backtester::backtest::Portfolio;
using backtester::backtest::Trade;
using backtester::backtest::TradeSide;

namespace {

MarketData bar(double close, const std::string& symbol = "AAA") {
    MarketData b;
    b.timestamp = make_timestamp(2024, 1, 2, 12);
    b.symbol = symbol;
    b.open = b.high = b.low = b.close = close;
    b.volume = 1e6;
    return b;
}

void hold(Portfolio& portfolio, double quantity, const std::string& symbol = "AAA") {
    Trade t;
    t.id = "T000001";
    t.symbol = symbol;
    t.side = TradeSide::BUY;
    t.quantity = quantity;
    t.price = 10.0;
    REQUIRE(portfolio.apply_trade(t).has_value());
}

std::vector<Signal> feed(Strategy& strategy, const std::vector<double>& closes, const Portfolio& portfolio) {
    std::vector<Signal> last;
    for (double c : closes) last = strategy.on_bar(bar(c), portfolio);
    return last;
}

Signal vote(SignalAction action, std::optional<double> confidence = std::nullopt,
            std::optional<double> weight = std::nullopt, std::optional<double> quantity = std::nullopt) {
    Signal s;
    s.symbol = "AAA";
    s.action = action;
    s.confidence = confidence;
    s.target_weight = weight;
    s.quantity = quantity;
    return s;
}

} // namespace

TEST_CASE("Indicators", "[Indicators]") {
    SECTION("Simple moving average of the trailing window") {
        REQUIRE(simple_moving_average({1.0, 2.0, 3.0, 4.0}, 2) == Approx(3.5));
        REQUIRE(simple_moving_average({1.0, 2.0}, 5) == Approx(2.0));
        REQUIRE(simple_moving_average({}, 3) == 0.0);
    }

    SECTION("RSI bounds") {
        REQUIRE(relative_strength_index({1.0, 2.0}, 14) == Approx(50.0));
        REQUIRE(relative_strength_index({1.0, 2.0, 3.0, 4.0}, 3) == Approx(100.0));
        REQUIRE(relative_strength_index({4.0, 3.0, 2.0, 1.0}, 3) == Approx(0.0));
    }

    SECTION("Bollinger bands") {
        auto bands = bollinger_bands({10.0, 10.0, 13.0}, 3, 1.0);
        REQUIRE(bands.middle == Approx(11.0));
        REQUIRE(bands.upper == Approx(11.0 + std::sqrt(2.0)));
        REQUIRE(bands.lower == Approx(11.0 - std::sqrt(2.0)));
        REQUIRE_THROWS_AS(bollinger_bands({1.0}, 3, 2.0), std::invalid_argument);
    }

    SECTION("Price history is bounded") {
        PriceHistory history(3);
        for (double p : {1.0, 2.0, 3.0, 4.0}) history.push("AAA", p);
        REQUIRE(history.values("AAA") == std::vector<double>{2.0, 3.0, 4.0});
        REQUIRE(history.values("AAA", 1) == std::vector<double>{2.0, 3.0});
        REQUIRE(history.get("BBB").empty());
    }
}

TEST_CASE("Buy and hold", "[Strategy][BuyAndHold]") {
    Portfolio portfolio(10000.0);

    SECTION("Buys once on the first bar") {
        BuyAndHoldStrategy strategy;
        auto first = strategy.on_bar(bar(10.0), portfolio);
        REQUIRE(first.size() == 1);
        REQUIRE(first[0].action == SignalAction::BUY);
        REQUIRE(*first[0].target_weight == Approx(0.95));
        REQUIRE(first[0].strategy_id == "Buy and Hold");
        REQUIRE(strategy.on_bar(bar(11.0), portfolio).empty());
    }

    SECTION("Symbol filter ignores other instruments") {
        BuyAndHoldStrategy strategy(std::string("BBB"));
        REQUIRE(strategy.on_bar(bar(10.0, "AAA"), portfolio).empty());
        REQUIRE(strategy.on_bar(bar(10.0, "BBB"), portfolio).size() == 1);
    }

    SECTION("Initialize re-arms the initial buy") {
        BuyAndHoldStrategy strategy;
        REQUIRE(strategy.on_bar(bar(10.0), portfolio).size() == 1);
        strategy.initialize({"AAA"});
        REQUIRE(strategy.on_bar(bar(10.0), portfolio).size() == 1);
    }
}

TEST_CASE("SMA crossover", "[Strategy][SMA]") {
    Portfolio portfolio(10000.0);

    SECTION("Bullish crossover when flat") {
        SmaCrossoverStrategy strategy(2, 3);
        auto signals = feed(strategy, {10.0, 10.0, 10.0, 13.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::BUY);
        REQUIRE(*signals[0].target_weight == Approx(0.3));
        REQUIRE(*signals[0].confidence == Approx(0.5 / 11.0));
    }

    SECTION("Bearish crossover sells the whole position") {
        hold(portfolio, 7.0);
        SmaCrossoverStrategy strategy(2, 3);
        auto signals = feed(strategy, {10.0, 10.0, 10.0, 7.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::SELL);
        REQUIRE(*signals[0].quantity == Approx(7.0));
    }

    SECTION("No signal before the long window fills") {
        SmaCrossoverStrategy strategy(2, 3);
        REQUIRE(feed(strategy, {10.0, 13.0}, portfolio).empty());
    }

    SECTION("Error: non-positive periods") {
        REQUIRE_THROWS_AS(SmaCrossoverStrategy(0, 3), std::invalid_argument);
    }
}

TEST_CASE("RSI mean reversion", "[Strategy][RSI]") {
    Portfolio portfolio(10000.0);

    SECTION("Oversold buys") {
        RsiMeanReversionStrategy strategy(3, 30.0, 70.0);
        auto signals = feed(strategy, {10.0, 9.0, 8.0, 7.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::BUY);
        REQUIRE(*signals[0].confidence == Approx(1.0));
        REQUIRE(strategy.current_rsi("AAA") == Approx(0.0));
    }

    SECTION("Overbought sells when holding") {
        hold(portfolio, 4.0);
        RsiMeanReversionStrategy strategy(3, 30.0, 70.0);
        auto signals = feed(strategy, {7.0, 8.0, 9.0, 10.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::SELL);
        REQUIRE(*signals[0].quantity == Approx(4.0));
    }

    SECTION("Error: inverted thresholds") {
        REQUIRE_THROWS_AS(RsiMeanReversionStrategy(14, 70.0, 30.0), std::invalid_argument);
    }
}

TEST_CASE("Momentum", "[Strategy][Momentum]") {
    Portfolio portfolio(10000.0);

    SECTION("Positive momentum buys with scaled weight") {
        MomentumStrategy strategy(3, 0.05);
        auto signals = feed(strategy, {100.0, 103.0, 110.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::BUY);
        REQUIRE(*signals[0].target_weight == Approx(0.2));
        REQUIRE(*signals[0].confidence == Approx(1.0));
    }

    SECTION("Reversal sells at half the threshold") {
        hold(portfolio, 3.0);
        MomentumStrategy strategy(3, 0.05);
        auto signals = feed(strategy, {100.0, 99.0, 96.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::SELL);
        REQUIRE(*signals[0].confidence == Approx(0.8));
    }
}

TEST_CASE("Bollinger bands", "[Strategy][Bollinger]") {
    Portfolio portfolio(10000.0);

    SECTION("Buys below the lower band") {
        BollingerBandsStrategy strategy(3, 1.0);
        auto signals = feed(strategy, {10.0, 10.0, 7.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::BUY);
        REQUIRE(*signals[0].target_weight == Approx(0.3));
    }

    SECTION("Sells above the upper band") {
        hold(portfolio, 10.0);
        BollingerBandsStrategy strategy(3, 1.0);
        auto signals = feed(strategy, {10.0, 10.0, 13.0}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::SELL);
        REQUIRE(*signals[0].quantity == Approx(10.0));
    }

    SECTION("Takes half the position near the middle band") {
        hold(portfolio, 10.0);
        BollingerBandsStrategy strategy(3, 1.0);
        auto signals = feed(strategy, {9.0, 11.0, 10.05}, portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(*signals[0].quantity == Approx(5.0));
        REQUIRE(signals[0].reason == "Price near middle band - partial profit taking");
    }

    SECTION("A single unit is not split") {
        hold(portfolio, 1.0);
        BollingerBandsStrategy strategy(3, 1.0);
        REQUIRE(feed(strategy, {9.0, 11.0, 10.05}, portfolio).empty());
    }
}

TEST_CASE("Voting policy", "[Strategy][MultiFactor]") {
    VotingPolicy policy;

    SECTION("Two buys merge with averaged, capped weight") {
        auto merged = policy.combine({vote(SignalAction::BUY, 0.6, 0.2), vote(SignalAction::BUY, 0.4, 0.4)},
                                     "AAA", "Multi-Factor");
        REQUIRE(merged.size() == 1);
        REQUIRE(merged[0].action == SignalAction::BUY);
        REQUIRE(*merged[0].target_weight == Approx(0.25));
        REQUIRE(*merged[0].confidence == Approx(0.5));
        REQUIRE(merged[0].strategy_id == "Multi-Factor");
    }

    SECTION("A single buy is not enough") {
        REQUIRE(policy.combine({vote(SignalAction::BUY, 0.9, 0.2)}, "AAA", "mf").empty());
    }

    SECTION("A single high-confidence sell passes") {
        auto merged = policy.combine({vote(SignalAction::SELL, 0.9, std::nullopt, 12.0)}, "AAA", "mf");
        REQUIRE(merged.size() == 1);
        REQUIRE(merged[0].action == SignalAction::SELL);
        REQUIRE(*merged[0].quantity == Approx(12.0));
    }

    SECTION("A single low-confidence sell is ignored") {
        REQUIRE(policy.combine({vote(SignalAction::SELL, 0.5)}, "AAA", "mf").empty());
    }

    SECTION("Sells without quantities leave sizing open") {
        auto merged = policy.combine({vote(SignalAction::SELL), vote(SignalAction::SELL)}, "AAA", "mf");
        REQUIRE(merged.size() == 1);
        REQUIRE_FALSE(merged[0].quantity.has_value());
        REQUIRE(*merged[0].confidence == Approx(0.5));
    }

    SECTION("Configuration") {
        auto parsed = VotingPolicy::from_json({{"min_buy_votes", 1}, {"max_buy_weight", 0.5}});
        REQUIRE(parsed.min_buy_votes == 1);
        REQUIRE(parsed.max_buy_weight == Approx(0.5));
        REQUIRE(parsed.min_sell_votes == 2);
        REQUIRE_THROWS_AS(VotingPolicy::from_json({{"min_buy_votes", 0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(VotingPolicy::from_json({{"max_buy_weight", 1.5}}), std::invalid_argument);
    }
}

TEST_CASE("Multi-factor strategy", "[Strategy][MultiFactor]") {
    Portfolio portfolio(10000.0);

    SECTION("Default ensemble") {
        MultiFactorStrategy strategy;
        REQUIRE(strategy.strategy_count() == 3);
        REQUIRE(strategy.get_parameters()["strategies"].size() == 3);
        REQUIRE(strategy.on_bar(bar(10.0), portfolio).empty());
    }

    SECTION("Agreeing members produce a merged buy") {
        std::vector<std::unique_ptr<Strategy>> members;
        members.push_back(std::make_unique<BuyAndHoldStrategy>());
        members.push_back(std::make_unique<BuyAndHoldStrategy>());
        MultiFactorStrategy strategy(std::move(members));

        auto signals = strategy.on_bar(bar(10.0), portfolio);
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].action == SignalAction::BUY);
        REQUIRE(*signals[0].target_weight == Approx(0.25));
        REQUIRE(signals[0].strategy_id == "Multi-Factor");
    }

    SECTION("Error: no members") {
        REQUIRE_THROWS_AS(MultiFactorStrategy(std::vector<std::unique_ptr<Strategy>>{}), std::invalid_argument);
    }
}

TEST_CASE("Strategy factory", "[Strategy][Factory]") {
    SECTION("Every supported type can be built") {
        for (const auto& type : StrategyFactory::get_supported_types()) {
            REQUIRE_FALSE(StrategyFactory::create(type)->get_name().empty());
        }
    }

    SECTION("Names are normalized") {
        REQUIRE(StrategyFactory::create("SMA-Crossover")->get_name() == "SMA Crossover");
        REQUIRE(StrategyFactory::create("Bollinger_Bands")->get_name() == "Bollinger Bands");
    }

    SECTION("Parameters are applied") {
        auto strategy = StrategyFactory::create("sma_crossover", {{"short_period", 5}, {"long_period", 20}});
        REQUIRE(strategy->get_parameters()["short_period"].get<int>() == 5);
        REQUIRE(strategy->get_parameters()["long_period"].get<int>() == 20);
    }

    SECTION("Configuration section") {
        nlohmann::json section = {{"type", "momentum"}, {"parameters", {{"lookback_period", 10}}}};
        auto strategy = StrategyFactory::from_json(section);
        REQUIRE(strategy->get_name() == "Momentum");
        REQUIRE(strategy->get_parameters()["lookback_period"].get<int>() == 10);
        REQUIRE_THROWS_AS(StrategyFactory::from_json(nlohmann::json::object()), std::invalid_argument);
    }

    SECTION("Error: unknown type") {
        REQUIRE_THROWS_AS(StrategyFactory::create("martingale"), std::invalid_argument);
    }
}
