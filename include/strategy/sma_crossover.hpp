/**
 * @file sma_crossover.hpp
 * @brief Short/long simple moving average crossover strategy
 */

#pragma once

#include "strategy/price_history.hpp"
#include "strategy/strategy.hpp"

namespace backtester {
namespace strategy {

/**
 * @class SmaCrossoverStrategy
 * @brief Trades strict crossings of a short and a long simple moving average.
 *
 * Buy (target weight 0.3) when the previous short MA was <= the previous long
 * MA and the current short MA is > the current long MA, with no position open.
 * Sell the full position on the symmetric bearish crossing.
 * Confidence is |short - long| / long.
 */
class SmaCrossoverStrategy : public Strategy {
public:
    static constexpr double TARGET_WEIGHT = 0.3;

    SmaCrossoverStrategy(int short_period = 10, int long_period = 30);

    std::vector<Signal> on_bar(const MarketData& data, const backtest::Portfolio& portfolio) override;
    void initialize(const std::vector<std::string>& symbols) override;

    int short_period() const { return short_period_; }
    int long_period() const { return long_period_; }

private:
    int short_period_;
    int long_period_;
    PriceHistory history_;
};

} // namespace strategy
} // namespace backtester
