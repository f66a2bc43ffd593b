/**
 * @file momentum.hpp
 * @brief Lookback momentum strategy
 */

#pragma once

#include "strategy/price_history.hpp"
#include "strategy/strategy.hpp"

namespace backtester {
namespace strategy {

/**
 * @class MomentumStrategy
 * @brief Rate-of-change momentum entry with reversal exit.
 *
 * momentum = (p[n-1] - p[n-lookback]) / p[n-lookback].
 * Buy when momentum > threshold with weight min(0.4, 2 * momentum);
 * sell the full position when momentum < -threshold / 2.
 */
class MomentumStrategy : public Strategy {
public:
    static constexpr double MAX_WEIGHT = 0.4;

    MomentumStrategy(int lookback_period = 20, double momentum_threshold = 0.05);

    std::vector<Signal> on_bar(const MarketData& data, const backtest::Portfolio& portfolio) override;
    void initialize(const std::vector<std::string>& symbols) override;

private:
    int lookback_;
    double threshold_;
    PriceHistory history_;
};

} // namespace strategy
} // namespace backtester
