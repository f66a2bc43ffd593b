/**
 * @file bollinger_bands.hpp
 * @brief Bollinger band mean reversion strategy
 */

#pragma once

#include "strategy/price_history.hpp"
#include "strategy/strategy.hpp"

namespace backtester {
namespace strategy {

/**
 * @class BollingerBandsStrategy
 * @brief Band-touch mean reversion with partial profit taking.
 *
 *  - close <= lower band, flat: buy with weight min(0.3, 5 * (lower - close) / middle)
 *  - close >= upper band, long: sell the full position
 *  - long and |close - middle| / middle < 1%: sell floor(50%) of the position
 */
class BollingerBandsStrategy : public Strategy {
public:
    static constexpr double MAX_WEIGHT = 0.3;
    static constexpr double MIDDLE_BAND_TOLERANCE = 0.01;

    BollingerBandsStrategy(int period = 20, double std_multiplier = 2.0);

    std::vector<Signal> on_bar(const MarketData& data, const backtest::Portfolio& portfolio) override;
    void initialize(const std::vector<std::string>& symbols) override;

private:
    int period_;
    double std_multiplier_;
    PriceHistory history_;
};

} // namespace strategy
} // namespace backtester
