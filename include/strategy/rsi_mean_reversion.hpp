/**
 * @file rsi_mean_reversion.hpp
 * @brief RSI oversold/overbought mean reversion strategy
 */

#pragma once

#include "strategy/price_history.hpp"
#include "strategy/strategy.hpp"

namespace backtester {
namespace strategy {

/**
 * @class RsiMeanReversionStrategy
 * @brief Buys oversold and exits overbought conditions of a Wilder RSI.
 *
 * Buy (target weight 0.2) when RSI < oversold with no position; sell the
 * full position when RSI > overbought.
 */
class RsiMeanReversionStrategy : public Strategy {
public:
    static constexpr double TARGET_WEIGHT = 0.2;

    RsiMeanReversionStrategy(int period = 14,
                             double oversold_threshold = 30.0,
                             double overbought_threshold = 70.0);

    std::vector<Signal> on_bar(const MarketData& data, const backtest::Portfolio& portfolio) override;
    void initialize(const std::vector<std::string>& symbols) override;

    /** @brief RSI of the symbol's current window (50 if too short). */
    double current_rsi(const std::string& symbol) const;

private:
    int period_;
    double oversold_;
    double overbought_;
    PriceHistory history_;
};

} // namespace strategy
} // namespace backtester
