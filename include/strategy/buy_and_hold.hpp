/**
 * @file buy_and_hold.hpp
 * @brief Buy once and hold strategy
 */

#pragma once

#include "strategy/strategy.hpp"

#include <optional>

namespace backtester {
namespace strategy {

/**
 * @class BuyAndHoldStrategy
 * @brief Buys once (target weight 0.95) and never sells.
 *
 * The single buy is emitted on the first bar whose symbol has no open
 * position. When a symbol is configured, bars of other symbols are ignored.
 */
class BuyAndHoldStrategy : public Strategy {
public:
    static constexpr double TARGET_WEIGHT = 0.95;

    explicit BuyAndHoldStrategy(std::optional<std::string> symbol = std::nullopt);

    std::vector<Signal> on_bar(const MarketData& data, const backtest::Portfolio& portfolio) override;
    void initialize(const std::vector<std::string>& symbols) override;

    bool has_bought() const { return has_initial_position_; }

private:
    std::optional<std::string> symbol_;
    bool has_initial_position_ = false;
};

} // namespace strategy
} // namespace backtester
