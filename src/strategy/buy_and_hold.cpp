/**
 * @file buy_and_hold.cpp
 * @brief Implementation of BuyAndHoldStrategy
 */

#include "strategy/buy_and_hold.hpp"

namespace backtester {
namespace strategy {

BuyAndHoldStrategy::BuyAndHoldStrategy(std::optional<std::string> symbol)
    : Strategy("Buy and Hold"), symbol_(std::move(symbol)) {
    if (symbol_) parameters_["symbol"] = *symbol_;
}

void BuyAndHoldStrategy::initialize(const std::vector<std::string>& /*symbols*/) {
    has_initial_position_ = false;
}

std::vector<Signal> BuyAndHoldStrategy::on_bar(const MarketData& data, const backtest::Portfolio& portfolio) {
    std::vector<Signal> signals;
    if (symbol_ && *symbol_ != data.symbol) return signals;

    if (!has_initial_position_ && !portfolio.has_position(data.symbol)) {
        Signal s;
        s.symbol = data.symbol;
        s.action = SignalAction::BUY;
        s.target_weight = TARGET_WEIGHT;
        s.strategy_id = name_;
        s.reason = "Initial buy";
        signals.push_back(s);
        has_initial_position_ = true;
    }
    return signals;
}

} // namespace strategy
} // namespace backtester
