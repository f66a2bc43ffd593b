/**
 * @file realistic_execution_model.cpp
 * @brief Implementation of RealisticExecutionModel
 */

#include "execution/realistic_execution_model.hpp"

#include <algorithm>
#include <cmath>

namespace backtester {
namespace execution {

RealisticExecutionModel::RealisticExecutionModel(const backtest::BacktestConfig& config)
    : ExecutionModel(config) {
}

RealisticExecutionModel::RealisticExecutionModel(double commission_rate, double slippage_rate)
    : ExecutionModel(commission_rate, slippage_rate) {
}

std::optional<backtest::Trade> RealisticExecutionModel::execute_signal(const strategy::Signal& signal,
                                                                       const MarketData& data,
                                                                       const backtest::Portfolio& portfolio) {
    if (signal.action == strategy::SignalAction::HOLD) return std::nullopt;
    const bool is_buy = signal.action == strategy::SignalAction::BUY;

    double base_price = reference_price(signal, data);
    double slippage = calculate_slippage(signal, data);
    double execution_price = is_buy ? base_price + slippage : base_price - slippage;

    double quantity = resolve_quantity(signal, portfolio, execution_price);
    if (!is_buy) {
        quantity = std::min(quantity, portfolio.position_quantity(signal.symbol));
    }
    if (!(quantity > 0.0)) return std::nullopt;

    double impact = calculate_market_impact(quantity, data);
    double final_price = is_buy ? execution_price + impact : execution_price - impact;
    if (!(final_price > 0.0)) return std::nullopt;

    return make_trade(signal, data, quantity, final_price, slippage + impact);
}

double RealisticExecutionModel::range_fraction(const MarketData& data) {
    if (!(data.close > 0.0)) return 0.0;
    return (data.high - data.low) / data.close;
}

double RealisticExecutionModel::calculate_slippage(const strategy::Signal& /*signal*/,
                                                   const MarketData& data) const {
    double rate = slippage_rate_;

    // spread and volatility are both proxied by the bar range
    double spread = range_fraction(data);
    double volatility = range_fraction(data);
    rate *= (1.0 + spread * 10.0 + volatility * 5.0);

    int hour = utc_hour(data.timestamp);
    if (hour < 10 || hour > 15) {
        rate *= OFF_HOURS_MULTIPLIER;
    }
    return rate * data.close;
}

double RealisticExecutionModel::calculate_commission(const backtest::Trade& trade) const {
    double percentage = trade.quantity * trade.price * commission_rate_;
    double per_share = trade.quantity * PER_SHARE_COMMISSION;
    return std::max(MIN_COMMISSION, std::min(percentage, per_share));
}

double RealisticExecutionModel::calculate_market_impact(double quantity, const MarketData& data) const {
    if (!(data.volume > 0.0) || !(quantity > 0.0)) return 0.0;
    double volume_ratio = quantity / (data.volume / 100.0);
    return std::sqrt(volume_ratio) * IMPACT_COEFFICIENT * data.close;
}

} // namespace execution
} // namespace backtester
