/**
 * @file advanced_execution_model.cpp
 * @brief Implementation of AdvancedExecutionModel
 */

#include "execution/advanced_execution_model.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace backtester {
namespace execution {

AdvancedExecutionModel::AdvancedExecutionModel(const backtest::BacktestConfig& config)
    : ExecutionModel(config) {
}

AdvancedExecutionModel::AdvancedExecutionModel(double commission_rate, double slippage_rate)
    : ExecutionModel(commission_rate, slippage_rate) {
}

void AdvancedExecutionModel::reset() {
    ExecutionModel::reset();
    price_history_.clear();
    volume_history_.clear();
}

void AdvancedExecutionModel::update_history(const MarketData& data) {
    auto& prices = price_history_[data.symbol];
    prices.push_back(data.close);
    if (prices.size() > HISTORY_LENGTH) prices.pop_front();

    auto& volumes = volume_history_[data.symbol];
    volumes.push_back(data.volume);
    if (volumes.size() > HISTORY_LENGTH) volumes.pop_front();
}

double AdvancedExecutionModel::average_volume(const std::string& symbol) const {
    auto it = volume_history_.find(symbol);
    if (it == volume_history_.end() || it->second.empty()) return 0.0;
    double sum = std::accumulate(it->second.begin(), it->second.end(), 0.0);
    return sum / static_cast<double>(it->second.size());
}

double AdvancedExecutionModel::historical_volatility(const std::string& symbol) const {
    auto it = price_history_.find(symbol);
    if (it == price_history_.end() || it->second.size() < 2) return DEFAULT_VOLATILITY;

    const auto& prices = it->second;
    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        returns.push_back(std::log(prices[i] / prices[i - 1]));
    }
    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
    double var = 0.0;
    for (double r : returns) var += (r - mean) * (r - mean);
    var /= static_cast<double>(returns.size());
    return std::sqrt(var * 252.0);
}

double AdvancedExecutionModel::execution_price(const strategy::Signal& signal, const MarketData& data,
                                               double quantity) const {
    double base_price = reference_price(signal, data);
    double volatility = historical_volatility(data.symbol);
    double volume_ratio = data.volume > 0.0 ? quantity / data.volume : 0.0;

    double base_slippage = slippage_rate_ * base_price;
    double volatility_multiplier = 1.0 + volatility * 2.0;
    double volume_multiplier = 1.0 + std::sqrt(volume_ratio) * 0.5;
    double total_slippage = base_slippage * volatility_multiplier * volume_multiplier;

    return signal.action == strategy::SignalAction::BUY ? base_price + total_slippage
                                                        : base_price - total_slippage;
}

std::optional<backtest::Trade> AdvancedExecutionModel::execute_signal(const strategy::Signal& signal,
                                                                      const MarketData& data,
                                                                      const backtest::Portfolio& portfolio) {
    if (signal.action == strategy::SignalAction::HOLD) return std::nullopt;

    update_history(data);

    double avg_volume = average_volume(data.symbol);
    double max_quantity = std::floor(avg_volume * MAX_VOLUME_FRACTION);
    double quantity = std::min(resolve_quantity(signal, portfolio, data.close), max_quantity);
    if (signal.action == strategy::SignalAction::SELL) {
        quantity = std::min(quantity, portfolio.position_quantity(signal.symbol));
    }
    if (!(quantity > 0.0)) return std::nullopt;

    if (quantity > avg_volume * LARGE_ORDER_FRACTION) {
        // TWAP: only the first slice is filled on this bar
        int slices = static_cast<int>(std::min<double>(MAX_TWAP_SLICES, std::floor(quantity / 100.0)));
        slices = std::max(1, slices);
        quantity = std::floor(quantity / slices);
        if (!(quantity > 0.0)) return std::nullopt;
    }

    double price = execution_price(signal, data, quantity);
    if (!(price > 0.0)) return std::nullopt;

    return make_trade(signal, data, quantity, price, std::abs(price - data.close));
}

double AdvancedExecutionModel::calculate_slippage(const strategy::Signal& /*signal*/,
                                                  const MarketData& /*data*/) const {
    return 0.0;
}

double AdvancedExecutionModel::calculate_commission(const backtest::Trade& trade) const {
    return std::max(MIN_COMMISSION, trade.quantity * trade.price * commission_rate_);
}

} // namespace execution
} // namespace backtester
