/**
 * @file momentum.cpp
 * @brief Implementation of MomentumStrategy
 */

#include "strategy/momentum.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backtester {
namespace strategy {

MomentumStrategy::MomentumStrategy(int lookback_period, double momentum_threshold)
    : Strategy("Momentum"),
      lookback_(lookback_period),
      threshold_(momentum_threshold),
      history_(static_cast<size_t>(lookback_period > 0 ? lookback_period : 0) + 5) {
    if (lookback_period <= 0) throw std::invalid_argument("lookback_period must be positive");
    if (!(momentum_threshold > 0.0)) throw std::invalid_argument("momentum_threshold must be > 0");
    parameters_ = {{"lookback_period", lookback_}, {"momentum_threshold", threshold_}};
}

void MomentumStrategy::initialize(const std::vector<std::string>& /*symbols*/) {
    history_.clear();
}

std::vector<Signal> MomentumStrategy::on_bar(const MarketData& data, const backtest::Portfolio& portfolio) {
    std::vector<Signal> signals;
    const std::string& symbol = data.symbol;

    const auto& prices = history_.push(symbol, data.close);
    const size_t n = prices.size();
    if (n < static_cast<size_t>(lookback_)) return signals;

    double current = prices[n - 1];
    double reference = prices[n - static_cast<size_t>(lookback_)];
    double momentum = (current - reference) / reference;

    const backtest::Position* position = portfolio.find_position(symbol);
    bool has_position = position && position->quantity > 0.0;

    std::ostringstream detail;
    detail << std::fixed << std::setprecision(2) << momentum * 100.0 << "% over " << lookback_ << " periods";

    if (momentum > threshold_ && !has_position) {
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::BUY;
        s.target_weight = std::min(MAX_WEIGHT, momentum * 2.0);
        s.strategy_id = name_;
        s.confidence = std::min(1.0, momentum / threshold_);
        s.reason = "Positive momentum: " + detail.str();
        signals.push_back(s);
    }

    if (momentum < -threshold_ / 2.0 && has_position) {
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::SELL;
        s.quantity = position->quantity;
        s.strategy_id = name_;
        s.confidence = std::min(1.0, std::abs(momentum) / threshold_);
        s.reason = "Momentum reversal: " + detail.str();
        signals.push_back(s);
    }

    return signals;
}

} // namespace strategy
} // namespace backtester
