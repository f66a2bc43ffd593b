/**
 * @file bollinger_bands.cpp
 * @brief Implementation of the Bollinger band reversion strategy
 */

#include "strategy/bollinger_bands.hpp"
#include "strategy/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backtester {
namespace strategy {

BollingerBandsStrategy::BollingerBandsStrategy(int period, double std_multiplier)
    : Strategy("Bollinger Bands"),
      period_(period),
      std_multiplier_(std_multiplier),
      history_(static_cast<size_t>(period > 0 ? period : 0) + 5) {
    if (period <= 0) throw std::invalid_argument("Bollinger period must be positive");
    if (!(std_multiplier > 0.0)) throw std::invalid_argument("std_multiplier must be > 0");
    parameters_ = {{"period", period_}, {"std_multiplier", std_multiplier_}};
}

void BollingerBandsStrategy::initialize(const std::vector<std::string>& /*symbols*/) {
    history_.clear();
}

std::vector<Signal> BollingerBandsStrategy::on_bar(const MarketData& data, const backtest::Portfolio& portfolio) {
    std::vector<Signal> signals;
    const std::string& symbol = data.symbol;

    const auto& window = history_.push(symbol, data.close);
    if (window.size() < static_cast<size_t>(period_)) return signals;

    BollingerBands bands = bollinger_bands(history_.values(symbol), static_cast<size_t>(period_), std_multiplier_);
    const double price = data.close;
    const backtest::Position* position = portfolio.find_position(symbol);
    bool has_position = position && position->quantity > 0.0;

    if (price <= bands.lower && !has_position) {
        double distance = (bands.lower - price) / bands.middle;
        std::ostringstream reason;
        reason << std::fixed << std::setprecision(2)
               << "Price below lower Bollinger Band: " << price << " <= " << bands.lower;
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::BUY;
        s.target_weight = std::min(MAX_WEIGHT, distance * 5.0);
        s.strategy_id = name_;
        s.confidence = distance;
        s.reason = reason.str();
        signals.push_back(s);
    }

    if (price >= bands.upper && has_position) {
        std::ostringstream reason;
        reason << std::fixed << std::setprecision(2)
               << "Price above upper Bollinger Band: " << price << " >= " << bands.upper;
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::SELL;
        s.quantity = position->quantity;
        s.strategy_id = name_;
        s.confidence = (price - bands.upper) / bands.middle;
        s.reason = reason.str();
        signals.push_back(s);
    }

    if (has_position && std::abs(price - bands.middle) / bands.middle < MIDDLE_BAND_TOLERANCE) {
        double partial = std::floor(position->quantity * 0.5);
        // an empty partial would fall back to full-position sizing downstream
        if (partial > 0.0) {
            Signal s;
            s.symbol = symbol;
            s.action = SignalAction::SELL;
            s.quantity = partial;
            s.strategy_id = name_;
            s.confidence = 0.5;
            s.reason = "Price near middle band - partial profit taking";
            signals.push_back(s);
        }
    }

    return signals;
}

} // namespace strategy
} // namespace backtester
