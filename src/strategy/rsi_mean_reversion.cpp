/**
 * @file rsi_mean_reversion.cpp
 * @brief Implementation of the RSI mean reversion strategy
 */

#include "strategy/rsi_mean_reversion.hpp"
#include "strategy/indicators.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backtester {
namespace strategy {

RsiMeanReversionStrategy::RsiMeanReversionStrategy(int period, double oversold_threshold,
                                                   double overbought_threshold)
    : Strategy("RSI Mean Reversion"),
      period_(period),
      oversold_(oversold_threshold),
      overbought_(overbought_threshold),
      history_(static_cast<size_t>(period > 0 ? period : 0) + 10) {
    if (period <= 0) throw std::invalid_argument("RSI period must be positive");
    if (!(oversold_threshold > 0.0 && oversold_threshold < overbought_threshold && overbought_threshold < 100.0)) {
        throw std::invalid_argument("RSI thresholds must satisfy 0 < oversold < overbought < 100");
    }
    parameters_ = {{"period", period_},
                   {"oversold_threshold", oversold_},
                   {"overbought_threshold", overbought_}};
}

void RsiMeanReversionStrategy::initialize(const std::vector<std::string>& /*symbols*/) {
    history_.clear();
}

double RsiMeanReversionStrategy::current_rsi(const std::string& symbol) const {
    return relative_strength_index(history_.values(symbol), static_cast<size_t>(period_));
}

std::vector<Signal> RsiMeanReversionStrategy::on_bar(const MarketData& data, const backtest::Portfolio& portfolio) {
    std::vector<Signal> signals;
    const std::string& symbol = data.symbol;

    const auto& window = history_.push(symbol, data.close);
    if (window.size() < static_cast<size_t>(period_) + 1) return signals;

    double rsi = current_rsi(symbol);
    const backtest::Position* position = portfolio.find_position(symbol);
    bool has_position = position && position->quantity > 0.0;

    if (rsi < oversold_ && !has_position) {
        std::ostringstream reason;
        reason << std::fixed << std::setprecision(2) << "RSI oversold: " << rsi << " < " << oversold_;
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::BUY;
        s.target_weight = TARGET_WEIGHT;
        s.strategy_id = name_;
        s.confidence = (oversold_ - rsi) / oversold_;
        s.reason = reason.str();
        signals.push_back(s);
    }

    if (rsi > overbought_ && has_position) {
        std::ostringstream reason;
        reason << std::fixed << std::setprecision(2) << "RSI overbought: " << rsi << " > " << overbought_;
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::SELL;
        s.quantity = position->quantity;
        s.strategy_id = name_;
        s.confidence = (rsi - overbought_) / (100.0 - overbought_);
        s.reason = reason.str();
        signals.push_back(s);
    }

    return signals;
}

} // namespace strategy
} // namespace backtester
