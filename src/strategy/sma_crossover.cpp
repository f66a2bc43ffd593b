/**
 * @file sma_crossover.cpp
 * @brief Implementation of the SMA crossover strategy
 */

#include "strategy/sma_crossover.hpp"
#include "strategy/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backtester {
namespace strategy {

namespace {

std::string crossover_reason(const char* label, int short_period, double short_ma,
                             const char* op, int long_period, double long_ma) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << label << ": SMA" << short_period << " (" << short_ma << ") " << op
       << " SMA" << long_period << " (" << long_ma << ")";
    return ss.str();
}

} // anonymous namespace

SmaCrossoverStrategy::SmaCrossoverStrategy(int short_period, int long_period)
    : Strategy("SMA Crossover"),
      short_period_(short_period),
      long_period_(long_period),
      history_(static_cast<size_t>(std::max(std::max(short_period, long_period), 0)) + 1) {
    if (short_period <= 0 || long_period <= 0) {
        throw std::invalid_argument("SMA periods must be positive");
    }
    parameters_ = {{"short_period", short_period_}, {"long_period", long_period_}};
}

void SmaCrossoverStrategy::initialize(const std::vector<std::string>& /*symbols*/) {
    history_.clear();
}

std::vector<Signal> SmaCrossoverStrategy::on_bar(const MarketData& data, const backtest::Portfolio& portfolio) {
    std::vector<Signal> signals;
    const std::string& symbol = data.symbol;

    history_.push(symbol, data.close);
    std::vector<double> prices = history_.values(symbol);
    if (prices.size() < static_cast<size_t>(long_period_)) return signals;

    std::vector<double> previous = history_.values(symbol, 1);
    const size_t sp = static_cast<size_t>(short_period_);
    const size_t lp = static_cast<size_t>(long_period_);

    double short_ma = simple_moving_average(prices, sp);
    double long_ma = simple_moving_average(prices, lp);
    double prev_short_ma = simple_moving_average(previous, sp);
    double prev_long_ma = simple_moving_average(previous, lp);

    const backtest::Position* position = portfolio.find_position(symbol);
    bool has_position = position && position->quantity > 0.0;
    double confidence = std::abs(short_ma - long_ma) / long_ma;

    if (prev_short_ma <= prev_long_ma && short_ma > long_ma && !has_position) {
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::BUY;
        s.target_weight = TARGET_WEIGHT;
        s.strategy_id = name_;
        s.confidence = confidence;
        s.reason = crossover_reason("Bullish crossover", short_period_, short_ma, ">", long_period_, long_ma);
        signals.push_back(s);
    }

    if (prev_short_ma >= prev_long_ma && short_ma < long_ma && has_position) {
        Signal s;
        s.symbol = symbol;
        s.action = SignalAction::SELL;
        s.quantity = position->quantity;
        s.strategy_id = name_;
        s.confidence = confidence;
        s.reason = crossover_reason("Bearish crossover", short_period_, short_ma, "<", long_period_, long_ma);
        signals.push_back(s);
    }

    return signals;
}

} // namespace strategy
} // namespace backtester
