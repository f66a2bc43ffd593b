/**
 * @file trade_log.hpp
 * @brief Executed trade records, queries and CSV export
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest/portfolio.hpp"

namespace backtester {
namespace backtest {

struct TradeSummary {
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    double total_notional = 0.0;
    double total_commission = 0.0;
    double total_slippage = 0.0;
    double avg_cost_per_trade = 0.0;

    double total_costs() const { return total_commission + total_slippage; }
    nlohmann::json to_json() const;
};

class TradeLog {
public:
    TradeLog() = default;
    explicit TradeLog(std::vector<Trade> trades) : trades_(std::move(trades)) {}
    ~TradeLog() = default;

    void log_trade(const Trade& trade) { trades_.push_back(trade); }

    const std::vector<Trade>& trades() const { return trades_; }
    std::vector<Trade> trades_for_symbol(const std::string& symbol) const;
    std::vector<Trade> trades_for_strategy(const std::string& strategy_id) const;
    TradeSummary get_summary() const;
    int num_trades() const { return static_cast<int>(trades_.size()); }

    /** @throws std::runtime_error if the file cannot be opened */
    void export_to_csv(const std::string& filepath) const;
    void print_summary() const;

    void clear() { trades_.clear(); }

private:
    std::vector<Trade> trades_;
};

} // namespace backtest
} // namespace backtester
