/**
 * @file trade_log.cpp
 * @brief Implementation of TradeLog
 */

#include "backtest/trade_log.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace backtester {
namespace backtest {

nlohmann::json TradeSummary::to_json() const
{
    return {
        {"total_trades", total_trades},
        {"buy_trades", buy_trades},
        {"sell_trades", sell_trades},
        {"total_notional", total_notional},
        {"total_commission", total_commission},
        {"total_slippage", total_slippage},
        {"avg_cost_per_trade", avg_cost_per_trade}};
}

std::vector<Trade> TradeLog::trades_for_symbol(const std::string &symbol) const
{
    std::vector<Trade> out;
    for (const auto &t : trades_)
    {
        if (t.symbol == symbol)
            out.push_back(t);
    }
    return out;
}

std::vector<Trade> TradeLog::trades_for_strategy(const std::string &strategy_id) const
{
    std::vector<Trade> out;
    for (const auto &t : trades_)
    {
        if (t.strategy_id == strategy_id)
            out.push_back(t);
    }
    return out;
}

TradeSummary TradeLog::get_summary() const
{
    TradeSummary s;
    s.total_trades = static_cast<int>(trades_.size());

    for (const auto &t : trades_)
    {
        if (t.side == TradeSide::BUY)
            ++s.buy_trades;
        else
            ++s.sell_trades;

        s.total_notional += t.notional();
        s.total_commission += t.commission;
        s.total_slippage += t.slippage;
    }

    if (s.total_trades > 0)
        s.avg_cost_per_trade = s.total_costs() / s.total_trades;

    return s;
}

void TradeLog::export_to_csv(const std::string &filepath) const
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "id,timestamp,symbol,side,quantity,price,notional,commission,slippage,strategy_id\n";
    file << std::fixed << std::setprecision(8);

    for (const auto &t : trades_)
    {
        file << t.id << ","
             << format_timestamp(t.timestamp) << ","
             << t.symbol << ","
             << to_string(t.side) << ","
             << t.quantity << ","
             << t.price << ","
             << t.notional() << ","
             << t.commission << ","
             << t.slippage << ","
             << t.strategy_id << "\n";
    }

    file.close();
}

void TradeLog::print_summary() const
{
    auto s = get_summary();
    std::cout << "\n=== Trade Log Summary ===\n";
    std::cout << "Total trades: " << s.total_trades << "\n";
    std::cout << "Buys: " << s.buy_trades << "  Sells: " << s.sell_trades << "\n";
    std::cout << "Total notional: " << s.total_notional << "\n";
    std::cout << "Total commission: " << s.total_commission << "\n";
    std::cout << "Total slippage: " << s.total_slippage << "\n";
    std::cout << "Average cost/trade: " << s.avg_cost_per_trade << "\n";
    std::cout << "==========================\n";
}

} // namespace backtest
} // namespace backtester
