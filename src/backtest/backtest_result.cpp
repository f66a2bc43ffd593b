/**
 * @file backtest_result.cpp
 * @brief Result summary printing and CSV/JSON export
 */

#include "backtest/backtest_result.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace backtester
{
    namespace backtest
    {

        void BacktestResult::print_summary() const
        {
            const auto &m = metrics;
            std::cout << "\n========================================\n";
            std::cout << "BACKTEST SUMMARY\n";
            std::cout << "========================================\n";
            std::cout << "Period:           " << format_timestamp(config.start_date)
                      << " -> " << format_timestamp(config.end_date) << "\n";
            std::cout << "Bars processed:   " << bars_processed << (stopped ? " (stopped)" : "") << "\n";
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Initial capital:  " << config.initial_capital << "\n";
            std::cout << "Final value:      " << portfolio.total_value() << "\n";
            std::cout << "Cash:             " << portfolio.cash() << "\n";
            std::cout << "Open positions:   " << portfolio.positions().size() << "\n";
            std::cout << "\n--- Returns ---\n";
            std::cout << std::setprecision(4);
            std::cout << "Total return:       " << m.total_return * 100.0 << "%\n";
            std::cout << "Annualized return:  " << m.annualized_return * 100.0 << "%\n";
            std::cout << "Volatility:         " << m.volatility * 100.0 << "%\n";
            std::cout << "Max drawdown:       " << m.max_drawdown * 100.0 << "%\n";
            std::cout << "\n--- Risk-Adjusted ---\n";
            std::cout << "Sharpe:   " << m.sharpe_ratio << "\n";
            std::cout << "Sortino:  " << m.sortino_ratio << "\n";
            std::cout << "Calmar:   " << m.calmar_ratio << "\n";
            if (m.beta)
                std::cout << "Beta:     " << *m.beta << "\n";
            if (m.alpha)
                std::cout << "Alpha:    " << *m.alpha << "\n";
            if (m.information_ratio)
                std::cout << "Info:     " << *m.information_ratio << "\n";
            std::cout << "\n--- Trades ---\n";
            std::cout << "Total trades:        " << m.total_trades << "\n";
            std::cout << "Win rate:            " << m.win_rate * 100.0 << "%\n";
            std::cout << "Profit factor:       " << m.profit_factor << "\n";
            std::cout << "Average trade P&L:   " << m.average_trade_return << "\n";
            std::cout << "Average win / loss:  " << m.average_win << " / " << m.average_loss << "\n";
            std::cout << "Largest win / loss:  " << m.largest_win << " / " << m.largest_loss << "\n";
            std::cout << "Max streak win/loss: " << m.consecutive_wins << " / " << m.consecutive_losses << "\n";
            std::cout << "Total commission:    " << trade_summary.total_commission << "\n";
            std::cout << "========================================\n";
        }

        void BacktestResult::export_equity_curve_to_csv(const std::string &filepath) const
        {
            std::filesystem::path path(filepath);
            if (path.has_parent_path())
                std::filesystem::create_directories(path.parent_path());

            std::ofstream out(filepath);
            if (!out)
                throw std::runtime_error("Could not open file for writing: " + filepath);

            out << "timestamp,value,drawdown,return\n";
            out << std::fixed << std::setprecision(8);
            for (size_t i = 0; i < equity_curve.size(); ++i)
            {
                // returns start at the second point
                double r = (i > 0 && i - 1 < strategy_returns.size()) ? strategy_returns[i - 1] : 0.0;
                out << format_timestamp(equity_curve[i].timestamp) << ","
                    << equity_curve[i].value << ","
                    << equity_curve[i].drawdown << ","
                    << r << "\n";
            }
        }

        void BacktestResult::export_trades_to_csv(const std::string &filepath) const
        {
            TradeLog(trades).export_to_csv(filepath);
        }

        nlohmann::json BacktestResult::to_json() const
        {
            nlohmann::json positions_json = nlohmann::json::array();
            for (const auto &p : portfolio.positions())
            {
                positions_json.push_back({{"symbol", p.symbol},
                                          {"quantity", p.quantity},
                                          {"average_price", p.average_price},
                                          {"market_value", p.market_value},
                                          {"unrealized_pnl", p.unrealized_pnl},
                                          {"realized_pnl", p.realized_pnl}});
            }

            return {
                {"config", config.to_json()},
                {"metrics", metrics.to_json()},
                {"trade_summary", trade_summary.to_json()},
                {"bars_processed", bars_processed},
                {"stopped", stopped},
                {"message", message},
                {"portfolio", {{"cash", portfolio.cash()},
                               {"total_value", portfolio.total_value()},
                               {"total_pnl", portfolio.total_pnl()},
                               {"positions", positions_json}}}};
        }

    } // namespace backtest
} // namespace backtester
