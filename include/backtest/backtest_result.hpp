/**
 * @file backtest_result.hpp
 * @brief Output of one backtest run.
 */

#ifndef BACKTESTER_BACKTEST_BACKTEST_RESULT_HPP
#define BACKTESTER_BACKTEST_BACKTEST_RESULT_HPP

#include "analytics/performance_analyzer.hpp"
#include "backtest/backtest_config.hpp"
#include "backtest/portfolio.hpp"
#include "backtest/trade_log.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace backtester
{
    namespace backtest
    {

        /**
         * @struct BacktestResult
         * @brief Final portfolio, curves and metrics of a run.
         *
         * The equity curve holds one point per processed in-range bar and the
         * position history one snapshot per point. strategy_returns are the
         * simple returns of the equity curve. benchmark_returns are filled only
         * when the configuration names a benchmark symbol that appeared in the
         * data; they are aligned with strategy_returns.
         */
        struct BacktestResult
        {
            BacktestResult(BacktestConfig cfg, Portfolio final_portfolio)
                : config(std::move(cfg)), portfolio(std::move(final_portfolio)) {}

            BacktestConfig config;
            Portfolio portfolio;
            analytics::PerformanceMetrics metrics;
            std::vector<EquityPoint> equity_curve;
            std::vector<Trade> trades;
            std::vector<PositionSnapshot> positions;
            std::vector<double> strategy_returns;
            std::vector<double> benchmark_returns;

            TradeSummary trade_summary;
            size_t bars_processed = 0;
            bool stopped = false;  ///< true when the run ended through stop()
            std::string message;

            /** @brief Print configuration, portfolio and metrics to stdout. */
            void print_summary() const;

            /**
             * @brief Export timestamp, value, drawdown and per-bar return to CSV.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_equity_curve_to_csv(const std::string &filepath) const;

            /**
             * @brief Export the trade list to CSV (see TradeLog::export_to_csv).
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_trades_to_csv(const std::string &filepath) const;

            /** @brief Config, metrics, trade summary and final portfolio as JSON. */
            nlohmann::json to_json() const;
        };

    } // namespace backtest
} // namespace backtester

#endif // BACKTESTER_BACKTEST_BACKTEST_RESULT_HPP
