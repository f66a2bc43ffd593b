/**
 * @file performance_analyzer.hpp
 * @brief Risk and return metrics computed from an equity curve and trade list.
 *
 * All annualization assumes 252 periods per year regardless of the bar
 * interval. Annualized return uses the configured date range measured in
 * years of 365.25 days. The annual risk-free rate is converted to a
 * per-period rate as (1 + rf)^(1/252) - 1.
 */

#ifndef BACKTESTER_ANALYTICS_PERFORMANCE_ANALYZER_HPP
#define BACKTESTER_ANALYTICS_PERFORMANCE_ANALYZER_HPP

#include "backtest/backtest_config.hpp"
#include "backtest/portfolio.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace backtester
{
    namespace analytics
    {

        /**
         * @struct PerformanceMetrics
         * @brief Summary statistics of one backtest run.
         *
         * A default-constructed instance is the zeroed metrics object returned
         * for empty input.
         */
        struct PerformanceMetrics
        {
            double total_return = 0.0;       ///< (final - initial) / initial
            double annualized_return = 0.0;  ///< (1 + total)^(1 / years) - 1
            double volatility = 0.0;         ///< Annualized stdev of per-bar returns
            double sharpe_ratio = 0.0;
            double sortino_ratio = 0.0;      ///< +infinity with no downside returns
            double max_drawdown = 0.0;       ///< Positive fraction of running peak
            double calmar_ratio = 0.0;
            double win_rate = 0.0;           ///< Fraction of closed trades with positive P&L
            double profit_factor = 0.0;      ///< Gross profit / gross loss; +infinity with no losses
            int total_trades = 0;            ///< Raw fills, buys and sells
            double average_trade_return = 0.0;
            double average_win = 0.0;
            double average_loss = 0.0;       ///< Negative or zero
            double largest_win = 0.0;
            double largest_loss = 0.0;       ///< Negative or zero
            int consecutive_wins = 0;
            int consecutive_losses = 0;

            std::optional<double> beta;              ///< Set when a benchmark is tracked
            std::optional<double> alpha;             ///< Per-period Jensen's alpha
            std::optional<double> information_ratio;

            /** @brief JSON object; infinities are written as the strings "inf" / "-inf". */
            nlohmann::json to_json() const;
        };

        /**
         * @class PerformanceAnalyzer
         * @brief Stateless metric calculator.
         *
         * Usage:
         * @code
         *   PerformanceAnalyzer analyzer;
         *   auto metrics = analyzer.calculate_metrics(equity_curve, trades, config);
         *   double pf = metrics.profit_factor;
         * @endcode
         *
         * No method throws on empty or short input; degenerate cases return 0
         * (or the documented infinity sentinels).
         */
        class PerformanceAnalyzer
        {
        public:
            static constexpr double PERIODS_PER_YEAR = 252.0;
            static constexpr double DAYS_PER_YEAR = 365.25;

            /**
             * @brief Compute all metrics of a run.
             * @return Zeroed metrics when the equity curve or the trade list is empty.
             */
            PerformanceMetrics calculate_metrics(const std::vector<backtest::EquityPoint> &equity_curve,
                                                 const std::vector<backtest::Trade> &trades,
                                                 const backtest::BacktestConfig &config) const;

            /** @brief Simple returns between consecutive equity points. */
            std::vector<double> calculate_returns(const std::vector<backtest::EquityPoint> &equity_curve) const;

            /** @brief Simple returns between consecutive values. */
            static std::vector<double> calculate_returns(const std::vector<double> &values);

            /**
             * @brief Closed-trade P&L reconstructed from fills.
             *
             * Trades are replayed per symbol (symbols in order of first
             * appearance) with a running position and average price. A sell
             * against a long running position realizes
             * (price - avg) * min(qty, position) - commission. A sell with no
             * long position opens a short at the sell price.
             */
            std::vector<double> calculate_trade_pnls(const std::vector<backtest::Trade> &trades) const;

            double calculate_total_return(const std::vector<backtest::EquityPoint> &equity_curve,
                                          double initial_capital) const;
            double calculate_annualized_return(const std::vector<backtest::EquityPoint> &equity_curve,
                                               const backtest::BacktestConfig &config) const;
            double calculate_volatility(const std::vector<double> &returns) const;
            double calculate_sharpe_ratio(const std::vector<double> &returns, double risk_free_rate) const;
            double calculate_sortino_ratio(const std::vector<double> &returns, double risk_free_rate) const;
            double calculate_max_drawdown(const std::vector<backtest::EquityPoint> &equity_curve) const;
            double calculate_profit_factor(const std::vector<double> &trade_pnls) const;

            /** @brief cov(s, b) / var(b); 0 on size mismatch or fewer than 2 samples. */
            double calculate_beta(const std::vector<double> &strategy_returns,
                                  const std::vector<double> &benchmark_returns) const;

            /** @brief mean(s) - (rf_d + beta * (mean(b) - rf_d)); 0 on size mismatch or fewer than 2 samples. */
            double calculate_alpha(const std::vector<double> &strategy_returns,
                                   const std::vector<double> &benchmark_returns,
                                   double risk_free_rate) const;

            /** @brief mean(s - b) / stdev(s - b); 0 on size mismatch or fewer than 2 samples. */
            double calculate_information_ratio(const std::vector<double> &strategy_returns,
                                               const std::vector<double> &benchmark_returns) const;

            /** @brief Per-period equivalent of an annual rate. */
            static double daily_risk_free_rate(double annual_rate);

        private:
            static double mean(const std::vector<double> &values);
        };

    } // namespace analytics
} // namespace backtester

#endif // BACKTESTER_ANALYTICS_PERFORMANCE_ANALYZER_HPP
