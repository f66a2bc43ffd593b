/**
 * @file performance_analyzer.cpp
 * @brief Implementation of PerformanceAnalyzer
 */

#include "analytics/performance_analyzer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <string>

namespace backtester
{
    namespace analytics
    {

        namespace
        {
            nlohmann::json number_or_sentinel(double value)
            {
                if (std::isinf(value))
                    return value > 0 ? "inf" : "-inf";
                if (std::isnan(value))
                    return nullptr;
                return value;
            }
        } // namespace

        nlohmann::json PerformanceMetrics::to_json() const
        {
            nlohmann::json j = {
                {"total_return", number_or_sentinel(total_return)},
                {"annualized_return", number_or_sentinel(annualized_return)},
                {"volatility", number_or_sentinel(volatility)},
                {"sharpe_ratio", number_or_sentinel(sharpe_ratio)},
                {"sortino_ratio", number_or_sentinel(sortino_ratio)},
                {"max_drawdown", number_or_sentinel(max_drawdown)},
                {"calmar_ratio", number_or_sentinel(calmar_ratio)},
                {"win_rate", number_or_sentinel(win_rate)},
                {"profit_factor", number_or_sentinel(profit_factor)},
                {"total_trades", total_trades},
                {"average_trade_return", number_or_sentinel(average_trade_return)},
                {"average_win", number_or_sentinel(average_win)},
                {"average_loss", number_or_sentinel(average_loss)},
                {"largest_win", number_or_sentinel(largest_win)},
                {"largest_loss", number_or_sentinel(largest_loss)},
                {"consecutive_wins", consecutive_wins},
                {"consecutive_losses", consecutive_losses}};
            if (beta)
                j["beta"] = number_or_sentinel(*beta);
            if (alpha)
                j["alpha"] = number_or_sentinel(*alpha);
            if (information_ratio)
                j["information_ratio"] = number_or_sentinel(*information_ratio);
            return j;
        }

        // ====================================================================
        // Helpers
        // ====================================================================

        double PerformanceAnalyzer::mean(const std::vector<double> &values)
        {
            if (values.empty())
                return 0.0;
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        double PerformanceAnalyzer::daily_risk_free_rate(double annual_rate)
        {
            return std::pow(1.0 + annual_rate, 1.0 / PERIODS_PER_YEAR) - 1.0;
        }

        // ====================================================================
        // Aggregate
        // ====================================================================

        PerformanceMetrics PerformanceAnalyzer::calculate_metrics(
            const std::vector<backtest::EquityPoint> &equity_curve,
            const std::vector<backtest::Trade> &trades,
            const backtest::BacktestConfig &config) const
        {
            PerformanceMetrics m;
            if (equity_curve.empty() || trades.empty())
                return m;

            const double rf = config.effective_risk_free_rate();
            const std::vector<double> returns = calculate_returns(equity_curve);
            const std::vector<double> pnls = calculate_trade_pnls(trades);

            m.total_return = calculate_total_return(equity_curve, config.initial_capital);
            m.annualized_return = calculate_annualized_return(equity_curve, config);
            m.volatility = calculate_volatility(returns);
            m.sharpe_ratio = calculate_sharpe_ratio(returns, rf);
            m.sortino_ratio = calculate_sortino_ratio(returns, rf);
            m.max_drawdown = calculate_max_drawdown(equity_curve);
            m.calmar_ratio = m.max_drawdown == 0.0 ? 0.0 : m.annualized_return / m.max_drawdown;
            m.profit_factor = calculate_profit_factor(pnls);
            m.total_trades = static_cast<int>(trades.size());

            std::vector<double> wins;
            std::vector<double> losses;
            for (double pnl : pnls)
            {
                if (pnl > 0.0)
                    wins.push_back(pnl);
                else if (pnl < 0.0)
                    losses.push_back(pnl);
            }

            if (!pnls.empty())
            {
                m.win_rate = static_cast<double>(wins.size()) / static_cast<double>(pnls.size());
                m.average_trade_return = mean(pnls);
            }
            m.average_win = mean(wins);
            m.average_loss = mean(losses);
            m.largest_win = wins.empty() ? 0.0 : *std::max_element(wins.begin(), wins.end());
            m.largest_loss = losses.empty() ? 0.0 : *std::min_element(losses.begin(), losses.end());

            int win_streak = 0;
            int loss_streak = 0;
            for (double pnl : pnls)
            {
                win_streak = pnl > 0.0 ? win_streak + 1 : 0;
                loss_streak = pnl < 0.0 ? loss_streak + 1 : 0;
                m.consecutive_wins = std::max(m.consecutive_wins, win_streak);
                m.consecutive_losses = std::max(m.consecutive_losses, loss_streak);
            }

            return m;
        }

        // ====================================================================
        // Returns
        // ====================================================================

        std::vector<double> PerformanceAnalyzer::calculate_returns(
            const std::vector<backtest::EquityPoint> &equity_curve) const
        {
            std::vector<double> values;
            values.reserve(equity_curve.size());
            for (const auto &p : equity_curve)
                values.push_back(p.value);
            return calculate_returns(values);
        }

        std::vector<double> PerformanceAnalyzer::calculate_returns(const std::vector<double> &values)
        {
            std::vector<double> returns;
            if (values.size() < 2)
                return returns;
            returns.reserve(values.size() - 1);
            for (size_t i = 1; i < values.size(); ++i)
            {
                double previous = values[i - 1];
                returns.push_back(previous != 0.0 ? (values[i] - previous) / previous : 0.0);
            }
            return returns;
        }

        std::vector<double> PerformanceAnalyzer::calculate_trade_pnls(const std::vector<backtest::Trade> &trades) const
        {
            // group by symbol, keeping first-appearance order
            std::vector<std::string> order;
            std::map<std::string, std::vector<const backtest::Trade *>> by_symbol;
            for (const auto &t : trades)
            {
                auto it = by_symbol.find(t.symbol);
                if (it == by_symbol.end())
                {
                    order.push_back(t.symbol);
                    by_symbol[t.symbol].push_back(&t);
                }
                else
                {
                    it->second.push_back(&t);
                }
            }

            std::vector<double> pnls;
            for (const auto &symbol : order)
            {
                double position = 0.0;
                double avg_price = 0.0;
                for (const backtest::Trade *t : by_symbol[symbol])
                {
                    if (t->side == backtest::TradeSide::BUY)
                    {
                        if (position <= 0.0)
                        {
                            position += t->quantity;
                            avg_price = t->price;
                        }
                        else
                        {
                            double total_cost = position * avg_price + t->quantity * t->price;
                            position += t->quantity;
                            avg_price = total_cost / position;
                        }
                    }
                    else if (position > 0.0)
                    {
                        double quantity = std::min(t->quantity, position);
                        pnls.push_back((t->price - avg_price) * quantity - t->commission);
                        position -= quantity;
                    }
                    else
                    {
                        position -= t->quantity;
                        avg_price = t->price;
                    }
                }
            }
            return pnls;
        }

        double PerformanceAnalyzer::calculate_total_return(const std::vector<backtest::EquityPoint> &equity_curve,
                                                           double initial_capital) const
        {
            if (equity_curve.empty() || initial_capital == 0.0)
                return 0.0;
            return (equity_curve.back().value - initial_capital) / initial_capital;
        }

        double PerformanceAnalyzer::calculate_annualized_return(const std::vector<backtest::EquityPoint> &equity_curve,
                                                                const backtest::BacktestConfig &config) const
        {
            if (equity_curve.empty())
                return 0.0;

            using seconds = std::chrono::duration<double>;
            double elapsed = std::chrono::duration_cast<seconds>(config.end_date - config.start_date).count();
            double years = elapsed / (DAYS_PER_YEAR * 24.0 * 60.0 * 60.0);
            if (years <= 0.0)
                return 0.0;

            double total = calculate_total_return(equity_curve, config.initial_capital);
            return std::pow(1.0 + total, 1.0 / years) - 1.0;
        }

        // ====================================================================
        // Risk
        // ====================================================================

        double PerformanceAnalyzer::calculate_volatility(const std::vector<double> &returns) const
        {
            if (returns.size() < 2)
                return 0.0;
            double mu = mean(returns);
            double variance = 0.0;
            for (double r : returns)
                variance += (r - mu) * (r - mu);
            variance /= static_cast<double>(returns.size());
            return std::sqrt(variance * PERIODS_PER_YEAR);
        }

        double PerformanceAnalyzer::calculate_sharpe_ratio(const std::vector<double> &returns,
                                                           double risk_free_rate) const
        {
            if (returns.empty())
                return 0.0;
            double volatility = calculate_volatility(returns);
            if (volatility == 0.0)
                return 0.0;
            double excess = mean(returns) - daily_risk_free_rate(risk_free_rate);
            return excess * std::sqrt(PERIODS_PER_YEAR) / volatility;
        }

        double PerformanceAnalyzer::calculate_sortino_ratio(const std::vector<double> &returns,
                                                            double risk_free_rate) const
        {
            if (returns.empty())
                return 0.0;
            const double rf_d = daily_risk_free_rate(risk_free_rate);

            double downside_sum = 0.0;
            size_t downside_count = 0;
            for (double r : returns)
            {
                if (r < rf_d)
                {
                    downside_sum += (r - rf_d) * (r - rf_d);
                    ++downside_count;
                }
            }
            if (downside_count == 0)
                return std::numeric_limits<double>::infinity();

            // averaged over all returns, not only the downside ones
            double downside_variance = downside_sum / static_cast<double>(returns.size());
            double downside_deviation = std::sqrt(downside_variance * PERIODS_PER_YEAR);
            if (downside_deviation == 0.0)
                return 0.0;

            double excess = mean(returns) - rf_d;
            return excess * std::sqrt(PERIODS_PER_YEAR) / downside_deviation;
        }

        double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<backtest::EquityPoint> &equity_curve) const
        {
            if (equity_curve.empty())
                return 0.0;
            double max_drawdown = 0.0;
            double peak = equity_curve.front().value;
            for (const auto &p : equity_curve)
            {
                peak = std::max(peak, p.value);
                if (peak <= 0.0)
                    continue;
                max_drawdown = std::max(max_drawdown, (peak - p.value) / peak);
            }
            return max_drawdown;
        }

        double PerformanceAnalyzer::calculate_profit_factor(const std::vector<double> &trade_pnls) const
        {
            double gross_profit = 0.0;
            double gross_loss = 0.0;
            for (double pnl : trade_pnls)
            {
                if (pnl > 0.0)
                    gross_profit += pnl;
                else if (pnl < 0.0)
                    gross_loss -= pnl;
            }
            if (gross_loss == 0.0)
                return gross_profit > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
            return gross_profit / gross_loss;
        }

        // ====================================================================
        // Benchmark-relative
        // ====================================================================

        double PerformanceAnalyzer::calculate_beta(const std::vector<double> &strategy_returns,
                                                   const std::vector<double> &benchmark_returns) const
        {
            if (strategy_returns.size() != benchmark_returns.size() || strategy_returns.size() < 2)
                return 0.0;

            double s_mean = mean(strategy_returns);
            double b_mean = mean(benchmark_returns);
            double covariance = 0.0;
            double benchmark_variance = 0.0;
            for (size_t i = 0; i < strategy_returns.size(); ++i)
            {
                double sd = strategy_returns[i] - s_mean;
                double bd = benchmark_returns[i] - b_mean;
                covariance += sd * bd;
                benchmark_variance += bd * bd;
            }
            const double n = static_cast<double>(strategy_returns.size());
            covariance /= n;
            benchmark_variance /= n;
            return benchmark_variance == 0.0 ? 0.0 : covariance / benchmark_variance;
        }

        double PerformanceAnalyzer::calculate_alpha(const std::vector<double> &strategy_returns,
                                                    const std::vector<double> &benchmark_returns,
                                                    double risk_free_rate) const
        {
            if (strategy_returns.size() != benchmark_returns.size() || strategy_returns.size() < 2)
                return 0.0;

            double beta = calculate_beta(strategy_returns, benchmark_returns);
            double rf_d = daily_risk_free_rate(risk_free_rate);
            return mean(strategy_returns) - (rf_d + beta * (mean(benchmark_returns) - rf_d));
        }

        double PerformanceAnalyzer::calculate_information_ratio(const std::vector<double> &strategy_returns,
                                                                const std::vector<double> &benchmark_returns) const
        {
            if (strategy_returns.size() != benchmark_returns.size() || strategy_returns.size() < 2)
                return 0.0;

            std::vector<double> excess(strategy_returns.size());
            for (size_t i = 0; i < excess.size(); ++i)
                excess[i] = strategy_returns[i] - benchmark_returns[i];

            double avg = mean(excess);
            double sum_sq = 0.0;
            for (double e : excess)
                sum_sq += (e - avg) * (e - avg);
            double tracking_error = std::sqrt(sum_sq / static_cast<double>(excess.size()));
            return tracking_error == 0.0 ? 0.0 : avg / tracking_error;
        }

    } // namespace analytics
} // namespace backtester
