/**
 * @file backtest_config.hpp
 * @brief Backtest period, capital and cost configuration
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "data/market_data.hpp"

namespace backtester {
namespace backtest {

/**
 * @struct BacktestConfig
 * @brief Immutable parameters of one backtest run.
 *
 * Example:
 * @code{.json}
 * {
 *   "start_date": "2024-01-01",
 *   "end_date": "2024-06-30",
 *   "initial_capital": 100000,
 *   "symbols": ["BTC", "ETH"],
 *   "commission": 0.001,
 *   "slippage": 0.0005,
 *   "benchmark_symbol": "BTC",
 *   "risk_free_rate": 0.02
 * }
 * @endcode
 */
struct BacktestConfig {
    static constexpr double DEFAULT_RISK_FREE_RATE = 0.02;

    Timestamp start_date;
    Timestamp end_date;
    double initial_capital{100000.0};
    std::vector<std::string> symbols;
    double commission{0.001};   ///< Commission rate on notional
    double slippage{0.001};     ///< Base slippage rate on price
    std::optional<std::string> benchmark_symbol;
    std::optional<double> risk_free_rate;  ///< Annualized; DEFAULT_RISK_FREE_RATE when unset

    double effective_risk_free_rate() const { return risk_free_rate.value_or(DEFAULT_RISK_FREE_RATE); }
    bool in_range(const Timestamp& ts) const { return !(ts < start_date) && !(ts > end_date); }

    /**
     * @brief Read a configuration object. Missing optional fields keep their defaults.
     * @throws std::invalid_argument if a date is missing or malformed, or validate() fails
     */
    static BacktestConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    /** @throws std::invalid_argument describing the first violated constraint */
    void validate() const;
};

} // namespace backtest
} // namespace backtester
