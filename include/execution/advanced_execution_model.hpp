/**
 * @file advanced_execution_model.hpp
 * @brief Volatility-scaled slippage with participation caps and TWAP
 */

#ifndef BACKTESTER_EXECUTION_ADVANCED_EXECUTION_MODEL_HPP
#define BACKTESTER_EXECUTION_ADVANCED_EXECUTION_MODEL_HPP

#include "execution/execution_model.hpp"

#include <deque>
#include <map>

namespace backtester {
namespace execution {

/**
 * @class AdvancedExecutionModel
 * @brief Liquidity-aware fills using a trailing price and volume history.
 *
 * - Orders are capped at 10% of the trailing average volume.
 * - Orders above 5% of the trailing average volume are split TWAP-style
 *   into min(10, floor(q / 100)) slices (at least one) and only the first
 *   slice is filled.
 * - Fill price = base +/- slippage_rate * base * (1 + 2 * hist_vol) * (1 + 0.5 * sqrt(q / volume)),
 *   where hist_vol is the annualized stdev of log returns (0.02 below two prices).
 * - commission = max(1, notional * rate).
 */
class AdvancedExecutionModel : public ExecutionModel {
public:
    static constexpr size_t HISTORY_LENGTH = 20;
    static constexpr double MAX_VOLUME_FRACTION = 0.1;
    static constexpr double LARGE_ORDER_FRACTION = 0.05;
    static constexpr int MAX_TWAP_SLICES = 10;
    static constexpr double DEFAULT_VOLATILITY = 0.02;

    explicit AdvancedExecutionModel(const backtest::BacktestConfig& config);
    AdvancedExecutionModel(double commission_rate, double slippage_rate);

    std::optional<backtest::Trade> execute_signal(const strategy::Signal& signal,
                                                  const MarketData& data,
                                                  const backtest::Portfolio& portfolio) override;

    /** @brief Always 0; slippage is folded into the execution price. */
    double calculate_slippage(const strategy::Signal& signal, const MarketData& data) const override;
    double calculate_commission(const backtest::Trade& trade) const override;
    std::string get_name() const override { return "Advanced"; }
    void reset() override;

    double average_volume(const std::string& symbol) const;
    double historical_volatility(const std::string& symbol) const;
    double execution_price(const strategy::Signal& signal, const MarketData& data, double quantity) const;

private:
    std::map<std::string, std::deque<double>> price_history_;
    std::map<std::string, std::deque<double>> volume_history_;

    void update_history(const MarketData& data);
};

} // namespace execution
} // namespace backtester

#endif // BACKTESTER_EXECUTION_ADVANCED_EXECUTION_MODEL_HPP
