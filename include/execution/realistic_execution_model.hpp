/**
 * @file realistic_execution_model.hpp
 * @brief Fixed-rate slippage and commission model
 */

#ifndef BACKTESTER_EXECUTION_REALISTIC_EXECUTION_MODEL_HPP
#define BACKTESTER_EXECUTION_REALISTIC_EXECUTION_MODEL_HPP

#include "execution/execution_model.hpp"

namespace backtester {
namespace execution {

/**
 * @class RealisticExecutionModel
 * @brief Single-bar fill with condition-dependent slippage and square-root impact.
 *
 * slippage = rate * (1 + 10 * spread + 5 * range_volatility) * close,
 * times 1.5 before 10:00 or after 15:59 UTC. Market impact is
 * sqrt(quantity / (volume / 100)) * 0.001 * close. Both move the fill
 * against the trader.
 *
 * commission = max(1, min(notional * rate, 0.005 * quantity)).
 */
class RealisticExecutionModel : public ExecutionModel {
public:
    static constexpr double PER_SHARE_COMMISSION = 0.005;
    static constexpr double OFF_HOURS_MULTIPLIER = 1.5;
    static constexpr double IMPACT_COEFFICIENT = 0.001;

    explicit RealisticExecutionModel(const backtest::BacktestConfig& config);
    RealisticExecutionModel(double commission_rate, double slippage_rate);

    std::optional<backtest::Trade> execute_signal(const strategy::Signal& signal,
                                                  const MarketData& data,
                                                  const backtest::Portfolio& portfolio) override;

    double calculate_slippage(const strategy::Signal& signal, const MarketData& data) const override;
    double calculate_commission(const backtest::Trade& trade) const override;
    std::string get_name() const override { return "Realistic"; }

    /** @brief Per-unit price impact of trading `quantity` on this bar (0 for zero volume). */
    double calculate_market_impact(double quantity, const MarketData& data) const;

private:
    static double range_fraction(const MarketData& data);
};

} // namespace execution
} // namespace backtester

#endif // BACKTESTER_EXECUTION_REALISTIC_EXECUTION_MODEL_HPP
