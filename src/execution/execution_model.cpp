/**
 * @file execution_model.cpp
 * @brief Shared signal-to-trade logic and the execution model factory
 */

#include "execution/execution_model.hpp"
#include "execution/advanced_execution_model.hpp"
#include "execution/realistic_execution_model.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace backtester
{
    namespace execution
    {

        ExecutionModel::ExecutionModel(double commission_rate, double slippage_rate)
            : commission_rate_(commission_rate), slippage_rate_(slippage_rate)
        {
            if (commission_rate < 0.0)
            {
                std::ostringstream ss;
                ss << commission_rate;
                throw std::invalid_argument("Expected positive value for parameter 'commission_rate', got: " + ss.str());
            }
            if (slippage_rate < 0.0)
            {
                std::ostringstream ss;
                ss << slippage_rate;
                throw std::invalid_argument("Expected positive value for parameter 'slippage_rate', got: " + ss.str());
            }
        }

        ExecutionModel::ExecutionModel(const backtest::BacktestConfig &config)
            : ExecutionModel(config.commission, config.slippage)
        {
        }

        std::unique_ptr<ExecutionModel> ExecutionModel::create(const std::string &type,
                                                               const backtest::BacktestConfig &config)
        {
            std::string normalized = type;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });

            if (normalized == "realistic")
            {
                return std::make_unique<RealisticExecutionModel>(config);
            }
            else if (normalized == "advanced")
            {
                return std::make_unique<AdvancedExecutionModel>(config);
            }
            throw std::invalid_argument("Unknown execution model: '" + type + "'. Valid options: realistic, advanced");
        }

        double ExecutionModel::resolve_quantity(const strategy::Signal &signal,
                                                const backtest::Portfolio &portfolio,
                                                double price)
        {
            if (signal.quantity && *signal.quantity > 0.0)
                return *signal.quantity;
            if (!(price > 0.0))
                return 0.0;

            if (signal.target_weight && *signal.target_weight > 0.0)
            {
                double target_value = portfolio.total_value() * *signal.target_weight;
                return std::floor(target_value / price);
            }

            if (signal.action == strategy::SignalAction::BUY)
            {
                return std::floor(portfolio.cash() * DEFAULT_CASH_FRACTION / price);
            }
            return portfolio.position_quantity(signal.symbol);
        }

        double ExecutionModel::reference_price(const strategy::Signal &signal, const MarketData &data)
        {
            if (signal.price && *signal.price > 0.0)
                return *signal.price;
            return data.close;
        }

        std::string ExecutionModel::next_trade_id()
        {
            std::ostringstream ss;
            ss << 'T' << std::setw(6) << std::setfill('0') << next_id_++;
            return ss.str();
        }

        backtest::Trade ExecutionModel::make_trade(const strategy::Signal &signal, const MarketData &data,
                                                   double quantity, double price, double slippage)
        {
            backtest::Trade trade;
            trade.id = next_trade_id();
            trade.timestamp = data.timestamp;
            trade.symbol = signal.symbol;
            trade.side = signal.action == strategy::SignalAction::BUY ? backtest::TradeSide::BUY
                                                                      : backtest::TradeSide::SELL;
            trade.quantity = quantity;
            trade.price = price;
            trade.slippage = slippage;
            trade.strategy_id = signal.strategy_id;
            trade.commission = calculate_commission(trade);
            return trade;
        }

    } // namespace execution
} // namespace backtester
