/**
 * @file signal.hpp
 * @brief Trading signal emitted by strategies
 */

#pragma once

#include <optional>
#include <string>

namespace backtester {
namespace strategy {

enum class SignalAction {
    BUY,
    SELL,
    HOLD
};

std::string to_string(SignalAction action);

/**
 * @struct Signal
 * @brief Trade intent emitted by a strategy for one bar.
 *
 * Size is given by quantity or target_weight; when neither is set the
 * execution model applies its default sizing.
 */
struct Signal {
    std::string symbol;
    SignalAction action = SignalAction::HOLD;
    std::optional<double> quantity;       ///< Units to trade
    std::optional<double> target_weight;  ///< Fraction of portfolio total value
    std::optional<double> price;          ///< Reference price; bar close if unset
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::string strategy_id;
    std::optional<double> confidence;     ///< 0..1 where meaningful
    std::string reason;
};

} // namespace strategy
} // namespace backtester
