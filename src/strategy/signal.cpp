#include "strategy/signal.hpp"

namespace backtester {
namespace strategy {

std::string to_string(SignalAction action) {
    switch (action) {
        case SignalAction::BUY: return "buy";
        case SignalAction::SELL: return "sell";
        case SignalAction::HOLD: return "hold";
    }
    return "unknown";
}

} // namespace strategy
} // namespace backtester
