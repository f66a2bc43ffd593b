// ============================================================================
// Implementation of Portfolio
// ============================================================================

#include "backtest/portfolio.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace backtester {
namespace backtest {

std::string to_string(TradeSide side) {
    return side == TradeSide::BUY ? "buy" : "sell";
}

// ============================================================================
// Portfolio - lifecycle
// ============================================================================

Portfolio::Portfolio(double initial_capital)
    : initial_capital_(initial_capital), cash_(initial_capital), total_value_(initial_capital) {
    if (!(initial_capital > 0.0)) {
        throw std::invalid_argument("initial_capital must be > 0");
    }
}

void Portfolio::reset(double initial_capital) {
    if (!(initial_capital > 0.0)) throw std::invalid_argument("initial_capital must be > 0");
    initial_capital_ = initial_capital;
    cash_ = initial_capital;
    total_value_ = initial_capital;
    total_pnl_ = 0.0;
    positions_.clear();
    trades_.clear();
}

// ============================================================================
// Portfolio - queries
// ============================================================================

int Portfolio::find_index(const std::string& symbol) const {
    for (size_t i = 0; i < positions_.size(); ++i) {
        if (positions_[i].symbol == symbol) return static_cast<int>(i);
    }
    return -1;
}

const Position* Portfolio::find_position(const std::string& symbol) const {
    int idx = find_index(symbol);
    if (idx < 0) return nullptr;
    return &positions_[static_cast<size_t>(idx)];
}

bool Portfolio::has_position(const std::string& symbol) const {
    return find_index(symbol) >= 0;
}

double Portfolio::position_quantity(const std::string& symbol) const {
    const Position* p = find_position(symbol);
    return p ? p->quantity : 0.0;
}

double Portfolio::positions_value() const {
    double invested = 0.0;
    for (const auto& p : positions_) invested += p.market_value;
    return invested;
}

// ============================================================================
// Portfolio - valuation
// ============================================================================

void Portfolio::mark_to_market(const MarketData& bar) {
    int idx = find_index(bar.symbol);
    if (idx >= 0) {
        Position& pos = positions_[static_cast<size_t>(idx)];
        pos.market_value = pos.quantity * bar.close;
        pos.unrealized_pnl = pos.market_value - (pos.quantity * pos.average_price);
    }
    revalue();
}

void Portfolio::revalue() {
    total_value_ = cash_ + positions_value();
    total_pnl_ = total_value_ - initial_capital_;
}

// ============================================================================
// Portfolio - trading
// ============================================================================

std::optional<Trade> Portfolio::apply_trade(Trade trade) {
    if (!(trade.quantity > 0.0) || !(trade.price > 0.0)) return std::nullopt;

    std::optional<Trade> applied =
        trade.side == TradeSide::BUY ? apply_buy(std::move(trade)) : apply_sell(std::move(trade));
    if (!applied) return std::nullopt;

    trades_.push_back(*applied);
    revalue();
    return applied;
}

std::optional<Trade> Portfolio::apply_buy(Trade trade) {
    double cost = (trade.quantity * trade.price) + trade.commission + trade.slippage;

    if (cost > cash_) {
        // insufficient funds: largest affordable whole quantity
        double per_unit_slippage = trade.slippage / trade.quantity;
        double max_quantity = std::floor((cash_ - trade.commission) / (trade.price + per_unit_slippage));
        if (!(max_quantity > 0.0)) return std::nullopt;

        trade.quantity = max_quantity;
        trade.slippage = per_unit_slippage * max_quantity;
        cost = (trade.quantity * trade.price) + trade.commission + trade.slippage;
    }
    cash_ = std::max(0.0, cash_ - cost);

    int idx = find_index(trade.symbol);
    if (idx >= 0) {
        Position& pos = positions_[static_cast<size_t>(idx)];
        double total_quantity = pos.quantity + trade.quantity;
        double total_cost = (pos.quantity * pos.average_price) + (trade.quantity * trade.price);
        pos.average_price = total_cost / total_quantity;
        pos.quantity = total_quantity;
        pos.market_value = total_quantity * trade.price;
        pos.unrealized_pnl = pos.market_value - total_cost;
    } else {
        Position pos;
        pos.symbol = trade.symbol;
        pos.quantity = trade.quantity;
        pos.average_price = trade.price;
        pos.market_value = trade.quantity * trade.price;
        positions_.push_back(pos);
    }
    return trade;
}

std::optional<Trade> Portfolio::apply_sell(Trade trade) {
    int idx = find_index(trade.symbol);
    if (idx < 0) return std::nullopt;

    Position& pos = positions_[static_cast<size_t>(idx)];
    trade.quantity = std::min(trade.quantity, pos.quantity);

    double proceeds = (trade.quantity * trade.price) - trade.commission - trade.slippage;
    // fees must be payable from cash plus the sale notional
    if (cash_ + proceeds < 0.0) return std::nullopt;
    cash_ += proceeds;

    pos.realized_pnl += (trade.price - pos.average_price) * trade.quantity;
    pos.quantity -= trade.quantity;
    pos.market_value = pos.quantity * trade.price;
    pos.unrealized_pnl = pos.market_value - (pos.quantity * pos.average_price);

    if (pos.quantity == 0.0) {
        positions_.erase(positions_.begin() + idx);
    }
    return trade;
}

// ============================================================================
// Portfolio - utilities
// ============================================================================

void Portfolio::print_summary() const {
    std::cout << std::fixed << std::setprecision(2)
              << "Cash: " << cash_ << " Total value: " << total_value_
              << " P&L: " << total_pnl_ << " Positions: " << positions_.size()
              << " Trades: " << trades_.size() << "\n";
    for (const auto& p : positions_) {
        std::cout << "  " << std::setw(10) << std::left << p.symbol << std::right
                  << " qty=" << p.quantity << " avg=" << p.average_price
                  << " mv=" << p.market_value << " upnl=" << p.unrealized_pnl << "\n";
    }
}

} // namespace backtest
} // namespace backtester
