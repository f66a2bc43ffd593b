// SPDX-License-Identifier: MIT
#ifndef BACKTESTER_BACKTEST_PORTFOLIO_HPP
#define BACKTESTER_BACKTEST_PORTFOLIO_HPP

#include <optional>
#include <string>
#include <vector>

#include "data/market_data.hpp"

namespace backtester {
namespace backtest {

enum class TradeSide {
    BUY,
    SELL
};

std::string to_string(TradeSide side);

/**
 * @struct Trade
 * @brief Executed fill. Append-only audit record.
 */
struct Trade {
    std::string id;            ///< Unique trade identifier
    Timestamp timestamp;       ///< Bar time of the fill
    std::string symbol;        ///< Instrument
    TradeSide side = TradeSide::BUY;
    double quantity = 0.0;     ///< Units filled (> 0)
    double price = 0.0;        ///< Fill price including slippage and impact
    double commission = 0.0;   ///< Commission charged (currency)
    double slippage = 0.0;     ///< Slippage charged on top of the fill (currency)
    std::string strategy_id;   ///< Strategy that requested the trade

    double notional() const { return quantity * price; }
};

/**
 * @struct Position
 * @brief Long-only holding in one symbol.
 */
struct Position {
    std::string symbol;          ///< Instrument
    double quantity = 0.0;       ///< Units held (> 0 while the position exists)
    double average_price = 0.0;  ///< Average cost per unit, commission excluded
    double market_value = 0.0;   ///< quantity * last valuation price
    double unrealized_pnl = 0.0; ///< market_value - quantity * average_price
    double realized_pnl = 0.0;   ///< Accumulated (price - average_price) * sold quantity
};

/**
 * @struct EquityPoint
 * @brief One equity-curve sample recorded after a processed bar.
 */
struct EquityPoint {
    Timestamp timestamp;
    double value = 0.0;     ///< Portfolio total value
    double drawdown = 0.0;  ///< (running peak - value) / running peak
};

/**
 * @struct PositionSnapshot
 * @brief Copy of all open positions after a processed bar.
 */
struct PositionSnapshot {
    Timestamp timestamp;
    std::vector<Position> positions;
};

/**
 * @class Portfolio
 * @brief Cash, positions and trade log of a long-only account.
 *
 * Positions are kept in insertion order. A position is removed as soon as
 * its quantity reaches exactly zero.
 *
 * Invariants (after every mutation):
 *  - cash() >= 0
 *  - total_value() == cash() + sum of position market values
 */
class Portfolio {
public:
    explicit Portfolio(double initial_capital);
    ~Portfolio() = default;

    // -- State queries
    double cash() const { return cash_; }
    double total_value() const { return total_value_; }
    double total_pnl() const { return total_pnl_; }
    double initial_capital() const { return initial_capital_; }

    const std::vector<Position>& positions() const { return positions_; }
    const Position* find_position(const std::string& symbol) const;
    bool has_position(const std::string& symbol) const;
    double position_quantity(const std::string& symbol) const;
    double positions_value() const;

    const std::vector<Trade>& trades() const { return trades_; }

    // -- Valuation

    /**
     * @brief Revalue the position in bar.symbol at bar.close.
     *
     * Other positions keep the market value of their own last update.
     * Totals are recomputed from cash and all market values.
     */
    void mark_to_market(const MarketData& bar);

    /** @brief Recompute total value and P&L from cash and market values. */
    void revalue();

    // -- Trading

    /**
     * @brief Apply a fill to the ledger.
     *
     * Buy: cost = quantity * price + commission + slippage. When cost exceeds
     * cash the quantity is reduced to the largest whole number affordable
     * given commission and per-unit slippage; slippage is scaled to the new
     * quantity. Average price blends old and new fills without commission.
     *
     * Sell: quantity is clipped to the held amount; proceeds
     * quantity * price - commission - slippage are credited; realized P&L
     * grows by (price - average_price) * quantity. A sell whose fees exceed
     * cash plus notional is skipped and the position is left unchanged.
     *
     * @return The trade as recorded (possibly with reduced quantity), or
     *         std::nullopt if nothing could be executed. Never throws for
     *         insufficient cash or shares.
     */
    std::optional<Trade> apply_trade(Trade trade);

    // -- Utilities
    void print_summary() const;
    void reset(double initial_capital);

private:
    double initial_capital_;
    double cash_;
    double total_value_;
    double total_pnl_ = 0.0;
    std::vector<Position> positions_;
    std::vector<Trade> trades_;

    int find_index(const std::string& symbol) const;
    std::optional<Trade> apply_buy(Trade trade);
    std::optional<Trade> apply_sell(Trade trade);
};

} // namespace backtest
} // namespace backtester

#endif // BACKTESTER_BACKTEST_PORTFOLIO_HPP
