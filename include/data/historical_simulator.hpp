/**
 * @file historical_simulator.hpp
 * @brief Replay of stored bars in timestamp order
 */

#ifndef BACKTESTER_DATA_HISTORICAL_SIMULATOR_HPP
#define BACKTESTER_DATA_HISTORICAL_SIMULATOR_HPP

#include "data/market_simulator.hpp"

#include <cstddef>

namespace backtester {
namespace data {

/**
 * @class HistoricalDataSimulator
 * @brief Replays a fixed set of bars in ascending timestamp order.
 *
 * Bars are stably sorted by timestamp at construction, so bars sharing a
 * timestamp keep their input order. reset() only rewinds the cursor.
 */
class HistoricalDataSimulator : public MarketSimulator {
public:
    explicit HistoricalDataSimulator(std::vector<MarketData> bars);
    ~HistoricalDataSimulator() override = default;

    bool has_more_data() const override;
    std::optional<MarketData> get_next_bar() override;
    Timestamp get_current_timestamp() const override;
    std::vector<std::string> get_symbols() const override;
    void reset() override;

    /**
     * @brief Bars with start <= timestamp <= end, optionally restricted to symbols.
     * @param symbols Symbols to keep; empty keeps all.
     */
    std::vector<MarketData> get_data_in_range(const Timestamp& start,
                                              const Timestamp& end,
                                              const std::vector<std::string>& symbols = {}) const;

    size_t size() const { return bars_.size(); }
    size_t position() const { return cursor_; }

private:
    std::vector<MarketData> bars_;
    std::vector<std::string> symbols_;
    size_t cursor_ = 0;
};

} // namespace data
} // namespace backtester

#endif // BACKTESTER_DATA_HISTORICAL_SIMULATOR_HPP
