/**
 * @file market_data.hpp
 * @brief OHLCV bar type and timestamp utilities.
 *
 * A MarketData bar is one sample for one symbol at one timestamp. Bars are
 * produced by a MarketSimulator and are never modified afterwards.
 *
 * Timestamps are system_clock time points interpreted in UTC. String
 * conversion uses the ISO-like form "YYYY-MM-DD HH:MM:SS".
 */

#ifndef BACKTESTER_DATA_MARKET_DATA_HPP
#define BACKTESTER_DATA_MARKET_DATA_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace backtester
{

    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * @struct MarketData
     * @brief One OHLCV bar for a single symbol.
     */
    struct MarketData
    {
        Timestamp timestamp;         ///< Bar time (UTC)
        std::string symbol;          ///< Instrument identifier
        double open = 0.0;           ///< Opening price
        double high = 0.0;           ///< Highest traded price
        double low = 0.0;            ///< Lowest traded price
        double close = 0.0;          ///< Closing price
        double volume = 0.0;         ///< Traded volume
        std::optional<double> vwap;  ///< Volume weighted average price, if known
    };

    /**
     * @brief Parse a timestamp string.
     *
     * Accepted forms: "YYYY-MM-DD", "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH:MM:SS".
     * A 'T' separator is accepted in place of the space.
     *
     * @param text Timestamp text (UTC).
     * @return Parsed time point.
     * @throws std::invalid_argument if the text is not a valid timestamp.
     */
    Timestamp parse_timestamp(const std::string &text);

    /**
     * @brief Format a timestamp as "YYYY-MM-DD HH:MM:SS" (UTC).
     */
    std::string format_timestamp(const Timestamp &ts);

    /**
     * @brief Hour of day (0-23) of a timestamp in UTC.
     */
    int utc_hour(const Timestamp &ts);

    /**
     * @brief Build a timestamp from calendar fields (UTC).
     */
    Timestamp make_timestamp(int year, int month, int day,
                             int hour = 0, int minute = 0, int second = 0);

    /** @brief Distinct symbols of a bar list in first-appearance order. */
    std::vector<std::string> unique_symbols(const std::vector<MarketData> &bars);

} // namespace backtester

#endif // BACKTESTER_DATA_MARKET_DATA_HPP
