/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads OHLCV bars from CSV files, run configuration from JSON files, and
 * materializes the bar source a configuration describes.
 */

#ifndef BACKTESTER_DATA_DATA_LOADER_HPP
#define BACKTESTER_DATA_DATA_LOADER_HPP

#include "backtest/backtest_config.hpp"
#include "backtest/backtest_engine.hpp"
#include "data/market_data.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace backtester {

/**
 * @struct DataSourceConfig
 * @brief Where the bars of a run come from.
 *
 * Supported types:
 * - "csv": file (long OHLCV format), optional symbols filter
 * - "synthetic": one GBM series per symbol
 * - "correlated": GBM series driven by a correlation matrix
 * - "crash": normal / crash / recovery phases for one symbol
 *
 * Dates and symbols default to the backtest section when omitted.
 */
struct DataSourceConfig {
    std::string type = "synthetic";
    std::string file;                          ///< CSV path (csv)
    std::vector<std::string> symbols;          ///< Symbols to load or generate
    std::string start_date;                    ///< Generation start (synthetic, correlated, crash)
    std::string end_date;                      ///< Generation end (synthetic, correlated)
    int interval_minutes = 60;                 ///< Bar interval of generated data
    double initial_price = 100.0;
    double volatility = 0.02;
    double trend = 0.0001;
    double volume_base = 1000000.0;
    std::uint64_t seed = 42;

    // correlated
    std::vector<std::vector<double>> correlation;
    std::vector<double> initial_prices;
    std::vector<double> volatilities;
    std::vector<double> trends;

    // crash
    std::string crash_start;
    std::string crash_end;
    std::string recovery_end;

    static DataSourceConfig from_json(const nlohmann::json& j);
};

/**
 * @struct StrategyConfig
 * @brief Strategy type and parameters, as accepted by StrategyFactory.
 */
struct StrategyConfig {
    std::string type = "buy_and_hold";
    nlohmann::json parameters = nlohmann::json::object();

    static StrategyConfig from_json(const nlohmann::json& j);
};

/**
 * @struct ExecutionConfig
 * @brief Execution model selection ("realistic" or "advanced").
 */
struct ExecutionConfig {
    std::string model = "realistic";

    static ExecutionConfig from_json(const nlohmann::json& j);
};

/**
 * @struct RunConfig
 * @brief Complete run configuration
 *
 * @code{.json}
 * {
 *   "backtest": { "start_date": "2024-01-01", "end_date": "2024-03-01",
 *                 "initial_capital": 100000, "symbols": ["BTC"],
 *                 "commission": 0.001, "slippage": 0.0005, "verbose": false },
 *   "data": { "type": "synthetic", "interval_minutes": 60, "volatility": 0.3 },
 *   "strategy": { "type": "sma_crossover", "parameters": { "short_period": 5 } },
 *   "execution": { "model": "realistic" }
 * }
 * @endcode
 */
struct RunConfig {
    backtest::BacktestConfig backtest;
    backtest::BacktestParams params;
    DataSourceConfig data;
    StrategyConfig strategy;
    ExecutionConfig execution;

    /**
     * @throws std::invalid_argument if the backtest section is missing or invalid
     */
    static RunConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load complete configuration from JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static RunConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads and saves bars and configuration.
 *
 * CSV format (long, one bar per row, vwap optional):
 * @code
 * timestamp,symbol,open,high,low,close,volume,vwap
 * 2024-01-01 00:00:00,BTC,42000,42100,41900,42050,1250,42016.6
 * @endcode
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV
    // ========================================================================

    /**
     * @brief Load OHLCV bars in file order.
     * @param filepath Path to CSV file
     * @param symbols Optional list of symbols to keep (keeps all if empty)
     * @throws std::runtime_error if the file cannot be opened, the header lacks
     *         a required column, or a row is malformed (message names the line)
     */
    static std::vector<MarketData> load_csv(const std::string& filepath,
                                            const std::vector<std::string>& symbols = {});

    /**
     * @brief Save bars in the format read by load_csv().
     * @throws std::runtime_error if the file cannot be opened
     */
    static void save_csv(const std::vector<MarketData>& bars, const std::string& filepath);

    // ========================================================================
    // Configuration
    // ========================================================================

    /**
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    static RunConfig load_config(const std::string& config_path);

    // ========================================================================
    // Bar sources
    // ========================================================================

    /**
     * @brief Load or generate the bars a data section describes.
     * @throws std::invalid_argument for an unknown type or inconsistent parameters
     * @throws std::runtime_error for CSV errors
     */
    static std::vector<MarketData> load_bars(const DataSourceConfig& source,
                                             const backtest::BacktestConfig& backtest);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);
    static double parse_number(const std::string& field, const std::string& column, size_t line_number);
};

} // namespace backtester

#endif // BACKTESTER_DATA_DATA_LOADER_HPP
