/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/synthetic_data_generator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace backtester
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataSourceConfig DataSourceConfig::from_json(const nlohmann::json &j)
    {
        DataSourceConfig config;
        if (!j.is_object())
            return config;

        config.type = j.value("type", config.type);
        std::transform(config.type.begin(), config.type.end(), config.type.begin(), [](unsigned char c)
                       { return std::tolower(c); });
        config.file = j.value("file", "");
        config.symbols = j.value("symbols", std::vector<std::string>{});
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.interval_minutes = j.value("interval_minutes", config.interval_minutes);
        config.initial_price = j.value("initial_price", config.initial_price);
        config.volatility = j.value("volatility", config.volatility);
        config.trend = j.value("trend", config.trend);
        config.volume_base = j.value("volume_base", config.volume_base);
        config.seed = j.value("seed", config.seed);

        config.correlation = j.value("correlation", std::vector<std::vector<double>>{});
        config.initial_prices = j.value("initial_prices", std::vector<double>{});
        config.volatilities = j.value("volatilities", std::vector<double>{});
        config.trends = j.value("trends", std::vector<double>{});

        config.crash_start = j.value("crash_start", "");
        config.crash_end = j.value("crash_end", "");
        config.recovery_end = j.value("recovery_end", "");
        return config;
    }

    StrategyConfig StrategyConfig::from_json(const nlohmann::json &j)
    {
        StrategyConfig config;
        if (!j.is_object())
            return config;
        config.type = j.value("type", config.type);
        config.parameters = j.value("parameters", nlohmann::json::object());
        return config;
    }

    ExecutionConfig ExecutionConfig::from_json(const nlohmann::json &j)
    {
        ExecutionConfig config;
        if (j.is_object())
            config.model = j.value("model", config.model);
        return config;
    }

    RunConfig RunConfig::from_json(const nlohmann::json &j)
    {
        if (!j.is_object() || !j.contains("backtest"))
        {
            throw std::invalid_argument("Run configuration must contain a 'backtest' section");
        }

        RunConfig config;
        config.backtest = backtest::BacktestConfig::from_json(j["backtest"]);
        config.params = backtest::BacktestParams::from_json(j["backtest"]);

        if (j.contains("data"))
        {
            config.data = DataSourceConfig::from_json(j["data"]);
        }
        if (j.contains("strategy"))
        {
            config.strategy = StrategyConfig::from_json(j["strategy"]);
        }
        if (j.contains("execution"))
        {
            config.execution = ExecutionConfig::from_json(j["execution"]);
        }
        return config;
    }

    RunConfig RunConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading
    // ===========================

    std::vector<MarketData> DataLoader::load_csv(const std::string &filepath,
                                                 const std::vector<std::string> &symbols)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        std::map<std::string, size_t> columns;
        std::vector<std::string> header = parse_csv_line(line);
        for (size_t i = 0; i < header.size(); ++i)
        {
            std::string name = trim(header[i]);
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            columns[name] = i;
        }

        const std::vector<std::string> required = {"timestamp", "symbol", "open", "high", "low", "close", "volume"};
        for (const auto &name : required)
        {
            if (columns.find(name) == columns.end())
            {
                throw std::runtime_error("CSV header is missing required column '" + name + "': " + filepath);
            }
        }
        auto vwap_it = columns.find("vwap");
        const bool has_vwap = vwap_it != columns.end();

        std::set<std::string> filter(symbols.begin(), symbols.end());
        std::vector<MarketData> bars;
        size_t line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            std::vector<std::string> fields = parse_csv_line(line);
            if (fields.size() < header.size() - (has_vwap ? 1 : 0))
            {
                throw std::runtime_error("Expected " + std::to_string(header.size()) + " fields on line " +
                                         std::to_string(line_number) + ", got " + std::to_string(fields.size()));
            }

            auto field = [&](const std::string &name) -> std::string
            {
                size_t idx = columns.at(name);
                return idx < fields.size() ? trim(fields[idx]) : std::string();
            };

            MarketData bar;
            bar.symbol = field("symbol");
            if (!filter.empty() && filter.count(bar.symbol) == 0)
                continue;

            try
            {
                bar.timestamp = parse_timestamp(field("timestamp"));
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error(std::string(e.what()) + " on line " + std::to_string(line_number));
            }

            bar.open = parse_number(field("open"), "open", line_number);
            bar.high = parse_number(field("high"), "high", line_number);
            bar.low = parse_number(field("low"), "low", line_number);
            bar.close = parse_number(field("close"), "close", line_number);
            bar.volume = parse_number(field("volume"), "volume", line_number);
            if (has_vwap)
            {
                std::string v = field("vwap");
                if (!v.empty())
                    bar.vwap = parse_number(v, "vwap", line_number);
            }

            bars.push_back(bar);
        }

        return bars;
    }

    void DataLoader::save_csv(const std::vector<MarketData> &bars, const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "timestamp,symbol,open,high,low,close,volume,vwap\n";
        file << std::setprecision(12);
        for (const auto &bar : bars)
        {
            file << format_timestamp(bar.timestamp) << ","
                 << bar.symbol << ","
                 << bar.open << ","
                 << bar.high << ","
                 << bar.low << ","
                 << bar.close << ","
                 << bar.volume << ",";
            if (bar.vwap)
                file << *bar.vwap;
            file << "\n";
        }

        file.close();
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    RunConfig DataLoader::load_config(const std::string &config_path)
    {
        return RunConfig::from_json(load_json(config_path));
    }

    // ===========================
    // Bar sources
    // ===========================

    std::vector<MarketData> DataLoader::load_bars(const DataSourceConfig &source,
                                                  const backtest::BacktestConfig &backtest)
    {
        const std::vector<std::string> &symbols = source.symbols.empty() ? backtest.symbols : source.symbols;
        Timestamp start = source.start_date.empty() ? backtest.start_date : parse_timestamp(source.start_date);
        Timestamp end = source.end_date.empty() ? backtest.end_date : parse_timestamp(source.end_date);

        if (source.type == "csv")
        {
            if (source.file.empty())
                throw std::invalid_argument("CSV data source requires 'file'");
            return load_csv(source.file, source.symbols);
        }

        if (source.type == "synthetic")
        {
            std::vector<MarketData> bars;
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                auto series = data::SyntheticDataGenerator::generate_ohlc_data(
                    symbols[i], start, end, source.interval_minutes, source.initial_price,
                    source.volatility, source.trend, source.volume_base, source.seed + i);
                bars.insert(bars.end(), series.begin(), series.end());
            }
            return bars;
        }

        if (source.type == "correlated")
        {
            const Eigen::Index n = static_cast<Eigen::Index>(symbols.size());
            if (static_cast<Eigen::Index>(source.correlation.size()) != n)
                throw std::invalid_argument("Dimension mismatch in parameters");

            Eigen::MatrixXd corr(n, n);
            for (Eigen::Index r = 0; r < n; ++r)
            {
                const auto &row = source.correlation[static_cast<size_t>(r)];
                if (static_cast<Eigen::Index>(row.size()) != n)
                    throw std::invalid_argument("Dimension mismatch in parameters");
                for (Eigen::Index c = 0; c < n; ++c)
                    corr(r, c) = row[static_cast<size_t>(c)];
            }

            auto to_vector = [n](const std::vector<double> &values, double fallback) -> Eigen::VectorXd
            {
                if (values.empty())
                    return Eigen::VectorXd::Constant(n, fallback).eval();
                return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size())).eval();
            };

            data::CorrelatedAssetParams params;
            params.initial_prices = to_vector(source.initial_prices, source.initial_price);
            params.volatilities = to_vector(source.volatilities, source.volatility);
            params.trends = to_vector(source.trends, source.trend);

            return data::SyntheticDataGenerator::generate_correlated_data(
                symbols, start, end, corr, params, source.interval_minutes, source.seed);
        }

        if (source.type == "crash")
        {
            if (symbols.empty())
                throw std::invalid_argument("Crash scenario requires a symbol");
            if (source.crash_start.empty() || source.crash_end.empty())
                throw std::invalid_argument("Crash scenario requires 'crash_start' and 'crash_end'");
            Timestamp recovery_end = source.recovery_end.empty() ? end : parse_timestamp(source.recovery_end);
            return data::SyntheticDataGenerator::generate_crash_scenario(
                symbols.front(), start, parse_timestamp(source.crash_start), parse_timestamp(source.crash_end),
                recovery_end, source.interval_minutes, source.seed);
        }

        throw std::invalid_argument("Unknown data source type: '" + source.type +
                                    "'. Valid options: csv, synthetic, correlated, crash");
    }

    // ===========================
    // Private Helper Methods
    // ===========================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::parse_number(const std::string &field, const std::string &column, size_t line_number)
    {
        size_t consumed = 0;
        double value = 0.0;
        try
        {
            value = std::stod(field, &consumed);
        }
        catch (const std::logic_error &)
        {
            consumed = 0;
        }
        if (consumed == 0 || consumed != field.size() || !std::isfinite(value))
        {
            throw std::runtime_error("Invalid " + column + " value '" + field + "' on line " +
                                     std::to_string(line_number));
        }
        return value;
    }

} // namespace backtester
