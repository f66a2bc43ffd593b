/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic OHLCV data for the backtester
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/synthetic_data_generator.hpp"
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

using namespace backtester;

namespace {

std::vector<std::string> split_symbols(const std::string& list) {
    std::vector<std::string> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    std::vector<std::string> symbols = {"BTC", "ETH", "SOL"};
    std::string output_file = "data/market/synthetic_bars.csv";
    std::string start = "2024-01-01";
    std::string end = "2024-03-31";
    int interval_minutes = 60;
    double volatility = 0.5;    // annualized
    double trend = 0.1;         // annualized drift
    std::uint64_t seed = data::SyntheticDataGenerator::DEFAULT_SEED;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_file = argv[++i];
            } else if (arg == "--symbols" && i + 1 < argc) {
                symbols = split_symbols(argv[++i]);
            } else if (arg == "--start" && i + 1 < argc) {
                start = argv[++i];
            } else if (arg == "--end" && i + 1 < argc) {
                end = argv[++i];
            } else if (arg == "--interval" && i + 1 < argc) {
                interval_minutes = std::stoi(argv[++i]);
            } else if (arg == "--volatility" && i + 1 < argc) {
                volatility = std::stod(argv[++i]);
            } else if (arg == "--trend" && i + 1 < argc) {
                trend = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/synthetic_bars.csv)\n"
                          << "  --symbols LIST     Comma-separated symbols (default: BTC,ETH,SOL)\n"
                          << "  --start DATE       First bar (default: 2024-01-01)\n"
                          << "  --end DATE         Last bar (default: 2024-03-31)\n"
                          << "  --interval MIN     Bar interval in minutes (default: 60)\n"
                          << "  --volatility VAL   Annualized volatility (default: 0.5)\n"
                          << "  --trend VAL        Annualized drift (default: 0.1)\n"
                          << "  --seed N           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            }
        }

        if (symbols.empty()) {
            std::cerr << "Error: no symbols given" << std::endl;
            return 1;
        }

        Timestamp start_ts = parse_timestamp(start);
        Timestamp end_ts = parse_timestamp(end);

        std::cout << "Generating " << symbols.size() << " series from " << start
                  << " to " << end << " every " << interval_minutes << " minutes..." << std::endl;

        std::vector<MarketData> bars;
        for (size_t i = 0; i < symbols.size(); ++i) {
            auto series = data::SyntheticDataGenerator::generate_ohlc_data(
                symbols[i], start_ts, end_ts, interval_minutes, 100.0, volatility, trend, 1000000.0, seed + i);
            bars.insert(bars.end(), series.begin(), series.end());
        }

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_csv(bars, output_file);

        // Per-symbol summary
        std::map<std::string, std::pair<double, double>> first_last;
        std::map<std::string, size_t> counts;
        for (const auto& bar : bars) {
            auto it = first_last.find(bar.symbol);
            if (it == first_last.end()) {
                first_last[bar.symbol] = {bar.close, bar.close};
            } else {
                it->second.second = bar.close;
            }
            ++counts[bar.symbol];
        }

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << std::string(50, '-') << "\n";
        std::cout << std::setw(8) << "Symbol"
                  << std::setw(10) << "Bars"
                  << std::setw(14) << "First Close"
                  << std::setw(14) << "Last Close" << "\n";
        std::cout << std::string(50, '-') << "\n";
        for (const auto& entry : first_last) {
            std::cout << std::setw(8) << entry.first
                      << std::setw(10) << counts[entry.first]
                      << std::setw(14) << std::fixed << std::setprecision(2) << entry.second.first
                      << std::setw(14) << entry.second.second << "\n";
        }
        std::cout << std::string(50, '-') << "\n";

        std::cout << "\nData generation complete.\n" << std::endl;
        std::cout << "You can now run:\n";
        std::cout << "  ./build/bin/backtester --config data/config/backtest_config.json --verbose\n";
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
