/**
 * @file main.cpp
 * @brief Main entry point for the backtester CLI
 *
 * Loads a run configuration, builds the bar source, strategy and execution
 * model, runs the backtest and exports the results.
 */

#include "backtest/backtest_engine.hpp"
#include "data/data_loader.hpp"
#include "data/historical_simulator.hpp"
#include "execution/execution_model.hpp"
#include "strategy/strategy_factory.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

using namespace backtester;

namespace
{

    const char *const RULE = "----------------------------------------------------------------";

    void print_usage(const char *program_name)
    {
        std::cout << "Backtester v1.0.0\n"
                  << "Usage: " << program_name << " -c CONFIG [-o DIR] [-v]\n\n"
                  << "  -c, --config PATH     Run configuration (JSON, required)\n"
                  << "  -o, --output DIR      Directory for equity_curve.csv, trades.csv and\n"
                  << "                        metrics.json (default: results)\n"
                  << "  -v, --verbose         Log engine events to stderr\n"
                  << "      --list-strategies Print the built-in strategy types and exit\n"
                  << "  -h, --help            Show this message\n"
                  << "\nLong options also accept --name=value.\n"
                  << "Example: " << program_name << " -c data/config/backtest_config.json -v\n";
    }

    void print_banner()
    {
        std::cout << RULE << "\n"
                  << "  Backtester v1.0.0 | bar-by-bar strategy simulation\n"
                  << RULE << "\n";
    }

    /// Options for one CLI invocation.
    struct CommandLineArgs
    {
        std::string config_path;
        std::string output_dir = "results";
        bool verbose = false;
        bool show_help = false;
        bool list_strategies = false;
        std::string error;

        static CommandLineArgs parse(int argc, char *argv[])
        {
            CommandLineArgs args;
            for (int i = 1; i < argc && args.error.empty(); ++i)
            {
                std::string arg = argv[i];
                std::string inline_value;
                bool has_inline = false;
                auto eq = arg.find('=');
                if (arg.rfind("--", 0) == 0 && eq != std::string::npos)
                {
                    inline_value = arg.substr(eq + 1);
                    arg = arg.substr(0, eq);
                    has_inline = true;
                }

                auto take_value = [&](std::string &out) {
                    if (has_inline)
                        out = inline_value;
                    else if (i + 1 < argc)
                        out = argv[++i];
                    else
                        args.error = "Missing value for " + arg;
                };

                if (arg == "-h" || arg == "--help")
                    args.show_help = true;
                else if (arg == "-v" || arg == "--verbose")
                    args.verbose = true;
                else if (arg == "--list-strategies")
                    args.list_strategies = true;
                else if (arg == "-c" || arg == "--config")
                    take_value(args.config_path);
                else if (arg == "-o" || arg == "--output")
                    take_value(args.output_dir);
                else
                    args.error = "Unknown argument: " + arg;
            }
            if (args.error.empty() && !args.show_help && !args.list_strategies && args.config_path.empty())
                args.error = "No configuration file given (use --config)";
            return args;
        }
    };

} // namespace

/**
 * @brief Run the backtest pipeline
 */
static int run(const CommandLineArgs &args)
{
    const auto started = std::chrono::steady_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration from: " << args.config_path << std::endl;

        RunConfig config = RunConfig::load_from_file(args.config_path);
        if (args.verbose)
            config.params.verbose = true;

        std::cout << "  - Period: " << format_timestamp(config.backtest.start_date)
                  << " to " << format_timestamp(config.backtest.end_date) << "\n";
        std::cout << "  - Symbols: " << config.backtest.symbols.size() << "\n";
        std::cout << "  - Initial capital: " << std::fixed << std::setprecision(2)
                  << config.backtest.initial_capital << std::endl;

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/5] Loading market data (" << config.data.type << ")..." << std::endl;

        auto bars = DataLoader::load_bars(config.data, config.backtest);
        auto simulator = std::make_shared<data::HistoricalDataSimulator>(std::move(bars));

        std::cout << "  - Loaded " << simulator->size() << " bars, "
                  << simulator->get_symbols().size() << " symbols" << std::endl;

        // ====================================================================
        // 3. Build Strategy and Execution Model
        // ====================================================================
        std::cout << "[3/5] Building strategy..." << std::endl;

        std::shared_ptr<strategy::Strategy> strategy =
            strategy::StrategyFactory::create(config.strategy.type, config.strategy.parameters);
        auto execution = execution::ExecutionModel::create(config.execution.model, config.backtest);

        std::cout << "  - Strategy: " << strategy->get_name() << "\n";
        std::cout << "  - Execution model: " << execution->get_name() << std::endl;
        if (args.verbose)
        {
            std::cout << "  - Parameters: " << strategy->get_parameters().dump() << std::endl;
        }

        // ====================================================================
        // 4. Run Backtest
        // ====================================================================
        std::cout << "[4/5] Running backtest..." << std::endl;

        backtest::BacktestEngine engine(config.backtest, strategy, simulator,
                                        std::move(execution), config.params);
        backtest::BacktestResult result = engine.run();
        result.print_summary();

        // ====================================================================
        // 5. Export Results
        // ====================================================================
        std::cout << "\n[5/5] Exporting results to: " << args.output_dir << std::endl;

        std::filesystem::create_directories(args.output_dir);
        const std::string equity_file = args.output_dir + "/equity_curve.csv";
        const std::string trades_file = args.output_dir + "/trades.csv";
        const std::string metrics_file = args.output_dir + "/metrics.json";

        result.export_equity_curve_to_csv(equity_file);
        result.export_trades_to_csv(trades_file);

        std::ofstream metrics_out(metrics_file);
        if (!metrics_out)
            throw std::runtime_error("Could not open file for writing: " + metrics_file);
        metrics_out << result.to_json().dump(2) << "\n";

        std::cout << "  - " << equity_file << "\n"
                  << "  - " << trades_file << "\n"
                  << "  - " << metrics_file << std::endl;

        const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started)
                                    .count();
        std::cout << RULE << "\n"
                  << "Done: " << result.trades.size() << " trades over "
                  << result.equity_curve.size() << " equity points in " << elapsed_ms << " ms\n"
                  << RULE << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "backtester: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char *argv[])
{
    const CommandLineArgs args = CommandLineArgs::parse(argc, argv);

    if (!args.error.empty())
    {
        std::cerr << "backtester: " << args.error << "\n\n";
        print_usage(argv[0]);
        return 2;
    }
    if (args.show_help)
    {
        print_usage(argv[0]);
        return 0;
    }
    if (args.list_strategies)
    {
        for (const auto &type : strategy::StrategyFactory::get_supported_types())
            std::cout << type << "\n";
        return 0;
    }

    print_banner();
    return run(args);
}
