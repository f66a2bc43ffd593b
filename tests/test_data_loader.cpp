/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and run configuration parsing
 */

#include <catch2/catch.hpp>
#include "data/data_loader.hpp"
#include "data/synthetic_data_generator.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace backtester;
using Catch::Matchers::WithinAbs;

namespace {

std::string temp_file(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("backtester_" + name)).string();
}

void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

nlohmann::json backtest_section() {
    return {{"start_date", "2024-01-01"},
            {"end_date", "2024-01-02"},
            {"initial_capital", 50000.0},
            {"symbols", {"AAA", "BBB"}}};
}

} // namespace

TEST_CASE("CSV round trip", "[DataLoader]") {
    const std::string path = temp_file("roundtrip.csv");
    auto bars = data::SyntheticDataGenerator::generate_ohlc_data(
        "AAA", make_timestamp(2024, 1, 1), make_timestamp(2024, 1, 1, 5), 60, 100.0, 0.3, 0.0);

    DataLoader::save_csv(bars, path);
    auto loaded = DataLoader::load_csv(path);

    REQUIRE(loaded.size() == bars.size());
    for (size_t i = 0; i < bars.size(); ++i) {
        REQUIRE(loaded[i].timestamp == bars[i].timestamp);
        REQUIRE(loaded[i].symbol == "AAA");
        REQUIRE_THAT(loaded[i].close, WithinAbs(bars[i].close, 1e-8));
        REQUIRE_THAT(loaded[i].volume, WithinAbs(bars[i].volume, 1e-6));
        REQUIRE(loaded[i].vwap.has_value());
    }

    std::remove(path.c_str());
}

TEST_CASE("CSV columns are matched by name", "[DataLoader]") {
    const std::string path = temp_file("columns.csv");
    write_file(path,
               "Symbol,Close,Open,High,Low,Volume,Timestamp\n"
               "AAA,10.5,10,11,9.5,1000,2024-01-01 09:30:00\n"
               "BBB,20,20,21,19,500,2024-01-01T09:30:00Z\n"
               "\n"
               "AAA,10.7,10.5,10.8,10.4,1200,2024-01-01 10:30\n");

    SECTION("All rows, no vwap column") {
        auto bars = DataLoader::load_csv(path);
        REQUIRE(bars.size() == 3);
        REQUIRE(bars[0].symbol == "AAA");
        REQUIRE_THAT(bars[0].close, WithinAbs(10.5, 1e-12));
        REQUIRE_THAT(bars[0].open, WithinAbs(10.0, 1e-12));
        REQUIRE(bars[0].timestamp == make_timestamp(2024, 1, 1, 9, 30));
        REQUIRE(bars[1].timestamp == make_timestamp(2024, 1, 1, 9, 30));
        REQUIRE_FALSE(bars[0].vwap.has_value());
    }

    SECTION("Symbol filter") {
        auto bars = DataLoader::load_csv(path, {"AAA"});
        REQUIRE(bars.size() == 2);
        REQUIRE(bars[1].timestamp == make_timestamp(2024, 1, 1, 10, 30));
    }

    std::remove(path.c_str());
}

TEST_CASE("CSV errors", "[DataLoader]") {
    const std::string path = temp_file("errors.csv");

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_csv(temp_file("does_not_exist.csv")), std::runtime_error);
    }

    SECTION("Missing column") {
        write_file(path, "timestamp,symbol,open,high,low,close\n2024-01-01,AAA,1,1,1,1\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv(path), std::runtime_error);
    }

    SECTION("Bad number") {
        write_file(path, "timestamp,symbol,open,high,low,close,volume\n2024-01-01,AAA,1,1,1,abc,10\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv(path), std::runtime_error);
    }

    SECTION("Bad timestamp") {
        write_file(path, "timestamp,symbol,open,high,low,close,volume\nsoon,AAA,1,1,1,1,10\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv(path), std::runtime_error);
    }

    SECTION("Short row") {
        write_file(path, "timestamp,symbol,open,high,low,close,volume\n2024-01-01,AAA,1,1\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv(path), std::runtime_error);
    }

    std::remove(path.c_str());
}

TEST_CASE("Run configuration", "[DataLoader][Config]") {
    nlohmann::json j = {
        {"backtest", backtest_section()},
        {"data", {{"type", "Synthetic"}, {"interval_minutes", 30}, {"seed", 7}}},
        {"strategy", {{"type", "sma_crossover"}, {"parameters", {{"short_period", 5}}}}},
        {"execution", {{"model", "advanced"}}}};

    SECTION("Sections are parsed") {
        RunConfig config = RunConfig::from_json(j);
        REQUIRE_THAT(config.backtest.initial_capital, WithinAbs(50000.0, 1e-9));
        REQUIRE(config.backtest.symbols.size() == 2);
        REQUIRE(config.backtest.start_date == make_timestamp(2024, 1, 1));
        REQUIRE(config.data.type == "synthetic");
        REQUIRE(config.data.interval_minutes == 30);
        REQUIRE(config.data.seed == 7u);
        REQUIRE(config.strategy.type == "sma_crossover");
        REQUIRE(config.strategy.parameters["short_period"].get<int>() == 5);
        REQUIRE(config.execution.model == "advanced");
        REQUIRE_FALSE(config.params.verbose);
    }

    SECTION("Defaults for omitted sections") {
        RunConfig config = RunConfig::from_json({{"backtest", backtest_section()}});
        REQUIRE(config.data.type == "synthetic");
        REQUIRE(config.strategy.type == "buy_and_hold");
        REQUIRE(config.execution.model == "realistic");
    }

    SECTION("Loaded from file") {
        const std::string path = temp_file("config.json");
        write_file(path, j.dump(2));
        RunConfig config = RunConfig::load_from_file(path);
        REQUIRE(config.strategy.type == "sma_crossover");
        std::remove(path.c_str());
    }

    SECTION("Error: missing backtest section") {
        REQUIRE_THROWS_AS(RunConfig::from_json({{"data", {{"type", "csv"}}}}), std::invalid_argument);
    }

    SECTION("Error: missing dates") {
        nlohmann::json bad = {{"backtest", {{"symbols", {"AAA"}}}}};
        REQUIRE_THROWS_AS(RunConfig::from_json(bad), std::invalid_argument);
    }

    SECTION("Error: end before start") {
        nlohmann::json bad = j;
        bad["backtest"]["end_date"] = "2023-12-31";
        REQUIRE_THROWS_AS(RunConfig::from_json(bad), std::invalid_argument);
    }

    SECTION("Error: malformed JSON") {
        const std::string path = temp_file("broken.json");
        write_file(path, "{ \"backtest\": ");
        REQUIRE_THROWS_AS(DataLoader::load_json(path), std::runtime_error);
        std::remove(path.c_str());
    }
}

TEST_CASE("Bar sources", "[DataLoader]") {
    auto backtest = backtest::BacktestConfig::from_json(backtest_section());

    SECTION("Synthetic series per backtest symbol") {
        DataSourceConfig source;
        source.type = "synthetic";
        auto bars = DataLoader::load_bars(source, backtest);
        // hourly, both endpoints included
        REQUIRE(bars.size() == 2 * 25);
        REQUIRE(unique_symbols(bars) == std::vector<std::string>{"AAA", "BBB"});
    }

    SECTION("Correlated series") {
        DataSourceConfig source;
        source.type = "correlated";
        source.correlation = {{1.0, 0.5}, {0.5, 1.0}};
        auto bars = DataLoader::load_bars(source, backtest);
        REQUIRE(bars.size() == 2 * 25);
    }

    SECTION("Error: correlation matrix of the wrong size") {
        DataSourceConfig source;
        source.type = "correlated";
        source.correlation = {{1.0}};
        REQUIRE_THROWS_AS(DataLoader::load_bars(source, backtest), std::invalid_argument);
    }

    SECTION("Crash scenario on the first symbol") {
        DataSourceConfig source;
        source.type = "crash";
        source.end_date = "2024-01-05";
        source.crash_start = "2024-01-02";
        source.crash_end = "2024-01-03";
        auto bars = DataLoader::load_bars(source, backtest);
        REQUIRE_FALSE(bars.empty());
        REQUIRE(unique_symbols(bars) == std::vector<std::string>{"AAA"});
        REQUIRE(bars.back().timestamp == make_timestamp(2024, 1, 5));
    }

    SECTION("CSV source") {
        const std::string path = temp_file("source.csv");
        write_file(path, "timestamp,symbol,open,high,low,close,volume\n2024-01-01,AAA,1,1,1,1,10\n");
        DataSourceConfig source;
        source.type = "csv";
        source.file = path;
        REQUIRE(DataLoader::load_bars(source, backtest).size() == 1);
        std::remove(path.c_str());
    }

    SECTION("Error: unknown source type") {
        DataSourceConfig source;
        source.type = "database";
        REQUIRE_THROWS_AS(DataLoader::load_bars(source, backtest), std::invalid_argument);
    }
}
