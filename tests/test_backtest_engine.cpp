#include <catch2/catch.hpp>
#include "backtest/backtest_engine.hpp"
#include "data/historical_simulator.hpp"
#include "data/live_data_simulator.hpp"
#include "data/synthetic_data_generator.hpp"
#include "execution/realistic_execution_model.hpp"
#include "strategy/buy_and_hold.hpp"
#include "strategy/sma_crossover.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

using namespace backtester;
using namespace backtester::backtest;
using backtester::data::HistoricalDataSimulator;
using backtester::strategy::Signal;

namespace {

std::vector<MarketData> flat_bars(const std::string& symbol, int days, double close) {
    std::vector<MarketData> bars;
    for (int d = 1; d <= days; ++d) {
        MarketData bar;
        bar.timestamp = make_timestamp(2024, 1, d, 12);
        bar.symbol = symbol;
        bar.open = bar.high = bar.low = bar.close = close;
        bar.volume = 0.0;
        bars.push_back(bar);
    }
    return bars;
}

BacktestConfig make_config(double capital = 100000.0) {
    BacktestConfig config;
    config.start_date = make_timestamp(2024, 1, 1);
    config.end_date = make_timestamp(2024, 12, 31);
    config.initial_capital = capital;
    config.symbols = {"AAA"};
    config.commission = 0.001;
    config.slippage = 0.001;
    return config;
}

std::shared_ptr<HistoricalDataSimulator> simulator(std::vector<MarketData> bars) {
    return std::make_shared<HistoricalDataSimulator>(std::move(bars));
}

/// Emits no signals and calls a hook with the running bar count.
class HookStrategy : public strategy::Strategy {
public:
    HookStrategy() : Strategy("Hook") {}

    std::vector<Signal> on_bar(const MarketData& /*data*/, const Portfolio& /*portfolio*/) override {
        size_t n = ++bars;
        if (hook) hook(n);
        return {};
    }

    std::function<void(size_t)> hook;
    std::atomic<size_t> bars{0};
};

/// Serves flat bars and throws once `fail_after` bars were handed out.
class FailingSimulator : public data::MarketSimulator {
public:
    FailingSimulator(std::vector<MarketData> bars, size_t fail_after)
        : bars_(std::move(bars)), fail_after_(fail_after) {}

    bool has_more_data() const override { return cursor_ < bars_.size(); }

    std::optional<MarketData> get_next_bar() override {
        if (cursor_ == fail_after_) throw std::runtime_error("data source failure");
        if (cursor_ >= bars_.size()) return std::nullopt;
        return bars_[cursor_++];
    }

    Timestamp get_current_timestamp() const override {
        return cursor_ == 0 ? Timestamp{} : bars_[cursor_ - 1].timestamp;
    }

    std::vector<std::string> get_symbols() const override { return {"AAA"}; }
    void reset() override { cursor_ = 0; }

private:
    std::vector<MarketData> bars_;
    size_t fail_after_;
    size_t cursor_ = 0;
};

} // namespace

TEST_CASE("Engine construction", "[BacktestEngine]") {
    auto strategy = std::make_shared<strategy::BuyAndHoldStrategy>();

    SECTION("Defaults to the realistic execution model") {
        BacktestEngine engine(make_config(), strategy, simulator({}));
        REQUIRE(engine.execution_model().get_name() == "Realistic");
        REQUIRE(engine.get_state() == EngineState::IDLE);
        REQUIRE_FALSE(engine.is_running());
    }

    SECTION("Error: missing collaborators") {
        REQUIRE_THROWS_AS(BacktestEngine(make_config(), nullptr, simulator({})), std::invalid_argument);
        REQUIRE_THROWS_AS(BacktestEngine(make_config(), strategy, nullptr), std::invalid_argument);
    }

    SECTION("Error: invalid configuration") {
        auto config = make_config();
        config.symbols.clear();
        REQUIRE_THROWS_AS(BacktestEngine(config, strategy, simulator({})), std::invalid_argument);
    }
}

TEST_CASE("Empty data yields zeroed metrics", "[BacktestEngine]") {
    BacktestEngine engine(make_config(), std::make_shared<strategy::BuyAndHoldStrategy>(), simulator({}));
    BacktestResult result = engine.run();

    REQUIRE(result.bars_processed == 0);
    REQUIRE(result.equity_curve.empty());
    REQUIRE(result.trades.empty());
    REQUIRE(result.metrics.total_return == 0.0);
    REQUIRE(result.metrics.sharpe_ratio == 0.0);
    REQUIRE(result.portfolio.total_value() == Approx(100000.0));
    REQUIRE(result.message == "completed");
    REQUIRE(engine.get_state() == EngineState::COMPLETED);
}

TEST_CASE("Buy and hold trades once", "[BacktestEngine]") {
    BacktestEngine engine(make_config(), std::make_shared<strategy::BuyAndHoldStrategy>(),
                          simulator(flat_bars("AAA", 5, 100.0)));

    std::vector<EventType> events;
    engine.add_listener([&events](const BacktestEvent& e) { events.push_back(e.type); });

    BacktestResult result = engine.run();

    REQUIRE(result.bars_processed == 5);
    REQUIRE(result.trades.size() == 1);
    const Trade& trade = result.trades.front();
    REQUIRE(trade.id == "T000001");
    REQUIRE(trade.side == TradeSide::BUY);
    REQUIRE(trade.strategy_id == "Buy and Hold");
    // 95% of capital at 100 plus 0.1 slippage
    REQUIRE(trade.quantity == Approx(949.0));
    REQUIRE(trade.price == Approx(100.1));
    REQUIRE(trade.commission == Approx(949.0 * 0.005));

    // slippage is charged once on top of the fill price
    double cash = 100000.0 - 949.0 * 100.1 - 949.0 * 0.005 - 0.1;
    REQUIRE(result.portfolio.cash() == Approx(cash));
    REQUIRE(result.portfolio.total_value() == Approx(cash + 949.0 * 100.0));

    REQUIRE(result.equity_curve.size() == 5);
    REQUIRE(result.equity_curve.front().value == Approx(cash + 949.0 * 100.1));
    REQUIRE(result.equity_curve.front().drawdown > 0.0);
    REQUIRE(result.positions.size() == 5);
    REQUIRE(result.positions.back().positions.size() == 1);
    REQUIRE(result.trade_summary.buy_trades == 1);
    REQUIRE(result.metrics.total_trades == 1);

    REQUIRE(events.front() == EventType::STARTED);
    REQUIRE(events.back() == EventType::COMPLETED);
    REQUIRE(std::count(events.begin(), events.end(), EventType::TRADE) == 1);
}

TEST_CASE("Unaffordable buys are skipped", "[BacktestEngine]") {
    BacktestEngine engine(make_config(10000.0), std::make_shared<strategy::BuyAndHoldStrategy>(),
                          simulator(flat_bars("AAA", 3, 12000.0)));
    BacktestResult result = engine.run();

    REQUIRE(result.trades.empty());
    REQUIRE(result.portfolio.cash() == Approx(10000.0));
    REQUIRE(result.portfolio.total_value() == Approx(10000.0));
    REQUIRE(result.equity_curve.size() == 3);
    REQUIRE(result.metrics.total_return == 0.0);
}

TEST_CASE("Bars outside the configured period are ignored", "[BacktestEngine]") {
    auto config = make_config();
    config.start_date = make_timestamp(2024, 1, 3);
    config.end_date = make_timestamp(2024, 1, 7, 23);

    BacktestEngine engine(config, std::make_shared<strategy::BuyAndHoldStrategy>(),
                          simulator(flat_bars("AAA", 10, 100.0)));
    BacktestResult result = engine.run();

    REQUIRE(result.bars_processed == 5);
    REQUIRE(result.equity_curve.front().timestamp == make_timestamp(2024, 1, 3, 12));
    REQUIRE(result.trades.front().timestamp == make_timestamp(2024, 1, 3, 12));
}

TEST_CASE("Portfolio invariants hold over an active run", "[BacktestEngine]") {
    auto bars = data::SyntheticDataGenerator::generate_ohlc_data(
        "AAA", make_timestamp(2024, 1, 1), make_timestamp(2024, 2, 1), 60, 100.0, 0.8, 0.0, 1e6, 11);

    auto run_once = [&bars]() {
        BacktestEngine engine(make_config(), std::make_shared<strategy::SmaCrossoverStrategy>(5, 20),
                              simulator(bars));
        return engine.run();
    };

    BacktestResult result = run_once();

    REQUIRE(result.bars_processed == bars.size());
    REQUIRE(result.equity_curve.size() == bars.size());
    REQUIRE(result.portfolio.cash() >= 0.0);
    REQUIRE(result.portfolio.total_value() ==
            Approx(result.portfolio.cash() + result.portfolio.positions_value()));

    double held = 0.0;
    for (const auto& t : result.trades) {
        REQUIRE(t.quantity > 0.0);
        REQUIRE(t.price > 0.0);
        held += t.side == TradeSide::BUY ? t.quantity : -t.quantity;
        REQUIRE(held >= 0.0);
    }
    REQUIRE(held == Approx(result.portfolio.position_quantity("AAA")));

    for (const auto& p : result.equity_curve) {
        REQUIRE(p.drawdown >= 0.0);
        REQUIRE(p.drawdown < 1.0);
    }

    SECTION("Runs are deterministic") {
        BacktestResult again = run_once();
        REQUIRE(again.trades.size() == result.trades.size());
        REQUIRE(again.portfolio.total_value() == result.portfolio.total_value());
    }
}

TEST_CASE("Benchmark tracking", "[BacktestEngine]") {
    auto config = make_config();
    config.symbols = {"AAA", "BBB"};
    config.benchmark_symbol = "BBB";

    auto bars = data::SyntheticDataGenerator::generate_ohlc_data(
        "AAA", make_timestamp(2024, 1, 1), make_timestamp(2024, 1, 3), 60, 100.0, 0.5, 0.0, 1e6, 1);
    auto bench = data::SyntheticDataGenerator::generate_ohlc_data(
        "BBB", make_timestamp(2024, 1, 1), make_timestamp(2024, 1, 3), 60, 100.0, 0.5, 0.0, 1e6, 2);
    bars.insert(bars.end(), bench.begin(), bench.end());

    BacktestEngine engine(config, std::make_shared<strategy::BuyAndHoldStrategy>(std::string("AAA")),
                          simulator(bars));
    BacktestResult result = engine.run();

    REQUIRE(result.benchmark_returns.size() == result.strategy_returns.size());
    REQUIRE(result.metrics.beta.has_value());
    REQUIRE(result.metrics.alpha.has_value());
    REQUIRE(result.metrics.information_ratio.has_value());

    auto j = result.to_json();
    REQUIRE(j["metrics"].contains("beta"));
    REQUIRE(j["config"]["benchmark_symbol"].get<std::string>() == "BBB");
}

TEST_CASE("Progress events", "[BacktestEngine]") {
    BacktestParams params;
    params.progress_interval = 2;
    BacktestEngine engine(make_config(), std::make_shared<HookStrategy>(), simulator(flat_bars("AAA", 5, 10.0)),
                          nullptr, params);

    std::vector<size_t> progress;
    engine.add_listener([&progress](const BacktestEvent& e) {
        if (e.type == EventType::PROGRESS) progress.push_back(e.bars_processed);
    });
    engine.run();

    REQUIRE(progress == std::vector<size_t>{2, 4});
}

TEST_CASE("Listeners can be removed", "[BacktestEngine]") {
    BacktestEngine engine(make_config(), std::make_shared<HookStrategy>(), simulator(flat_bars("AAA", 2, 10.0)));

    int calls = 0;
    auto id = engine.add_listener([&calls](const BacktestEvent&) { ++calls; });
    REQUIRE(engine.remove_listener(id));
    REQUIRE_FALSE(engine.remove_listener(id));
    engine.run();
    REQUIRE(calls == 0);

    REQUIRE_THROWS_AS(engine.add_listener(nullptr), std::invalid_argument);
}

TEST_CASE("Stop from inside the run", "[BacktestEngine]") {
    auto strategy = std::make_shared<HookStrategy>();
    BacktestEngine engine(make_config(), strategy, simulator(flat_bars("AAA", 10, 10.0)));
    strategy->hook = [&engine](size_t n) {
        if (n == 5) engine.stop();
    };

    std::vector<EventType> events;
    engine.add_listener([&events](const BacktestEvent& e) { events.push_back(e.type); });

    BacktestResult result = engine.run();

    REQUIRE(result.bars_processed == 5);
    REQUIRE(result.stopped);
    REQUIRE(result.message == "stopped");
    REQUIRE(engine.get_state() == EngineState::STOPPED);
    REQUIRE_FALSE(engine.is_running());
    REQUIRE(std::count(events.begin(), events.end(), EventType::STOPPED) == 1);
    REQUIRE(events.back() == EventType::COMPLETED);

    SECTION("Control calls outside a run are no-ops") {
        engine.stop();
        engine.pause();
        engine.resume();
        REQUIRE(engine.get_state() == EngineState::STOPPED);
    }
}

TEST_CASE("Pause blocks bar consumption until resume", "[BacktestEngine]") {
    auto strategy = std::make_shared<HookStrategy>();
    BacktestEngine engine(make_config(), strategy, simulator(flat_bars("AAA", 10, 10.0)));
    strategy->hook = [&engine](size_t n) {
        if (n == 3) engine.pause();
    };

    std::optional<BacktestResult> result;
    std::thread runner([&engine, &result]() { result.emplace(engine.run()); });

    bool paused = false;
    for (int i = 0; i < 5000 && !paused; ++i) {
        paused = engine.get_state() == EngineState::PAUSED && engine.get_progress().bars_processed == 3;
        if (!paused) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    CHECK(paused);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK(strategy->bars.load() == 3);
    CHECK(engine.get_progress().bars_processed == 3);
    CHECK(engine.is_paused());
    CHECK_THROWS_AS(engine.reset(), std::logic_error);
    CHECK_THROWS_AS(engine.run(), std::logic_error);
    CHECK(engine.get_portfolio_snapshot().cash() == Approx(100000.0));
    CHECK(engine.get_equity_curve().size() == 3);

    engine.resume();
    runner.join();

    REQUIRE(result.has_value());
    REQUIRE(result->bars_processed == 10);
    REQUIRE(engine.get_state() == EngineState::COMPLETED);
}

TEST_CASE("Pause after the loop ends keeps the final state", "[BacktestEngine]") {
    BacktestEngine engine(make_config(), std::make_shared<HookStrategy>(),
                          simulator(flat_bars("AAA", 3, 10.0)));

    std::vector<EventType> events;
    engine.add_listener([&engine, &events](const BacktestEvent& e) {
        events.push_back(e.type);
        if (e.type == EventType::COMPLETED) engine.pause();
    });

    BacktestResult result = engine.run();
    REQUIRE(result.bars_processed == 3);
    REQUIRE(engine.get_state() == EngineState::COMPLETED);
    REQUIRE_FALSE(engine.is_paused());

    engine.pause();
    engine.resume();
    REQUIRE(engine.get_state() == EngineState::COMPLETED);
    REQUIRE(std::count(events.begin(), events.end(), EventType::PAUSED) == 0);
    REQUIRE(std::count(events.begin(), events.end(), EventType::RESUMED) == 0);
}

TEST_CASE("Errors in the strategy end the run", "[BacktestEngine]") {
    auto strategy = std::make_shared<HookStrategy>();
    BacktestEngine engine(make_config(), strategy, simulator(flat_bars("AAA", 5, 10.0)));
    strategy->hook = [](size_t n) {
        if (n == 2) throw std::runtime_error("strategy failure");
    };

    std::string message;
    engine.add_listener([&message](const BacktestEvent& e) {
        if (e.type == EventType::ERROR) message = e.message;
    });

    REQUIRE_THROWS_AS(engine.run(), std::runtime_error);
    REQUIRE(engine.get_state() == EngineState::ERRORED);
    REQUIRE_FALSE(engine.is_running());
    REQUIRE(message == "strategy failure");
}

TEST_CASE("Errors in the data source end the run", "[BacktestEngine]") {
    auto strategy = std::make_shared<HookStrategy>();
    auto source = std::make_shared<FailingSimulator>(flat_bars("AAA", 10, 10.0), 4);
    BacktestEngine engine(make_config(), strategy, source);

    std::vector<std::string> errors;
    engine.add_listener([&errors](const BacktestEvent& e) {
        if (e.type == EventType::ERROR) errors.push_back(e.message);
    });

    REQUIRE_THROWS_AS(engine.run(), std::runtime_error);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0] == "data source failure");
    REQUIRE(engine.get_state() == EngineState::ERRORED);
    REQUIRE_FALSE(engine.is_running());
    REQUIRE(strategy->bars.load() == 4);
}

TEST_CASE("Live feed failures end the run", "[BacktestEngine][MarketSimulator][Live]") {
    std::atomic<int> calls{0};
    auto feed = std::make_shared<data::LiveDataSimulator>(
        std::vector<std::string>{"AAA"}, std::chrono::milliseconds(5), [&calls]() {
            if (++calls == 2) throw std::runtime_error("feed disconnected");
            MarketData bar;
            bar.timestamp = make_timestamp(2024, 1, 2, 12);
            bar.symbol = "AAA";
            bar.open = bar.high = bar.low = bar.close = 10.0;
            return std::vector<MarketData>{bar};
        });
    BacktestEngine engine(make_config(), std::make_shared<HookStrategy>(), feed);

    std::string message;
    engine.add_listener([&message](const BacktestEvent& e) {
        if (e.type == EventType::ERROR) message = e.message;
    });

    feed->start();
    REQUIRE_THROWS_AS(engine.run(), std::runtime_error);
    REQUIRE(message == "feed disconnected");
    REQUIRE(engine.get_state() == EngineState::ERRORED);
    feed->stop();
}

TEST_CASE("Reset restores the initial state", "[BacktestEngine]") {
    BacktestEngine engine(make_config(), std::make_shared<strategy::BuyAndHoldStrategy>(),
                          simulator(flat_bars("AAA", 4, 100.0)));

    BacktestResult first = engine.run();
    engine.reset();

    REQUIRE(engine.get_state() == EngineState::IDLE);
    REQUIRE(engine.get_equity_curve().empty());
    REQUIRE(engine.get_progress().bars_processed == 0);
    REQUIRE(engine.get_portfolio_snapshot().cash() == Approx(100000.0));

    BacktestResult second = engine.run();
    REQUIRE(second.trades.size() == first.trades.size());
    REQUIRE(second.trades.front().id == "T000001");
    REQUIRE(second.portfolio.total_value() == Approx(first.portfolio.total_value()));
}

TEST_CASE("Run parameters from configuration", "[BacktestEngine]") {
    auto params = BacktestParams::from_json({{"verbose", true}, {"progress_interval", 10}});
    REQUIRE(params.verbose);
    REQUIRE(params.progress_interval == 10);
    REQUIRE_THROWS_AS(BacktestParams::from_json({{"progress_interval", 0}}), std::invalid_argument);
}
