// SPDX-License-Identifier: MIT
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "analytics/performance_analyzer.hpp"
#include "backtest/backtest_config.hpp"
#include "backtest/backtest_result.hpp"
#include "backtest/portfolio.hpp"
#include "backtest/trade_log.hpp"
#include "data/market_simulator.hpp"
#include "execution/execution_model.hpp"
#include "strategy/strategy.hpp"

namespace backtester
{
    namespace backtest
    {

        enum class EngineState
        {
            IDLE,
            RUNNING,
            PAUSED,
            STOPPED,
            COMPLETED,
            ERRORED
        };

        std::string to_string(EngineState state);

        enum class EventType
        {
            STARTED,
            PROGRESS,
            TRADE,
            PAUSED,
            RESUMED,
            STOPPED,
            COMPLETED,
            ERROR
        };

        std::string to_string(EventType type);

        /**
         * @struct BacktestEvent
         * @brief Notification delivered to engine listeners.
         *
         * `trade` is set for TRADE events and `message` for ERROR events.
         * The other fields describe the engine progress when the event fired.
         */
        struct BacktestEvent
        {
            EventType type = EventType::STARTED;
            Timestamp timestamp;
            size_t bars_processed = 0;
            double portfolio_value = 0.0;
            double total_pnl = 0.0;
            std::optional<Trade> trade;
            std::string message;
        };

        /** @brief Read-only progress copy returned by BacktestEngine::get_progress(). */
        struct Progress
        {
            Timestamp timestamp;
            double portfolio_value = 0.0;
            double total_pnl = 0.0;
            size_t bars_processed = 0;
            EngineState state = EngineState::IDLE;
        };

        struct BacktestParams
        {
            bool verbose = false;
            size_t progress_interval = 1000;  ///< Processed bars between PROGRESS events

            static BacktestParams from_json(const nlohmann::json &j);
        };

        /**
         * @class BacktestEngine
         * @brief Single-pass replay of a simulator through a strategy and an execution model.
         *
         * For every bar inside [start_date, end_date] the engine marks the
         * bar's symbol to market, asks the strategy for signals, prices each
         * signal through the execution model in order, applies the resulting
         * trades to the portfolio and records one equity point and one
         * position snapshot.
         *
         * pause(), resume() and stop() may be called from any thread, including
         * from inside strategy callbacks. They take effect at the top of the
         * next loop iteration; a bar in progress always completes. While paused
         * the loop blocks on a condition variable and consumes no data.
         *
         * Usage:
         * @code
         *   auto strategy = std::make_shared<strategy::BuyAndHoldStrategy>();
         *   auto sim = std::make_shared<data::HistoricalDataSimulator>(bars);
         *   BacktestEngine engine(config, strategy, sim);
         *   engine.add_listener([](const BacktestEvent &e) { ... });
         *   BacktestResult result = engine.run();
         * @endcode
         */
        class BacktestEngine
        {
        public:
            using Listener = std::function<void(const BacktestEvent &)>;
            using ListenerId = size_t;

            /**
             * @param config Validated run configuration
             * @param strategy Strategy to drive (shared with the caller)
             * @param simulator Bar source (shared with the caller)
             * @param execution Execution model; a RealisticExecutionModel when null
             * @param params Logging and notification options
             * @throws std::invalid_argument if config is invalid or strategy/simulator is null
             */
            BacktestEngine(BacktestConfig config,
                           std::shared_ptr<strategy::Strategy> strategy,
                           std::shared_ptr<data::MarketSimulator> simulator,
                           std::unique_ptr<execution::ExecutionModel> execution = nullptr,
                           BacktestParams params = BacktestParams());
            ~BacktestEngine() = default;

            BacktestEngine(const BacktestEngine &) = delete;
            BacktestEngine &operator=(const BacktestEngine &) = delete;

            /**
             * @brief Run to exhaustion of the simulator or until stop().
             * @return Result of the run (partial when stopped).
             * @throws std::logic_error if a run is already active
             * @throws Any exception raised by the simulator, strategy or execution
             *         model, after the ERROR event has been delivered.
             */
            BacktestResult run();

            void pause();
            void resume();
            void stop();

            /**
             * @brief Restore the initial portfolio and clear recorded curves.
             * @throws std::logic_error while a run is active
             */
            void reset();

            ListenerId add_listener(Listener listener);
            bool remove_listener(ListenerId id);

            Progress get_progress() const;
            Portfolio get_portfolio_snapshot() const;
            std::vector<EquityPoint> get_equity_curve() const;
            EngineState get_state() const;

            bool is_running() const { return running_.load(); }
            bool is_paused() const { return paused_.load(); }

            const BacktestConfig &config() const { return config_; }
            const BacktestParams &params() const { return params_; }
            const execution::ExecutionModel &execution_model() const { return *execution_; }

        private:
            BacktestConfig config_;
            BacktestParams params_;
            std::shared_ptr<strategy::Strategy> strategy_;
            std::shared_ptr<data::MarketSimulator> simulator_;
            std::unique_ptr<execution::ExecutionModel> execution_;
            analytics::PerformanceAnalyzer analyzer_;

            // guarded by state_mutex_; the run thread is the only writer
            mutable std::mutex state_mutex_;
            Portfolio portfolio_;
            TradeLog trade_log_;
            std::vector<EquityPoint> equity_curve_;
            std::vector<PositionSnapshot> position_history_;
            std::vector<double> benchmark_values_;
            std::optional<double> last_benchmark_close_;
            double peak_value_ = 0.0;
            Timestamp current_timestamp_;
            size_t bars_processed_ = 0;
            EngineState state_ = EngineState::IDLE;

            std::atomic<bool> running_{false};
            std::atomic<bool> paused_{false};
            std::atomic<bool> stop_requested_{false};
            std::mutex control_mutex_;
            std::condition_variable control_cv_;

            mutable std::mutex listeners_mutex_;
            std::vector<std::pair<ListenerId, Listener>> listeners_;
            ListenerId next_listener_id_ = 1;

            void process_bar(const MarketData &bar);
            void record_equity_point();
            void record_positions();
            BacktestResult generate_result() const;
            void wait_while_paused();
            void set_state(EngineState state);

            BacktestEvent make_event(EventType type) const;
            void emit(const BacktestEvent &event);
            void clear_run_state();
        };

    } // namespace backtest
} // namespace backtester
