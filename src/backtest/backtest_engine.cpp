// SPDX-License-Identifier: MIT

#include "backtest/backtest_engine.hpp"
#include "execution/realistic_execution_model.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

namespace backtester
{
    namespace backtest
    {

        std::string to_string(EngineState state)
        {
            switch (state)
            {
            case EngineState::IDLE: return "idle";
            case EngineState::RUNNING: return "running";
            case EngineState::PAUSED: return "paused";
            case EngineState::STOPPED: return "stopped";
            case EngineState::COMPLETED: return "completed";
            case EngineState::ERRORED: return "errored";
            }
            return "unknown";
        }

        std::string to_string(EventType type)
        {
            switch (type)
            {
            case EventType::STARTED: return "started";
            case EventType::PROGRESS: return "progress";
            case EventType::TRADE: return "trade";
            case EventType::PAUSED: return "paused";
            case EventType::RESUMED: return "resumed";
            case EventType::STOPPED: return "stopped";
            case EventType::COMPLETED: return "completed";
            case EventType::ERROR: return "error";
            }
            return "unknown";
        }

        // ------------------------- BacktestParams -------------------------------
        BacktestParams BacktestParams::from_json(const nlohmann::json &j)
        {
            BacktestParams p;
            if (j.is_object())
            {
                p.verbose = j.value("verbose", p.verbose);
                p.progress_interval = j.value("progress_interval", p.progress_interval);
            }
            if (p.progress_interval == 0)
                throw std::invalid_argument("Expected positive value for parameter 'progress_interval', got: 0");
            return p;
        }

        // ------------------------- Construction ---------------------------------
        BacktestEngine::BacktestEngine(BacktestConfig config,
                                       std::shared_ptr<strategy::Strategy> strategy,
                                       std::shared_ptr<data::MarketSimulator> simulator,
                                       std::unique_ptr<execution::ExecutionModel> execution,
                                       BacktestParams params)
            : config_(std::move(config)),
              params_(params),
              strategy_(std::move(strategy)),
              simulator_(std::move(simulator)),
              execution_(std::move(execution)),
              portfolio_(config_.initial_capital)
        {
            config_.validate();
            if (!strategy_)
                throw std::invalid_argument("BacktestEngine requires a strategy");
            if (!simulator_)
                throw std::invalid_argument("BacktestEngine requires a market simulator");
            if (params_.progress_interval == 0)
                throw std::invalid_argument("Expected positive value for parameter 'progress_interval', got: 0");
            if (!execution_)
                execution_ = std::make_unique<execution::RealisticExecutionModel>(config_);

            peak_value_ = config_.initial_capital;
            current_timestamp_ = config_.start_date;
        }

        // ------------------------- Run loop -------------------------------------
        BacktestResult BacktestEngine::run()
        {
            bool expected = false;
            if (!running_.compare_exchange_strong(expected, true))
                throw std::logic_error("BacktestEngine::run called while a run is active");

            paused_ = false;
            stop_requested_ = false;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                clear_run_state();
                state_ = EngineState::RUNNING;
            }
            emit(make_event(EventType::STARTED));

            try
            {
                strategy_->initialize(config_.symbols);
                simulator_->reset();
                execution_->reset();

                while (running_.load())
                {
                    wait_while_paused();
                    if (!running_.load())
                        break;
                    if (!simulator_->has_more_data())
                        break;

                    std::optional<MarketData> bar = simulator_->get_next_bar();
                    if (!bar)
                    {
                        // live sources may be between bars
                        if (simulator_->has_more_data())
                        {
                            std::this_thread::sleep_for(std::chrono::milliseconds(1));
                            continue;
                        }
                        break;
                    }

                    process_bar(*bar);
                }

                strategy_->finalize(portfolio_);

                BacktestResult result = generate_result();
                set_state(stop_requested_.load() ? EngineState::STOPPED : EngineState::COMPLETED);
                running_ = false;
                paused_ = false;

                BacktestEvent done = make_event(EventType::COMPLETED);
                done.message = result.message;
                emit(done);
                return result;
            }
            catch (const std::exception &e)
            {
                set_state(EngineState::ERRORED);
                running_ = false;
                paused_ = false;

                BacktestEvent error = make_event(EventType::ERROR);
                error.message = e.what();
                emit(error);
                throw;
            }
            catch (...)
            {
                set_state(EngineState::ERRORED);
                running_ = false;
                paused_ = false;

                BacktestEvent error = make_event(EventType::ERROR);
                error.message = "unknown exception";
                emit(error);
                throw;
            }
        }

        void BacktestEngine::wait_while_paused()
        {
            std::unique_lock<std::mutex> lock(control_mutex_);
            control_cv_.wait(lock, [this]
                             { return !paused_.load() || !running_.load(); });
        }

        void BacktestEngine::process_bar(const MarketData &bar)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                current_timestamp_ = bar.timestamp;
            }

            if (!config_.in_range(bar.timestamp))
                return;

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                portfolio_.mark_to_market(bar);
                if (config_.benchmark_symbol && bar.symbol == *config_.benchmark_symbol)
                    last_benchmark_close_ = bar.close;
            }

            std::vector<strategy::Signal> signals = strategy_->on_bar(bar, portfolio_);

            for (const auto &signal : signals)
            {
                std::optional<Trade> proposed = execution_->execute_signal(signal, bar, portfolio_);
                if (!proposed)
                    continue;

                std::optional<Trade> applied;
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    applied = portfolio_.apply_trade(*proposed);
                    if (applied)
                        trade_log_.log_trade(*applied);
                }
                if (!applied)
                {
                    if (params_.verbose)
                        std::cerr << "Skipped " << to_string(proposed->side) << " " << proposed->symbol
                                  << " on " << format_timestamp(bar.timestamp) << " - insufficient cash or shares\n";
                    continue;
                }

                BacktestEvent trade_event = make_event(EventType::TRADE);
                trade_event.trade = applied;
                emit(trade_event);

                strategy_->on_trade(*applied, portfolio_);
            }

            size_t processed = 0;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                record_equity_point();
                record_positions();
                processed = ++bars_processed_;
            }

            if (processed % params_.progress_interval == 0)
                emit(make_event(EventType::PROGRESS));
        }

        void BacktestEngine::record_equity_point()
        {
            // peak starts at initial capital and then tracks recorded values only
            double value = portfolio_.total_value();
            double previous_high = equity_curve_.empty() ? config_.initial_capital : peak_value_;
            double current_high = std::max(previous_high, value);
            double drawdown = current_high > 0.0 ? (current_high - value) / current_high : 0.0;

            peak_value_ = equity_curve_.empty() ? value : std::max(peak_value_, value);

            EquityPoint point;
            point.timestamp = current_timestamp_;
            point.value = value;
            point.drawdown = drawdown;
            equity_curve_.push_back(point);

            if (config_.benchmark_symbol)
                benchmark_values_.push_back(last_benchmark_close_ ? *last_benchmark_close_
                                                                  : std::numeric_limits<double>::quiet_NaN());
        }

        void BacktestEngine::record_positions()
        {
            PositionSnapshot snapshot;
            snapshot.timestamp = current_timestamp_;
            snapshot.positions = portfolio_.positions();
            position_history_.push_back(std::move(snapshot));
        }

        BacktestResult BacktestEngine::generate_result() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);

            BacktestResult result(config_, portfolio_);
            result.metrics = analyzer_.calculate_metrics(equity_curve_, portfolio_.trades(), config_);
            result.equity_curve = equity_curve_;
            result.trades = portfolio_.trades();
            result.positions = position_history_;
            result.strategy_returns = analyzer_.calculate_returns(equity_curve_);
            result.trade_summary = trade_log_.get_summary();
            result.bars_processed = bars_processed_;
            result.stopped = stop_requested_.load();
            result.message = result.stopped ? "stopped" : "completed";

            // benchmark closes before its first bar are backfilled with the first close seen
            auto first = std::find_if(benchmark_values_.begin(), benchmark_values_.end(),
                                      [](double v)
                                      { return !std::isnan(v); });
            if (first != benchmark_values_.end())
            {
                std::vector<double> values(benchmark_values_);
                for (auto &v : values)
                {
                    if (std::isnan(v))
                        v = *first;
                }
                result.benchmark_returns = analytics::PerformanceAnalyzer::calculate_returns(values);

                if (!equity_curve_.empty() && !portfolio_.trades().empty())
                {
                    const auto &s = result.strategy_returns;
                    const auto &b = result.benchmark_returns;
                    result.metrics.beta = analyzer_.calculate_beta(s, b);
                    result.metrics.alpha = analyzer_.calculate_alpha(s, b, config_.effective_risk_free_rate());
                    result.metrics.information_ratio = analyzer_.calculate_information_ratio(s, b);
                }
            }
            return result;
        }

        // ------------------------- Control --------------------------------------
        void BacktestEngine::pause()
        {
            {
                // a run that already finished keeps its final state
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (state_ != EngineState::RUNNING || !running_.load())
                    return;
                paused_ = true;
                state_ = EngineState::PAUSED;
            }
            emit(make_event(EventType::PAUSED));
        }

        void BacktestEngine::resume()
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (state_ != EngineState::PAUSED || !running_.load())
                    return;
                state_ = EngineState::RUNNING;
                std::lock_guard<std::mutex> control_lock(control_mutex_);
                paused_ = false;
            }
            control_cv_.notify_all();
            emit(make_event(EventType::RESUMED));
        }

        void BacktestEngine::stop()
        {
            if (!running_.load())
                return;
            {
                std::lock_guard<std::mutex> lock(control_mutex_);
                stop_requested_ = true;
                running_ = false;
            }
            control_cv_.notify_all();
            emit(make_event(EventType::STOPPED));
        }

        void BacktestEngine::reset()
        {
            if (running_.load())
                throw std::logic_error("BacktestEngine::reset called while a run is active");

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                clear_run_state();
                state_ = EngineState::IDLE;
            }
            execution_->reset();
            simulator_->reset();
        }

        void BacktestEngine::clear_run_state()
        {
            portfolio_.reset(config_.initial_capital);
            trade_log_.clear();
            equity_curve_.clear();
            position_history_.clear();
            benchmark_values_.clear();
            last_benchmark_close_.reset();
            peak_value_ = config_.initial_capital;
            current_timestamp_ = config_.start_date;
            bars_processed_ = 0;
        }

        void BacktestEngine::set_state(EngineState state)
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = state;
        }

        // ------------------------- Accessors ------------------------------------
        Progress BacktestEngine::get_progress() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            Progress p;
            p.timestamp = current_timestamp_;
            p.portfolio_value = portfolio_.total_value();
            p.total_pnl = portfolio_.total_pnl();
            p.bars_processed = bars_processed_;
            p.state = state_;
            return p;
        }

        Portfolio BacktestEngine::get_portfolio_snapshot() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return portfolio_;
        }

        std::vector<EquityPoint> BacktestEngine::get_equity_curve() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return equity_curve_;
        }

        EngineState BacktestEngine::get_state() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return state_;
        }

        // ------------------------- Notifications --------------------------------
        BacktestEngine::ListenerId BacktestEngine::add_listener(Listener listener)
        {
            if (!listener)
                throw std::invalid_argument("Listener must be callable");
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            ListenerId id = next_listener_id_++;
            listeners_.emplace_back(id, std::move(listener));
            return id;
        }

        bool BacktestEngine::remove_listener(ListenerId id)
        {
            std::lock_guard<std::mutex> lock(listeners_mutex_);
            auto it = std::find_if(listeners_.begin(), listeners_.end(),
                                   [id](const std::pair<ListenerId, Listener> &entry)
                                   { return entry.first == id; });
            if (it == listeners_.end())
                return false;
            listeners_.erase(it);
            return true;
        }

        BacktestEvent BacktestEngine::make_event(EventType type) const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            BacktestEvent event;
            event.type = type;
            event.timestamp = current_timestamp_;
            event.bars_processed = bars_processed_;
            event.portfolio_value = portfolio_.total_value();
            event.total_pnl = portfolio_.total_pnl();
            return event;
        }

        void BacktestEngine::emit(const BacktestEvent &event)
        {
            if (params_.verbose)
            {
                std::cerr << "[backtest] " << to_string(event.type)
                          << " bars=" << event.bars_processed
                          << " at " << format_timestamp(event.timestamp)
                          << std::fixed << std::setprecision(2)
                          << " value=" << event.portfolio_value;
                if (event.trade)
                {
                    const Trade &t = *event.trade;
                    std::cerr << " " << t.id << " " << to_string(t.side) << " " << t.quantity
                              << " " << t.symbol << " @ " << t.price;
                }
                if (!event.message.empty())
                    std::cerr << " " << event.message;
                std::cerr << "\n";
            }

            std::vector<Listener> snapshot;
            {
                std::lock_guard<std::mutex> lock(listeners_mutex_);
                snapshot.reserve(listeners_.size());
                for (const auto &entry : listeners_)
                    snapshot.push_back(entry.second);
            }
            for (const auto &listener : snapshot)
                listener(event);
        }

    } // namespace backtest
} // namespace backtester
