/**
 * @file live_data_simulator.hpp
 * @brief Background-thread bar producer for live-style runs
 */

#ifndef BACKTESTER_DATA_LIVE_DATA_SIMULATOR_HPP
#define BACKTESTER_DATA_LIVE_DATA_SIMULATOR_HPP

#include "data/market_simulator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <thread>

namespace backtester {
namespace data {

/**
 * @class LiveDataSimulator
 * @brief Push-based bar source exposed through the pull interface.
 *
 * start() launches a producer thread that calls the generator every
 * interval and appends its bars to an internal buffer. has_more_data() is
 * true while the producer is running or unread bars remain, so a consumer
 * may see get_next_bar() return std::nullopt while waiting for the next batch.
 *
 * An exception thrown by the generator stops the producer. Once the buffered
 * bars are drained, every get_next_bar() call rethrows it until the next start().
 *
 * Thread safety: all public methods may be called from any thread.
 */
class LiveDataSimulator : public MarketSimulator {
public:
    using Generator = std::function<std::vector<MarketData>()>;

    /**
     * @param symbols Symbols produced by the default generator.
     * @param interval Delay between generator calls.
     * @param generator Custom bar producer; the default emits one random bar
     *        around 100 per symbol.
     * @param seed Seed for the default generator.
     */
    LiveDataSimulator(std::vector<std::string> symbols,
                      std::chrono::milliseconds interval = std::chrono::milliseconds(1000),
                      Generator generator = nullptr,
                      std::uint64_t seed = 42);
    ~LiveDataSimulator() override;

    LiveDataSimulator(const LiveDataSimulator&) = delete;
    LiveDataSimulator& operator=(const LiveDataSimulator&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    bool has_more_data() const override;
    std::optional<MarketData> get_next_bar() override;
    Timestamp get_current_timestamp() const override;
    std::vector<std::string> get_symbols() const override;

    /** @brief Drop all buffered bars and rewind. A pending generator failure is kept. */
    void reset() override;

    size_t buffered() const;

private:
    std::vector<MarketData> default_generator();
    void produce_loop();

    std::vector<std::string> symbols_;
    std::chrono::milliseconds interval_;
    Generator generator_;
    std::mt19937_64 rng_;  // producer thread only

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::vector<MarketData> buffer_;
    size_t cursor_ = 0;
    std::exception_ptr failure_;
    std::atomic<bool> running_{false};
    std::thread producer_;
};

} // namespace data
} // namespace backtester

#endif // BACKTESTER_DATA_LIVE_DATA_SIMULATOR_HPP
