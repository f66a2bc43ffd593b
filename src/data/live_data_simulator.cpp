// ============================================================================
// Implementation of LiveDataSimulator
// ============================================================================

#include "data/live_data_simulator.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>

namespace backtester {
namespace data {

LiveDataSimulator::LiveDataSimulator(std::vector<std::string> symbols,
                                     std::chrono::milliseconds interval,
                                     Generator generator,
                                     std::uint64_t seed)
    : symbols_(std::move(symbols)), interval_(interval), generator_(std::move(generator)), rng_(seed) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Expected positive value for parameter 'interval'");
    }
    if (!generator_) {
        if (symbols_.empty()) {
            throw std::invalid_argument("symbols must not be empty when using the default generator");
        }
        generator_ = [this]() { return default_generator(); };
    }
}

LiveDataSimulator::~LiveDataSimulator() {
    stop();
}

std::vector<MarketData> LiveDataSimulator::default_generator() {
    std::uniform_real_distribution<double> u(0.0, 1.0);

    Timestamp now = std::chrono::system_clock::now();
    std::vector<MarketData> out;
    out.reserve(symbols_.size());
    for (const auto& symbol : symbols_) {
        MarketData bar;
        bar.timestamp = now;
        bar.symbol = symbol;
        bar.open = 100.0 + u(rng_) * 10.0;
        bar.high = 105.0 + u(rng_) * 10.0;
        bar.low = 95.0 + u(rng_) * 10.0;
        bar.close = 100.0 + u(rng_) * 10.0;
        bar.volume = std::round(1000000.0 * (0.5 + u(rng_)));
        bar.vwap = 100.0 + u(rng_) * 10.0;
        out.push_back(bar);
    }
    return out;
}

void LiveDataSimulator::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    if (producer_.joinable()) producer_.join();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = nullptr;
    }
    producer_ = std::thread([this]() { produce_loop(); });
}

void LiveDataSimulator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    wake_.notify_all();
    if (producer_.joinable() && producer_.get_id() != std::this_thread::get_id()) {
        producer_.join();
    }
}

void LiveDataSimulator::produce_loop() {
    while (running_.load()) {
        std::vector<MarketData> batch;
        try {
            batch = generator_();
        } catch (...) {
            // handed to the consumer by get_next_bar() once the buffer is drained
            std::lock_guard<std::mutex> lock(mutex_);
            failure_ = std::current_exception();
            running_.store(false);
            return;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        buffer_.insert(buffer_.end(), batch.begin(), batch.end());
        wake_.wait_for(lock, interval_, [this]() { return !running_.load(); });
    }
}

bool LiveDataSimulator::has_more_data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.load() || cursor_ < buffer_.size() || failure_ != nullptr;
}

std::optional<MarketData> LiveDataSimulator::get_next_bar() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cursor_ < buffer_.size()) return buffer_[cursor_++];
    if (failure_) std::rethrow_exception(failure_);
    return std::nullopt;
}

Timestamp LiveDataSimulator::get_current_timestamp() const {
    return std::chrono::system_clock::now();
}

std::vector<std::string> LiveDataSimulator::get_symbols() const {
    return symbols_;
}

void LiveDataSimulator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
    cursor_ = 0;
}

size_t LiveDataSimulator::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size() - cursor_;
}

} // namespace data
} // namespace backtester
