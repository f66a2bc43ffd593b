#include "strategy/price_history.hpp"

namespace backtester {
namespace strategy {

const std::deque<double>& PriceHistory::push(const std::string& symbol, double price) {
    auto& window = windows_[symbol];
    window.push_back(price);
    while (window.size() > max_length_) window.pop_front();
    return window;
}

const std::deque<double>& PriceHistory::get(const std::string& symbol) const {
    static const std::deque<double> empty;
    auto it = windows_.find(symbol);
    return it == windows_.end() ? empty : it->second;
}

std::vector<double> PriceHistory::values(const std::string& symbol, size_t drop_last) const {
    const auto& window = get(symbol);
    if (drop_last >= window.size()) return {};
    return std::vector<double>(window.begin(), window.end() - static_cast<std::ptrdiff_t>(drop_last));
}

} // namespace strategy
} // namespace backtester
