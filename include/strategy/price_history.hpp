#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace backtester {
namespace strategy {

/**
 * @class PriceHistory
 * @brief Size-bounded rolling price window per symbol.
 */
class PriceHistory {
public:
    explicit PriceHistory(size_t max_length) : max_length_(max_length) {}

    /**
     * @brief Append a price and trim the window to max_length.
     * @return The symbol's window after the update (oldest first).
     */
    const std::deque<double>& push(const std::string& symbol, double price);

    const std::deque<double>& get(const std::string& symbol) const;

    /** @brief Copy of the window, optionally without the newest `drop_last` entries. */
    std::vector<double> values(const std::string& symbol, size_t drop_last = 0) const;

    size_t max_length() const { return max_length_; }
    void clear() { windows_.clear(); }

private:
    size_t max_length_;
    std::map<std::string, std::deque<double>> windows_;
};

} // namespace strategy
} // namespace backtester
