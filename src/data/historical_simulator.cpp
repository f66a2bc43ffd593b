// ============================================================================
// Implementation of HistoricalDataSimulator
// ============================================================================

#include "data/historical_simulator.hpp"

#include <algorithm>

namespace backtester {
namespace data {

HistoricalDataSimulator::HistoricalDataSimulator(std::vector<MarketData> bars)
    : bars_(std::move(bars)) {
    std::stable_sort(bars_.begin(), bars_.end(),
                     [](const MarketData& a, const MarketData& b) { return a.timestamp < b.timestamp; });
    symbols_ = unique_symbols(bars_);
}

bool HistoricalDataSimulator::has_more_data() const {
    return cursor_ < bars_.size();
}

std::optional<MarketData> HistoricalDataSimulator::get_next_bar() {
    if (cursor_ >= bars_.size()) return std::nullopt;
    return bars_[cursor_++];
}

Timestamp HistoricalDataSimulator::get_current_timestamp() const {
    if (bars_.empty()) return Timestamp{};
    if (cursor_ == 0) return bars_.front().timestamp;
    if (cursor_ >= bars_.size()) return bars_.back().timestamp;
    return bars_[cursor_ - 1].timestamp;
}

std::vector<std::string> HistoricalDataSimulator::get_symbols() const {
    return symbols_;
}

void HistoricalDataSimulator::reset() {
    cursor_ = 0;
}

std::vector<MarketData> HistoricalDataSimulator::get_data_in_range(const Timestamp& start,
                                                                   const Timestamp& end,
                                                                   const std::vector<std::string>& symbols) const {
    std::vector<MarketData> out;
    for (const auto& bar : bars_) {
        if (bar.timestamp < start || bar.timestamp > end) continue;
        if (!symbols.empty() &&
            std::find(symbols.begin(), symbols.end(), bar.symbol) == symbols.end()) {
            continue;
        }
        out.push_back(bar);
    }
    return out;
}

} // namespace data
} // namespace backtester
