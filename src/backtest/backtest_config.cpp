/**
 * @file backtest_config.cpp
 * @brief Backtest configuration parsing and validation
 */

#include "backtest/backtest_config.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace backtester {
namespace backtest {

namespace {

Timestamp read_date(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw std::invalid_argument(std::string("Backtest configuration must specify '") + key + "'");
    }
    return parse_timestamp(j[key].get<std::string>());
}

void require_non_negative(double value, const char* name) {
    if (value < 0.0 || !std::isfinite(value)) {
        std::ostringstream ss; ss << value;
        throw std::invalid_argument(std::string("Expected positive value for parameter '") + name + "', got: " + ss.str());
    }
}

} // namespace

BacktestConfig BacktestConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Backtest configuration must be a JSON object");
    }
    BacktestConfig cfg;
    cfg.start_date = read_date(j, "start_date");
    cfg.end_date = read_date(j, "end_date");
    cfg.initial_capital = j.value("initial_capital", cfg.initial_capital);
    cfg.symbols = j.value("symbols", cfg.symbols);
    cfg.commission = j.value("commission", cfg.commission);
    cfg.slippage = j.value("slippage", cfg.slippage);
    if (j.contains("benchmark_symbol") && j["benchmark_symbol"].is_string()) {
        cfg.benchmark_symbol = j["benchmark_symbol"].get<std::string>();
    }
    if (j.contains("risk_free_rate") && j["risk_free_rate"].is_number()) {
        cfg.risk_free_rate = j["risk_free_rate"].get<double>();
    }
    cfg.validate();
    return cfg;
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j = {
        {"start_date", format_timestamp(start_date)},
        {"end_date", format_timestamp(end_date)},
        {"initial_capital", initial_capital},
        {"symbols", symbols},
        {"commission", commission},
        {"slippage", slippage},
        {"risk_free_rate", effective_risk_free_rate()}};
    if (benchmark_symbol) j["benchmark_symbol"] = *benchmark_symbol;
    return j;
}

void BacktestConfig::validate() const {
    if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
        std::ostringstream ss; ss << initial_capital;
        throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " + ss.str());
    }
    if (end_date < start_date) {
        throw std::invalid_argument("end_date (" + format_timestamp(end_date) +
                                    ") is before start_date (" + format_timestamp(start_date) + ")");
    }
    if (symbols.empty()) {
        throw std::invalid_argument("Backtest configuration must list at least one symbol");
    }
    require_non_negative(commission, "commission");
    require_non_negative(slippage, "slippage");
    if (risk_free_rate && !std::isfinite(*risk_free_rate)) {
        throw std::invalid_argument("risk_free_rate must be finite");
    }
    if (benchmark_symbol && benchmark_symbol->empty()) {
        throw std::invalid_argument("benchmark_symbol must not be empty when given");
    }
}

} // namespace backtest
} // namespace backtester
