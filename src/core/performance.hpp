#pragma once

#include <string>
#include <vector>
#include "simulation.hpp"

namespace tradekit {

constexpr double kTradingDaysPerYear = 252.0;

struct StockMetric {
    std::string ticker;
    double final_balance{0.0};
    int trades{0};
    int wins{0};
    double roi_pct{0.0};
    double buy_and_hold_pct{0.0};
    double alpha_pct{0.0};
    double max_drawdown_pct{0.0};
    double sharpe{0.0};
    size_t n_periods{0};
};

// (last/first)^(252/n) - 1; 0 for an empty series.
double annualized_return(const std::vector<double>& values);

// Sample stddev of per-period returns scaled by sqrt(252).
double annualized_volatility(const std::vector<double>& values);

// 0 when volatility is 0.
double sharpe_ratio(const std::vector<double>& values, double risk_free_rate_annual);

// (last/first - 1) * 100; 0 for an empty series or a non-positive start.
double buy_and_hold_pct(const std::vector<double>& bh_values);

StockMetric compute_stock_metric(const SimulationResult& sim, double risk_free_rate_annual);

} // namespace tradekit
