#include "performance.hpp"
#include "statistics.hpp"
#include <cmath>

namespace tradekit {

double annualized_return(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double n = static_cast<double>(values.size());
    return std::pow(values.back() / values.front(), kTradingDaysPerYear / n) - 1.0;
}

double annualized_volatility(const std::vector<double>& values) {
    return stats::stddev_sample(stats::pct_changes(values)) * std::sqrt(kTradingDaysPerYear);
}

double sharpe_ratio(const std::vector<double>& values, double risk_free_rate_annual) {
    double vol = annualized_volatility(values);
    if (!(vol > 0.0)) return 0.0;
    return (annualized_return(values) - risk_free_rate_annual) / vol;
}

double buy_and_hold_pct(const std::vector<double>& bh_values) {
    if (bh_values.empty() || !(bh_values.front() > 0.0)) return 0.0;
    return (bh_values.back() / bh_values.front() - 1.0) * 100.0;
}

StockMetric compute_stock_metric(const SimulationResult& sim, double risk_free_rate_annual) {
    const auto& values = sim.detail.balance_history;
    StockMetric m;
    m.ticker = sim.ticker;
    m.final_balance = values.empty() ? sim.final_balance : values.back();
    m.trades = sim.trades;
    m.wins = sim.wins;
    m.roi_pct = (m.final_balance - sim.initial_capital) / sim.initial_capital * 100.0;
    m.buy_and_hold_pct = buy_and_hold_pct(sim.detail.buy_and_hold);
    m.alpha_pct = m.roi_pct - m.buy_and_hold_pct;
    m.max_drawdown_pct = stats::max_drawdown(values) * 100.0;
    m.sharpe = sharpe_ratio(values, risk_free_rate_annual);
    m.n_periods = values.size();
    return m;
}

} // namespace tradekit
