#include "portfolio.hpp"

namespace tradekit {

void PortfolioAccumulator::add(const StockMetric& metric, double initial_capital) {
    ++count_;
    total_initial_ += initial_capital;
    total_final_ += metric.final_balance;
    total_trades_ += metric.trades;
    total_wins_ += metric.wins;
    sum_alpha_pct_ += metric.alpha_pct;
    sum_sharpe_ += metric.sharpe;
    if (metric.roi_pct > 0.0) ++profitable_;
}

PortfolioSummary PortfolioAccumulator::summary() const {
    PortfolioSummary out;
    out.stocks_processed = count_;
    out.total_trades = total_trades_;
    out.total_wins = total_wins_;
    out.initial_capital = total_initial_;
    out.final_capital = total_final_;
    out.profitable_stocks = profitable_;
    if (total_initial_ > 0.0) {
        out.total_roi_pct = (total_final_ - total_initial_) / total_initial_ * 100.0;
    }
    if (total_trades_ > 0) {
        out.win_rate_pct = static_cast<double>(total_wins_) / static_cast<double>(total_trades_) * 100.0;
    }
    if (count_ > 0) {
        double n = static_cast<double>(count_);
        out.average_alpha_pct = sum_alpha_pct_ / n;
        out.average_sharpe = sum_sharpe_ / n;
    }
    return out;
}

PortfolioSummary summarize(const std::vector<StockMetric>& metrics, double initial_capital) {
    PortfolioAccumulator acc;
    for (const auto& m : metrics) acc.add(m, initial_capital);
    return acc.summary();
}

} // namespace tradekit
