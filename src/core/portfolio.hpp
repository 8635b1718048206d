#pragma once

#include <vector>
#include "performance.hpp"

namespace tradekit {

struct PortfolioSummary {
    size_t stocks_processed{0};
    double total_roi_pct{0.0};
    int total_trades{0};
    int total_wins{0};
    double win_rate_pct{0.0};
    double initial_capital{0.0};
    double final_capital{0.0};
    double average_alpha_pct{0.0};
    double average_sharpe{0.0};
    size_t profitable_stocks{0};
};

/**
 * Folds per-ticker metrics into portfolio totals. Add a ticker only once its
 * simulation has finished.
 */
class PortfolioAccumulator {
public:
    void add(const StockMetric& metric, double initial_capital = kInitialCapitalPerStock);
    PortfolioSummary summary() const;

private:
    size_t count_{0};
    double total_initial_{0.0};
    double total_final_{0.0};
    int total_trades_{0};
    int total_wins_{0};
    double sum_alpha_pct_{0.0};
    double sum_sharpe_{0.0};
    size_t profitable_{0};
};

PortfolioSummary summarize(const std::vector<StockMetric>& metrics,
                           double initial_capital = kInitialCapitalPerStock);

} // namespace tradekit
