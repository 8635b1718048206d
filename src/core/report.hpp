#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest_engine.hpp"

namespace tradekit {

nlohmann::json metric_to_json(const StockMetric& m);
nlohmann::json summary_to_json(const PortfolioSummary& s);

// Per-bar series for charting; `metric` adds the short metrics block when given.
nlohmann::json detail_to_json(const TickerDetail& d, const StockMetric* metric = nullptr);

/**
 * {"metrics": [...], "portfolio_summary": {...}, "details": {TICKER: {...}}}
 * "details" is left out when the report carries none or include_details is false.
 */
nlohmann::json report_to_json(const BacktestReport& report, bool include_details = true);

const StockMetric* find_metric(const BacktestReport& report, const std::string& ticker);

// Writes to "<path>.tmp" then renames over `path`. Throws std::runtime_error.
void save_report(const BacktestReport& report, const std::string& path, int indent = 2);

} // namespace tradekit
