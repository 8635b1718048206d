#include "report.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace tradekit {

using json = nlohmann::json;

json metric_to_json(const StockMetric& m) {
    return json{
        {"ticker", m.ticker},
        {"final_balance", m.final_balance},
        {"trades", m.trades},
        {"wins", m.wins},
        {"roi_pct", m.roi_pct},
        {"buy_and_hold_pct", m.buy_and_hold_pct},
        {"alpha_pct", m.alpha_pct},
        {"max_drawdown_pct", m.max_drawdown_pct},
        {"sharpe", m.sharpe},
        {"n_periods", m.n_periods}
    };
}

json summary_to_json(const PortfolioSummary& s) {
    return json{
        {"stocks_processed", s.stocks_processed},
        {"total_roi_pct", s.total_roi_pct},
        {"total_trades", s.total_trades},
        {"total_wins", s.total_wins},
        {"win_rate_pct", s.win_rate_pct},
        {"initial_capital", s.initial_capital},
        {"final_capital", s.final_capital},
        {"average_alpha_pct", s.average_alpha_pct},
        {"average_sharpe", s.average_sharpe},
        {"profitable_stocks", s.profitable_stocks}
    };
}

json detail_to_json(const TickerDetail& d, const StockMetric* metric) {
    json j{
        {"dates", d.dates},
        {"closes", d.closes},
        {"signals", d.signals},
        {"balance_history", d.balance_history},
        {"buy_and_hold", d.buy_and_hold},
        {"buy_indices", d.buy_indices},
        {"sell_win_indices", d.sell_win_indices},
        {"sell_loss_indices", d.sell_loss_indices}
    };
    if (metric) {
        j["metrics"] = {
            {"roi_pct", metric->roi_pct},
            {"sharpe", metric->sharpe},
            {"trades", metric->trades}
        };
    }
    return j;
}

const StockMetric* find_metric(const BacktestReport& report, const std::string& ticker) {
    for (const auto& m : report.metrics) {
        if (m.ticker == ticker) return &m;
    }
    return nullptr;
}

json report_to_json(const BacktestReport& report, bool include_details) {
    json metrics = json::array();
    for (const auto& m : report.metrics) metrics.push_back(metric_to_json(m));

    json out{
        {"metrics", metrics},
        {"portfolio_summary", summary_to_json(report.portfolio_summary)}
    };
    if (include_details && !report.details.empty()) {
        json details = json::object();
        for (const auto& kv : report.details) {
            details[kv.first] = detail_to_json(kv.second, find_metric(report, kv.first));
        }
        out["details"] = details;
    }
    return out;
}

void save_report(const BacktestReport& report, const std::string& path, int indent) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) throw std::runtime_error("cannot write " + tmp_path);
        f << report_to_json(report).dump(indent);
        if (!f) throw std::runtime_error("write failed for " + tmp_path);
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw std::runtime_error("cannot rename " + tmp_path + " to " + path + ": " + ec.message());
    }
    spdlog::info("Wrote report for {} tickers to {}", report.metrics.size(), path);
}

} // namespace tradekit
