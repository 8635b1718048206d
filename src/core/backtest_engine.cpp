#include "backtest_engine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

namespace tradekit {

const TickerDetail* BacktestReport::find_detail(const std::string& ticker) const {
    auto it = details.find(ticker);
    return it == details.end() ? nullptr : &it->second;
}

BacktestEngine::BacktestEngine(StrategyFactory factory, BacktestConfig cfg)
    : factory_(std::move(factory))
    , cfg_(std::move(cfg)) {
    if (!factory_) throw std::invalid_argument("strategy factory is empty");
}

BacktestEngine::BacktestEngine(std::shared_ptr<Strategy> strategy, BacktestConfig cfg)
    : shared_instance_(true)
    , cfg_(std::move(cfg)) {
    if (!strategy) throw std::invalid_argument("strategy is null");
    factory_ = [strategy]() { return strategy; };
}

std::shared_ptr<Strategy> BacktestEngine::new_strategy() const {
    auto s = factory_();
    if (!s) throw std::runtime_error("strategy factory returned null");
    return s;
}

BacktestReport BacktestEngine::run() const {
    auto files = discover_ticker_files(cfg_.data_folder, cfg_.file_suffix);
    spdlog::info("Found {} ticker files in {}", files.size(), cfg_.data_folder);
    return run(files);
}

BacktestReport BacktestEngine::run(const std::vector<TickerFile>& files) const {
    std::vector<std::optional<TickerOutcome>> outcomes(files.size());
    execute(files.size(), [&](size_t idx, Strategy& strategy) {
        outcomes[idx] = process_file(files[idx], strategy);
    });
    return assemble(outcomes);
}

BacktestReport BacktestEngine::run(const std::vector<NamedSeries>& series) const {
    std::vector<std::optional<TickerOutcome>> outcomes(series.size());
    execute(series.size(), [&](size_t idx, Strategy& strategy) {
        try {
            outcomes[idx] = run_ticker(series[idx].ticker, series[idx].series, strategy);
        } catch (const std::exception& e) {
            spdlog::error("Skipping {}: {}", series[idx].ticker, e.what());
        }
    });
    return assemble(outcomes);
}

std::optional<TickerOutcome> BacktestEngine::run_ticker(const std::string& ticker,
                                                        const std::vector<PricePoint>& series,
                                                        Strategy& strategy) const {
    if (!has_enough_history(series.size(), cfg_.history_size)) {
        spdlog::debug("Skipping {}: {} rows, need more than {}", ticker, series.size(), cfg_.history_size + 1);
        return std::nullopt;
    }
    auto sim = simulate_ticker(ticker, series, cfg_.history_size, strategy);
    TickerOutcome out;
    out.metric = compute_stock_metric(sim, cfg_.risk_free_rate_annual);
    out.detail = std::move(sim.detail);
    spdlog::debug("{}: roi={:.2f}% trades={} wins={} sharpe={:.3f}",
                  ticker, out.metric.roi_pct, out.metric.trades, out.metric.wins, out.metric.sharpe);
    return out;
}

std::optional<TickerOutcome> BacktestEngine::process_file(const TickerFile& file, Strategy& strategy) const {
    std::vector<PricePoint> series;
    try {
        series = load_date_and_prices(file.path);
    } catch (const std::exception& e) {
        spdlog::warn("Skipping {} because of read error: {}", file.path, e.what());
        return std::nullopt;
    }
    try {
        return run_ticker(file.ticker, series, strategy);
    } catch (const std::exception& e) {
        spdlog::error("Skipping {}: {}", file.ticker, e.what());
        return std::nullopt;
    }
}

void BacktestEngine::execute(size_t n_jobs, const Job& job) const {
    if (n_jobs == 0) return;
    size_t n_threads = cfg_.worker_threads > 1 ? static_cast<size_t>(cfg_.worker_threads) : 1;
    if (n_threads > 1 && shared_instance_) {
        spdlog::warn("Single strategy instance supplied, running {} tickers sequentially", n_jobs);
        n_threads = 1;
    }
    n_threads = std::min(n_threads, n_jobs);

    if (n_threads == 1) {
        auto strategy = new_strategy();
        for (size_t i = 0; i < n_jobs; ++i) job(i, *strategy);
        return;
    }

    std::atomic<size_t> next{0};
    std::vector<std::thread> workers;
    workers.reserve(n_threads);
    for (size_t t = 0; t < n_threads; ++t) {
        workers.emplace_back([this, &next, &job, n_jobs, t]() {
            try {
                auto strategy = new_strategy();
                size_t idx;
                while ((idx = next.fetch_add(1)) < n_jobs) {
                    job(idx, *strategy);
                }
            } catch (const std::exception& e) {
                spdlog::error("Backtest worker {} stopped: {}", t, e.what());
            }
        });
    }
    for (auto& w : workers) w.join();
}

BacktestReport BacktestEngine::assemble(std::vector<std::optional<TickerOutcome>>& outcomes) const {
    BacktestReport report;
    PortfolioAccumulator acc;
    for (auto& o : outcomes) {
        if (!o) continue;
        acc.add(o->metric, kInitialCapitalPerStock);
        if (cfg_.include_details) {
            report.details[o->metric.ticker] = std::move(o->detail);
        }
        report.metrics.push_back(std::move(o->metric));
    }
    report.portfolio_summary = acc.summary();
    const auto& s = report.portfolio_summary;
    spdlog::info("Backtest done: stocks={} total_roi={:.2f}% trades={} win_rate={:.2f}% avg_sharpe={:.3f}",
                 s.stocks_processed, s.total_roi_pct, s.total_trades, s.win_rate_pct, s.average_sharpe);
    return report;
}

} // namespace tradekit
