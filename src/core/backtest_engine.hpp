#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "performance.hpp"
#include "portfolio.hpp"
#include "price_loader.hpp"
#include "simulation.hpp"
#include "strategy.hpp"

namespace tradekit {

struct TickerOutcome {
    StockMetric metric;
    TickerDetail detail;
};

struct BacktestReport {
    std::vector<StockMetric> metrics;            // load order
    PortfolioSummary portfolio_summary;
    std::map<std::string, TickerDetail> details; // empty unless include_details

    const TickerDetail* find_detail(const std::string& ticker) const;
};

struct NamedSeries {
    std::string ticker;
    std::vector<PricePoint> series;
};

/**
 * Runs one strategy over every ticker file in a data folder.
 *
 * Tickers are independent: each gets its own SimulationState, and the
 * portfolio accumulator is fed in load order once all tickers are done, so a
 * parallel run produces the same report as a sequential one.
 */
class BacktestEngine {
public:
    // One strategy instance per worker thread.
    BacktestEngine(StrategyFactory factory, BacktestConfig cfg);

    // A single caller-owned instance; forces sequential execution.
    BacktestEngine(std::shared_ptr<Strategy> strategy, BacktestConfig cfg);

    BacktestReport run() const;
    BacktestReport run(const std::vector<TickerFile>& files) const;
    BacktestReport run(const std::vector<NamedSeries>& series) const;

    // Simulate and score one loaded series; nullopt when it is too short.
    std::optional<TickerOutcome> run_ticker(const std::string& ticker,
                                            const std::vector<PricePoint>& series,
                                            Strategy& strategy) const;

    const BacktestConfig& config() const { return cfg_; }

private:
    using Job = std::function<void(size_t, Strategy&)>;

    std::optional<TickerOutcome> process_file(const TickerFile& file, Strategy& strategy) const;
    void execute(size_t n_jobs, const Job& job) const;
    std::shared_ptr<Strategy> new_strategy() const;
    BacktestReport assemble(std::vector<std::optional<TickerOutcome>>& outcomes) const;

    StrategyFactory factory_;
    bool shared_instance_{false};
    BacktestConfig cfg_;
};

} // namespace tradekit
