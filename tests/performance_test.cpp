#include <gtest/gtest.h>
#include <cmath>
#include "../src/core/performance.hpp"
#include "../src/core/statistics.hpp"

using namespace tradekit;

TEST(PerformanceTest, AnnualizedReturnUses252Periods) {
    std::vector<double> v{100.0, 110.0};
    EXPECT_NEAR(annualized_return(v), std::pow(1.1, 126.0) - 1.0, 1e-6);
    EXPECT_DOUBLE_EQ(annualized_return({}), 0.0);
    EXPECT_DOUBLE_EQ(annualized_return({5.0, 5.0, 5.0}), 0.0);
}

TEST(PerformanceTest, VolatilityAndSharpe) {
    std::vector<double> v{100.0, 110.0, 99.0};
    double vol = stats::stddev_sample({0.10, -0.10}) * std::sqrt(252.0);
    EXPECT_NEAR(annualized_volatility(v), vol, 1e-12);
    EXPECT_NEAR(sharpe_ratio(v, 0.02), (annualized_return(v) - 0.02) / vol, 1e-9);
}

TEST(PerformanceTest, SharpeZeroWithoutVolatility) {
    EXPECT_DOUBLE_EQ(sharpe_ratio({100.0, 100.0, 100.0}, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(sharpe_ratio({100.0}, 0.05), 0.0);
    EXPECT_DOUBLE_EQ(sharpe_ratio({}, 0.0), 0.0);
}

TEST(PerformanceTest, StockMetricFromSimulation) {
    SimulationResult sim;
    sim.ticker = "AAA";
    sim.trades = 3;
    sim.wins = 2;
    sim.detail.balance_history = {10000.0, 5000.0, 12000.0};
    sim.detail.buy_and_hold = {10000.0, 10500.0, 11000.0};
    sim.final_balance = 12000.0;

    auto m = compute_stock_metric(sim, 0.0);
    EXPECT_EQ(m.ticker, "AAA");
    EXPECT_EQ(m.trades, 3);
    EXPECT_EQ(m.wins, 2);
    EXPECT_EQ(m.n_periods, 3u);
    EXPECT_DOUBLE_EQ(m.final_balance, 12000.0);
    EXPECT_NEAR(m.roi_pct, 20.0, 1e-9);
    EXPECT_NEAR(m.buy_and_hold_pct, 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(m.alpha_pct, m.roi_pct - m.buy_and_hold_pct);
    EXPECT_NEAR(m.max_drawdown_pct, 50.0, 1e-9);
    EXPECT_NE(m.sharpe, 0.0);
}

TEST(PerformanceTest, FlatRunScoresZero) {
    SimulationResult sim;
    sim.ticker = "FLAT";
    sim.detail.balance_history = {10000.0, 10000.0};
    sim.detail.buy_and_hold = {10000.0, 10000.0};
    auto m = compute_stock_metric(sim, 0.0);
    EXPECT_DOUBLE_EQ(m.roi_pct, 0.0);
    EXPECT_DOUBLE_EQ(m.alpha_pct, 0.0);
    EXPECT_DOUBLE_EQ(m.max_drawdown_pct, 0.0);
    EXPECT_DOUBLE_EQ(m.sharpe, 0.0);
}

TEST(PerformanceTest, BuyAndHoldNeedsPositiveStart) {
    EXPECT_DOUBLE_EQ(buy_and_hold_pct({}), 0.0);
    EXPECT_DOUBLE_EQ(buy_and_hold_pct({0.0, 0.0}), 0.0);
    EXPECT_NEAR(buy_and_hold_pct({100.0, 125.0}), 25.0, 1e-9);
}
