#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include "../src/core/simulation.hpp"

using namespace tradekit;

namespace {

std::vector<PricePoint> series_of(const std::vector<double>& prices) {
    std::vector<PricePoint> out;
    for (size_t i = 0; i < prices.size(); ++i) {
        out.push_back({"d" + std::to_string(i), prices[i]});
    }
    return out;
}

} // namespace

TEST(SimulationTest, MeanReversionWalkthrough) {
    MeanReversionStrategy strategy;
    auto sim = simulate_ticker("AAA", series_of({10, 10, 12, 8, 16}), 2, strategy);

    const auto& d = sim.detail;
    ASSERT_EQ(d.balance_history.size(), 3u);
    EXPECT_EQ(d.dates, (std::vector<std::string>{"d2", "d3", "d4"}));
    EXPECT_EQ(d.signals, (std::vector<int>{0, 0, 1}));
    EXPECT_EQ(d.buy_indices, (std::vector<size_t>{2}));
    EXPECT_TRUE(d.sell_win_indices.empty());
    EXPECT_TRUE(d.sell_loss_indices.empty());
    EXPECT_DOUBLE_EQ(sim.final_balance, 10000.0);
    EXPECT_EQ(sim.trades, 0);
    EXPECT_EQ(sim.wins, 0);
    EXPECT_DOUBLE_EQ(d.balance_history[0], 10000.0);
    EXPECT_DOUBLE_EQ(d.buy_and_hold[0], 10000.0);
    EXPECT_DOUBLE_EQ(d.buy_and_hold[2], 10000.0 / 12.0 * 16.0);
}

TEST(SimulationTest, WinningAndLosingRoundTrips) {
    // history 1: signal at bar i is the scripted value
    std::vector<int> script{1, -1, 1, -1};
    size_t call = 0;
    FunctionStrategy strategy([&](const std::vector<double>& w, int) {
        EXPECT_EQ(w.size(), 1u);
        return script[call++];
    });
    auto sim = simulate_ticker("AAA", series_of({1, 10, 20, 20, 10}), 1, strategy);

    EXPECT_EQ(sim.trades, 2);
    EXPECT_EQ(sim.wins, 1);
    EXPECT_EQ(sim.detail.buy_indices, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(sim.detail.sell_win_indices, (std::vector<size_t>{1}));
    EXPECT_EQ(sim.detail.sell_loss_indices, (std::vector<size_t>{3}));
    EXPECT_DOUBLE_EQ(sim.final_balance, 10000.0);
    EXPECT_DOUBLE_EQ(sim.detail.balance_history[1], 20000.0);
}

TEST(SimulationTest, BreakEvenSellCountsAsLoss) {
    std::vector<int> script{1, -1};
    size_t call = 0;
    FunctionStrategy strategy([&](const std::vector<double>&, int) { return script[call++]; });
    auto sim = simulate_ticker("AAA", series_of({5, 10, 10}), 1, strategy);
    EXPECT_EQ(sim.trades, 1);
    EXPECT_EQ(sim.wins, 0);
    EXPECT_EQ(sim.detail.sell_loss_indices, (std::vector<size_t>{1}));
}

TEST(SimulationTest, RedundantSignalsAreIgnored) {
    FunctionStrategy always_sell([](const std::vector<double>&, int) { return -1; });
    auto flat = simulate_ticker("AAA", series_of({1, 2, 3, 4}), 1, always_sell);
    EXPECT_EQ(flat.trades, 0);
    EXPECT_TRUE(flat.detail.sell_loss_indices.empty());
    EXPECT_DOUBLE_EQ(flat.final_balance, 10000.0);

    FunctionStrategy always_buy([](const std::vector<double>&, int) { return 1; });
    auto longed = simulate_ticker("AAA", series_of({1, 2, 3, 4}), 1, always_buy);
    EXPECT_EQ(longed.detail.buy_indices, (std::vector<size_t>{0}));
    EXPECT_DOUBLE_EQ(longed.final_balance, 10000.0 / 2.0 * 4.0);
}

TEST(SimulationTest, PositionPassedToStrategy) {
    std::vector<int> seen;
    FunctionStrategy strategy([&](const std::vector<double>&, int pos) {
        seen.push_back(pos);
        return pos == 0 ? 1 : -1;
    });
    simulate_ticker("AAA", series_of({1, 2, 3, 4}), 1, strategy);
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 0}));
}

TEST(SimulationTest, InvalidSignalsBecomeHold) {
    size_t call = 0;
    FunctionStrategy strategy([&](const std::vector<double>&, int) -> int {
        if (call++ == 0) throw std::runtime_error("boom");
        return 7;
    });
    auto sim = simulate_ticker("AAA", series_of({1, 2, 3}), 1, strategy);
    EXPECT_EQ(sim.detail.signals, (std::vector<int>{0, 0}));
    EXPECT_TRUE(sim.detail.buy_indices.empty());
    EXPECT_DOUBLE_EQ(sim.final_balance, 10000.0);

    FunctionStrategy throws_int([](const std::vector<double>&, int) -> int { throw 42; });
    auto odd = simulate_ticker("BBB", series_of({1, 2, 3, 4}), 1, throws_int);
    EXPECT_EQ(odd.detail.signals, (std::vector<int>{0, 0, 0}));
    EXPECT_EQ(odd.trades, 0);
    EXPECT_DOUBLE_EQ(odd.final_balance, 10000.0);
}

TEST(SimulationTest, HistoryBoundary) {
    EXPECT_FALSE(has_enough_history(2, 1));
    EXPECT_TRUE(has_enough_history(3, 1));
    EXPECT_FALSE(has_enough_history(31, 30));
    EXPECT_TRUE(has_enough_history(32, 30));
    EXPECT_FALSE(has_enough_history(3, SIZE_MAX));
    EXPECT_FALSE(has_enough_history(0, SIZE_MAX));
    EXPECT_TRUE(has_enough_history(2, 0));
}

TEST(SimulationTest, NormalizeSignal) {
    EXPECT_EQ(normalize_signal(-1), -1);
    EXPECT_EQ(normalize_signal(0), 0);
    EXPECT_EQ(normalize_signal(1), 1);
    EXPECT_EQ(normalize_signal(2), 0);
    EXPECT_EQ(normalize_signal(-5), 0);
}
