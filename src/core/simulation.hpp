#pragma once

#include <string>
#include <vector>
#include "price_loader.hpp"
#include "strategy.hpp"

namespace tradekit {

constexpr double kInitialCapitalPerStock = 10000.0;

enum class PositionState { FLAT, LONG };

// Per-ticker mutable state; lives only for one ticker's loop.
struct SimulationState {
    explicit SimulationState(double initial_capital) : balance(initial_capital) {}

    double balance{0.0};
    double shares{0.0};
    double entry_price{0.0};
    PositionState position{PositionState::FLAT};
    int trades{0};
    int wins{0};

    double value(double price) const {
        return position == PositionState::LONG ? shares * price : balance;
    }
};

/**
 * Per-bar record of one ticker's run. All series have one entry per
 * simulated bar; event indices are relative to the first simulated bar.
 */
struct TickerDetail {
    std::vector<std::string> dates;
    std::vector<double> closes;
    std::vector<int> signals;
    std::vector<double> balance_history;
    std::vector<double> buy_and_hold;
    std::vector<size_t> buy_indices;
    std::vector<size_t> sell_win_indices;
    std::vector<size_t> sell_loss_indices;
};

struct SimulationResult {
    std::string ticker;
    double initial_capital{kInitialCapitalPerStock};
    double final_balance{kInitialCapitalPerStock};
    int trades{0};
    int wins{0};
    TickerDetail detail;
};

/**
 * A series must be strictly longer than history_size + 1 to be simulated.
 */
inline bool has_enough_history(size_t series_len, size_t history_size) {
    return series_len > history_size && series_len - history_size > 1;
}

/**
 * Map a raw strategy return onto {-1, 0, 1}; anything else becomes hold.
 */
inline int normalize_signal(int raw) {
    return (raw >= -1 && raw <= 1) ? raw : static_cast<int>(Signal::HOLD);
}

/**
 * Replay `strategy` over `series` starting at bar `history_size`.
 * Strategy exceptions and out-of-range signals are logged and read as hold.
 */
SimulationResult simulate_ticker(const std::string& ticker,
                                 const std::vector<PricePoint>& series,
                                 size_t history_size,
                                 Strategy& strategy,
                                 double initial_capital = kInitialCapitalPerStock);

} // namespace tradekit
