#include "simulation.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace tradekit {

namespace {

int call_strategy(Strategy& strategy,
                  const std::vector<double>& window,
                  int position,
                  const std::string& ticker,
                  size_t index) {
    int raw = 0;
    try {
        raw = strategy.step(window, position);
    } catch (const std::exception& e) {
        spdlog::warn("Error calling strategy for {} at index {}: {}", ticker, index, e.what());
        return static_cast<int>(Signal::HOLD);
    } catch (...) {
        spdlog::warn("Error calling strategy for {} at index {}: unknown error", ticker, index);
        return static_cast<int>(Signal::HOLD);
    }
    int signal = normalize_signal(raw);
    if (signal != raw) {
        spdlog::warn("Strategy returned {} for {} at index {}, treating as hold", raw, ticker, index);
    }
    return signal;
}

} // namespace

SimulationResult simulate_ticker(const std::string& ticker,
                                 const std::vector<PricePoint>& series,
                                 size_t history_size,
                                 Strategy& strategy,
                                 double initial_capital) {
    SimulationResult result;
    result.ticker = ticker;
    result.initial_capital = initial_capital;
    result.final_balance = initial_capital;
    if (series.size() <= history_size) return result;

    const size_t n_bars = series.size() - history_size;
    TickerDetail& out = result.detail;
    out.dates.reserve(n_bars);
    out.closes.reserve(n_bars);
    out.signals.reserve(n_bars);
    out.balance_history.reserve(n_bars);
    out.buy_and_hold.reserve(n_bars);

    SimulationState st(initial_capital);

    const double bh_start_price = series[history_size].price;
    const double bh_shares = bh_start_price > 0.0 ? initial_capital / bh_start_price : 0.0;

    std::vector<double> window(history_size);
    for (size_t i = history_size; i < series.size(); ++i) {
        const double price = series[i].price;
        const size_t bar = i - history_size;

        for (size_t k = 0; k < history_size; ++k) {
            window[k] = series[i - history_size + k].price;
        }
        const int position = st.position == PositionState::LONG ? 1 : 0;
        const int signal = call_strategy(strategy, window, position, ticker, i);

        if (st.position == PositionState::LONG) {
            if (signal == static_cast<int>(Signal::SELL)) {
                double revenue = st.shares * price;
                double profit = revenue - st.shares * st.entry_price;
                if (profit > 0.0) {
                    ++st.wins;
                    out.sell_win_indices.push_back(bar);
                } else {
                    out.sell_loss_indices.push_back(bar);
                }
                st.balance = revenue;
                st.shares = 0.0;
                st.position = PositionState::FLAT;
                ++st.trades;
            }
        } else if (signal == static_cast<int>(Signal::BUY)) {
            st.position = PositionState::LONG;
            st.entry_price = price;
            st.shares = price > 0.0 ? st.balance / price : 0.0;
            out.buy_indices.push_back(bar);
        }

        out.dates.push_back(series[i].date);
        out.closes.push_back(price);
        out.signals.push_back(signal);
        out.balance_history.push_back(st.value(price));
        out.buy_and_hold.push_back(bh_shares * price);
    }

    result.trades = st.trades;
    result.wins = st.wins;
    result.final_balance = out.balance_history.empty() ? st.balance : out.balance_history.back();
    return result;
}

} // namespace tradekit
