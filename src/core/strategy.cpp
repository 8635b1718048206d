#include "strategy.hpp"
#include "indicators.hpp"
#include <algorithm>
#include <stdexcept>

namespace tradekit {

MovingAverageCrossover::MovingAverageCrossover(size_t fast, size_t slow)
    : short_window_(std::min(fast, slow))
    , long_window_(std::max(fast, slow)) {
    if (short_window_ == 0) {
        throw std::invalid_argument("ma_crossover windows must be positive");
    }
}

int MovingAverageCrossover::step(const std::vector<double>& window, int) {
    if (window.size() < long_window_) return static_cast<int>(Signal::HOLD);

    std::vector<double> recent(window.end() - static_cast<std::ptrdiff_t>(long_window_), window.end());
    double ma_long = indicators::sma(recent, long_window_).back();
    double ma_short = indicators::sma(recent, short_window_).back();

    if (ma_short > ma_long) return static_cast<int>(Signal::BUY);
    if (ma_short < ma_long) return static_cast<int>(Signal::SELL);
    return static_cast<int>(Signal::HOLD);
}

int MeanReversionStrategy::step(const std::vector<double>& window, int position) {
    if (window.empty()) return static_cast<int>(Signal::HOLD);
    double first = window.front();
    double last = window.back();
    if (position == 0 && last < first) return static_cast<int>(Signal::BUY);
    if (position == 1 && last > first) return static_cast<int>(Signal::SELL);
    return static_cast<int>(Signal::HOLD);
}

std::shared_ptr<Strategy> make_strategy(const std::string& name, const nlohmann::json& params) {
    try {
        if (name == "ma_crossover") {
            size_t fast = params.value("fast", static_cast<size_t>(21));
            size_t slow = params.value("slow", static_cast<size_t>(8));
            return std::make_shared<MovingAverageCrossover>(fast, slow);
        }
        if (name == "mean_reversion") {
            return std::make_shared<MeanReversionStrategy>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("bad parameters for strategy " + name + ": " + e.what());
    }
    throw std::invalid_argument("unknown strategy: " + name);
}

StrategyFactory make_strategy_factory(const std::string& name, const nlohmann::json& params) {
    make_strategy(name, params);
    return [name, params]() { return make_strategy(name, params); };
}

} // namespace tradekit
