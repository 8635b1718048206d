#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tradekit {

enum class Signal : int { SELL = -1, HOLD = 0, BUY = 1 };

/**
 * Decision function driven by the simulation loop.
 * `window` holds the prices strictly before the bar being acted on;
 * `position` is 1 while long, 0 while flat. Anything other than -1, 0 or 1
 * is treated as hold by the caller. Implementations may keep their own state
 * across calls but must not touch engine state.
 */
class Strategy {
public:
    virtual ~Strategy() = default;
    virtual int step(const std::vector<double>& window, int position) = 0;
};

using StrategyFactory = std::function<std::shared_ptr<Strategy>()>;

// Adapts any callable to the Strategy interface.
class FunctionStrategy : public Strategy {
public:
    using StepFn = std::function<int(const std::vector<double>&, int)>;

    explicit FunctionStrategy(StepFn fn) : fn_(std::move(fn)) {}

    int step(const std::vector<double>& window, int position) override {
        return fn_(window, position);
    }

private:
    StepFn fn_;
};

/**
 * Buys while the short SMA is above the long SMA, sells while below.
 * The two lengths may be given in either order.
 */
class MovingAverageCrossover : public Strategy {
public:
    MovingAverageCrossover(size_t fast = 21, size_t slow = 8);

    int step(const std::vector<double>& window, int position) override;

    size_t short_window() const { return short_window_; }
    size_t long_window() const { return long_window_; }

private:
    size_t short_window_;
    size_t long_window_;
};

// Buys a falling window while flat, sells a rising window while long.
class MeanReversionStrategy : public Strategy {
public:
    int step(const std::vector<double>& window, int position) override;
};

/**
 * Build a built-in strategy by name ("ma_crossover", "mean_reversion").
 * Throws std::invalid_argument for unknown names or bad parameters.
 */
std::shared_ptr<Strategy> make_strategy(const std::string& name,
                                        const nlohmann::json& params = nlohmann::json::object());

/**
 * Factory producing a fresh instance per call. Validates the name and
 * parameters eagerly so a bad request fails before any ticker is run.
 */
StrategyFactory make_strategy_factory(const std::string& name,
                                      const nlohmann::json& params = nlohmann::json::object());

} // namespace tradekit
