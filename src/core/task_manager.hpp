#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "backtest_engine.hpp"
#include "config.hpp"
#include "utils.hpp"

namespace tradekit {

struct TaskRequest {
    BacktestConfig backtest;
    StrategyConfig strategy;
};

enum class TaskStatus { QUEUED, RUNNING, COMPLETED, ERROR };

std::string status_to_string(TaskStatus status);

/**
 * Build a request from a /run body laid over the configured defaults.
 * Accepts the backtest keys plus "strategy" and "params". Switching strategy
 * without "params" drops the configured params. An empty body yields the
 * defaults. Throws nlohmann::json::exception or std::invalid_argument.
 */
TaskRequest parse_task_request(const std::string& body, const Config& cfg);

struct Task {
    std::string id;
    TaskRequest request;
    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    TaskStatus status{TaskStatus::QUEUED};
    std::string error;
    std::shared_ptr<const BacktestReport> report;
    std::unique_ptr<std::thread> worker_thread;
    mutable std::mutex mutex;
    std::condition_variable done_cv;

    Task(const std::string& task_id, TaskRequest req);
    ~Task();

    bool finished() const;
};

/**
 * Runs backtests on background threads and keeps finished reports
 * addressable by task id. At most `max_tasks` finished tasks are retained;
 * the oldest are dropped first.
 */
class TaskManager {
public:
    explicit TaskManager(size_t max_tasks = 64);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Throws std::invalid_argument if the strategy cannot be built.
    std::shared_ptr<Task> submit(TaskRequest request);

    std::shared_ptr<Task> get_task(const std::string& task_id) const;
    std::vector<std::shared_ptr<Task>> list_tasks() const;

    // Removes a finished task. Returns false when unknown or still running.
    bool destroy_task(const std::string& task_id);

    // Blocks until the task finishes or the timeout expires.
    bool wait(const std::string& task_id, std::chrono::milliseconds timeout) const;

private:
    static void run_task(const std::shared_ptr<Task>& task, StrategyFactory factory);
    void evict_finished_locked();

    size_t max_tasks_;
    std::unordered_map<std::string, std::shared_ptr<Task>> tasks_;
    std::vector<std::string> order_;
    mutable std::mutex mutex_;
};

} // namespace tradekit
