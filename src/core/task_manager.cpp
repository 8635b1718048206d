#include "task_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace tradekit {

std::string status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::QUEUED: return "queued";
        case TaskStatus::RUNNING: return "processing";
        case TaskStatus::COMPLETED: return "success";
        case TaskStatus::ERROR: return "error";
    }
    return "unknown";
}

TaskRequest parse_task_request(const std::string& body, const Config& cfg) {
    TaskRequest request;
    request.backtest = cfg.backtest;
    request.strategy = cfg.strategy;
    if (body.empty()) return request;

    auto j = json::parse(body);
    if (!j.is_object()) throw std::invalid_argument("request body must be a JSON object");
    apply_backtest_overrides(request.backtest, j);
    if (j.contains("strategy")) {
        std::string name = j["strategy"].get<std::string>();
        if (name != request.strategy.name) request.strategy.params = json::object();
        request.strategy.name = name;
    }
    if (j.contains("params")) request.strategy.params = j["params"];
    return request;
}

Task::Task(const std::string& task_id, TaskRequest req)
    : id(task_id)
    , request(std::move(req))
    , created_at(std::chrono::system_clock::now()) {}

Task::~Task() {
    if (worker_thread && worker_thread->joinable()) {
        if (worker_thread->get_id() == std::this_thread::get_id()) {
            worker_thread->detach();
        } else {
            worker_thread->join();
        }
    }
}

bool Task::finished() const {
    std::lock_guard<std::mutex> lock(mutex);
    return status == TaskStatus::COMPLETED || status == TaskStatus::ERROR;
}

TaskManager::TaskManager(size_t max_tasks)
    : max_tasks_(max_tasks == 0 ? 1 : max_tasks) {}

TaskManager::~TaskManager() {
    std::vector<std::shared_ptr<Task>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : tasks_) tasks.push_back(kv.second);
        tasks_.clear();
        order_.clear();
    }
    for (auto& t : tasks) {
        if (t->worker_thread && t->worker_thread->joinable()) t->worker_thread->join();
    }
}

std::shared_ptr<Task> TaskManager::submit(TaskRequest request) {
    auto factory = make_strategy_factory(request.strategy.name, request.strategy.params);

    auto task = std::make_shared<Task>(utils::generate_id(), std::move(request));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_finished_locked();
        tasks_[task->id] = task;
        order_.push_back(task->id);
    }
    spdlog::info("Queued task {} strategy={} history_size={} folder={}",
                 task->id, task->request.strategy.name,
                 task->request.backtest.history_size, task->request.backtest.data_folder);

    std::lock_guard<std::mutex> lock(task->mutex);
    task->worker_thread = std::make_unique<std::thread>(&TaskManager::run_task, task, std::move(factory));
    return task;
}

void TaskManager::run_task(const std::shared_ptr<Task>& task, StrategyFactory factory) {
    BacktestConfig cfg;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->status = TaskStatus::RUNNING;
        task->started_at = std::chrono::system_clock::now();
        cfg = task->request.backtest;
    }
    try {
        BacktestEngine engine(std::move(factory), cfg);
        auto report = std::make_shared<const BacktestReport>(engine.run());
        std::lock_guard<std::mutex> lock(task->mutex);
        task->report = std::move(report);
        task->status = TaskStatus::COMPLETED;
        task->completed_at = std::chrono::system_clock::now();
        spdlog::info("Task {} completed: {} tickers", task->id, task->report->metrics.size());
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(task->mutex);
        task->status = TaskStatus::ERROR;
        task->error = e.what();
        task->completed_at = std::chrono::system_clock::now();
        spdlog::error("Task {} failed: {}", task->id, e.what());
    }
    task->done_cv.notify_all();
}

std::shared_ptr<Task> TaskManager::get_task(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Task>> TaskManager::list_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Task>> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = tasks_.find(id);
        if (it != tasks_.end()) out.push_back(it->second);
    }
    return out;
}

bool TaskManager::destroy_task(const std::string& task_id) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end() || !it->second->finished()) return false;
        task = it->second;
        tasks_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), task_id), order_.end());
    }
    if (task->worker_thread && task->worker_thread->joinable()) task->worker_thread->join();
    spdlog::info("Task {} removed", task_id);
    return true;
}

bool TaskManager::wait(const std::string& task_id, std::chrono::milliseconds timeout) const {
    auto task = get_task(task_id);
    if (!task) return false;
    std::unique_lock<std::mutex> lock(task->mutex);
    return task->done_cv.wait_for(lock, timeout, [&]() {
        return task->status == TaskStatus::COMPLETED || task->status == TaskStatus::ERROR;
    });
}

void TaskManager::evict_finished_locked() {
    auto it = order_.begin();
    while (tasks_.size() >= max_tasks_ && it != order_.end()) {
        auto t = tasks_.find(*it);
        if (t != tasks_.end() && t->second->finished()) {
            if (t->second->worker_thread && t->second->worker_thread->joinable()) {
                t->second->worker_thread->join();
            }
            spdlog::debug("Evicting finished task {}", *it);
            tasks_.erase(t);
            it = order_.erase(it);
        } else {
            ++it;
        }
    }
    if (tasks_.size() >= max_tasks_) {
        spdlog::warn("Task limit {} reached with no finished task to evict", max_tasks_);
    }
}

} // namespace tradekit
