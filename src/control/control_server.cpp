#include "control_server.hpp"
#include "../core/report.hpp"
#include "../core/utils.hpp"
#include <spdlog/spdlog.h>
#include <drogon/drogon.h>

using json = nlohmann::json;

namespace tradekit {

ControlServer::ControlServer(std::shared_ptr<TaskManager> task_mgr, const Config& cfg)
    : task_mgr_(std::move(task_mgr))
    , cfg_(cfg) {}

drogon::HttpResponsePtr ControlServer::unauthorized() {
    return json_resp(json{{"error", "unauthorized"}}, 401);
}

drogon::HttpResponsePtr ControlServer::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

bool ControlServer::authorize(const drogon::HttpRequestPtr& req) {
    if (cfg_.auth.token.empty()) return true;
    auto auth = req->getHeader("authorization");
    std::string expected = "Bearer " + cfg_.auth.token;
    return auth == expected;
}

void ControlServer::runBacktest(const drogon::HttpRequestPtr& req,
                                std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    try {
        auto request = parse_task_request(std::string(req->getBody()), cfg_);
        auto task = task_mgr_->submit(std::move(request));
        callback(json_resp(json{
            {"status", status_to_string(TaskStatus::QUEUED)},
            {"task_id", task->id},
            {"message", "Strategy queued."}
        }, 202));
    } catch (const std::exception& e) {
        spdlog::warn("run rejected: {}", e.what());
        callback(json_resp(json{{"error", e.what()}}, 400));
    }
}

void ControlServer::listTasks(const drogon::HttpRequestPtr& req,
                              std::function<void (const drogon::HttpResponsePtr &)> &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    json arr = json::array();
    for (const auto& t : task_mgr_->list_tasks()) {
        std::lock_guard<std::mutex> lock(t->mutex);
        arr.push_back({
            {"task_id", t->id},
            {"status", status_to_string(t->status)},
            {"strategy", t->request.strategy.name},
            {"created_at", utils::ts_to_iso(t->created_at)}
        });
    }
    callback(json_resp(arr));
}

void ControlServer::getTask(const drogon::HttpRequestPtr& req,
                            std::function<void (const drogon::HttpResponsePtr &)> &&callback,
                            std::string task_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    auto task = task_mgr_->get_task(task_id);
    if (!task) { callback(json_resp(json{{"error", "task not found"}}, 404)); return; }

    std::shared_ptr<const BacktestReport> report;
    json out;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        out = json{
            {"task_id", task->id},
            {"status", status_to_string(task->status)},
            {"strategy", task->request.strategy.name},
            {"history_size", task->request.backtest.history_size},
            {"created_at", utils::ts_to_iso(task->created_at)},
            {"completed_at", task->completed_at ? utils::ts_to_iso(*task->completed_at) : ""}
        };
        if (!task->error.empty()) out["error"] = task->error;
        report = task->report;
    }
    if (report) out["report"] = report_to_json(*report, false);
    callback(json_resp(out));
}

void ControlServer::deleteTask(const drogon::HttpRequestPtr& req,
                               std::function<void (const drogon::HttpResponsePtr &)> &&callback,
                               std::string task_id) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    if (!task_mgr_->get_task(task_id)) {
        callback(json_resp(json{{"error", "task not found"}}, 404));
        return;
    }
    if (!task_mgr_->destroy_task(task_id)) {
        callback(json_resp(json{{"error", "task still running"}}, 409));
        return;
    }
    callback(json_resp(json{{"status", "deleted"}, {"task_id", task_id}}));
}

void ControlServer::chart(const drogon::HttpRequestPtr& req,
                          std::function<void (const drogon::HttpResponsePtr &)> &&callback,
                          std::string task_id,
                          std::string ticker) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    auto not_found = [&]() {
        callback(json_resp(json{{"error", "Chart data expired or not found"}}, 404));
    };
    auto task = task_mgr_->get_task(task_id);
    if (!task) { not_found(); return; }

    std::shared_ptr<const BacktestReport> report;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        report = task->report;
    }
    if (!report) { not_found(); return; }
    const TickerDetail* detail = report->find_detail(ticker);
    if (!detail) { not_found(); return; }
    callback(json_resp(detail_to_json(*detail, find_metric(*report, ticker))));
}

} // namespace tradekit
