#pragma once

#include <memory>
#include <string>
#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../core/task_manager.hpp"

namespace tradekit {

class ControlServer : public drogon::HttpController<ControlServer> {
public:
    static const bool isAutoCreation = false;
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ControlServer::runBacktest, "/run", drogon::Post);
    ADD_METHOD_TO(ControlServer::listTasks, "/tasks", drogon::Get);
    ADD_METHOD_TO(ControlServer::getTask, "/tasks/{1}", drogon::Get);
    ADD_METHOD_TO(ControlServer::deleteTask, "/tasks/{1}", drogon::Delete);
    ADD_METHOD_TO(ControlServer::chart, "/chart/{1}/{2}", drogon::Get);
    METHOD_LIST_END

    ControlServer(std::shared_ptr<TaskManager> task_mgr, const Config& cfg);

    void runBacktest(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void listTasks(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback);
    void getTask(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback, std::string task_id);
    void deleteTask(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback, std::string task_id);
    void chart(const drogon::HttpRequestPtr& req, std::function<void (const drogon::HttpResponsePtr &)> &&callback, std::string task_id, std::string ticker);

private:
    drogon::HttpResponsePtr unauthorized();
    drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);
    bool authorize(const drogon::HttpRequestPtr& req);

    std::shared_ptr<TaskManager> task_mgr_;
    Config cfg_;
};

} // namespace tradekit
