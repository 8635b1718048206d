#pragma once

#include <string>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tradekit {

using json = nlohmann::json;

struct BacktestConfig {
    std::string data_folder{"historical_data"};
    std::string file_suffix{"_meso.csv"};   // files are "<TICKER><suffix>"
    size_t history_size{30};                // bars handed to the strategy
    double risk_free_rate_annual{0.0};
    int worker_threads{1};                  // >1 simulates tickers in parallel
    bool include_details{true};             // keep per-bar series in the report
};

struct StrategyConfig {
    std::string name{"ma_crossover"};
    json params = json::object();
};

struct OutputConfig {
    std::string report_file{};  // empty = print to stdout
    int indent{2};
};

struct ServiceConfig {
    uint16_t control_port{5000};
    std::string bind_address{"127.0.0.1"};
    size_t max_tasks{64};       // finished tasks kept for /chart lookups
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};
};

struct AuthConfig {
    std::string token{};
};

struct Config {
    std::string mode{"batch"};  // "batch" or "serve"
    BacktestConfig backtest;
    StrategyConfig strategy;
    OutputConfig output;
    ServiceConfig services;
    LoggingConfig logging;
    AuthConfig auth;
};

inline void apply_backtest_overrides(BacktestConfig& b, const json& j) {
    b.data_folder = j.value("data_folder", b.data_folder);
    b.file_suffix = j.value("file_suffix", b.file_suffix);
    long long history_size = j.value("history_size", static_cast<long long>(b.history_size));
    if (history_size < 0) {
        throw std::invalid_argument("history_size must not be negative");
    }
    b.history_size = static_cast<size_t>(history_size);
    b.risk_free_rate_annual = j.value("risk_free_rate_annual", b.risk_free_rate_annual);
    b.worker_threads = j.value("worker_threads", b.worker_threads);
    b.include_details = j.value("include_details", b.include_details);
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    try {
        json j = json::parse(f, nullptr, true, true);
        cfg.mode = j.value("mode", cfg.mode);
        if (j.contains("backtest")) {
            apply_backtest_overrides(cfg.backtest, j["backtest"]);
        }
        if (j.contains("strategy")) {
            auto& s = j["strategy"];
            cfg.strategy.name = s.value("name", cfg.strategy.name);
            if (s.contains("params")) cfg.strategy.params = s["params"];
        }
        if (j.contains("output")) {
            auto& o = j["output"];
            cfg.output.report_file = o.value("report_file", cfg.output.report_file);
            cfg.output.indent = o.value("indent", cfg.output.indent);
        }
        if (j.contains("services")) {
            auto& svc = j["services"];
            cfg.services.control_port = svc.value("control_port", cfg.services.control_port);
            cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
            cfg.services.max_tasks = svc.value("max_tasks", cfg.services.max_tasks);
        }
        if (j.contains("logging")) {
            auto& l = j["logging"];
            cfg.logging.level = l.value("level", cfg.logging.level);
            cfg.logging.file = l.value("file", cfg.logging.file);
        }
        if (j.contains("auth")) {
            auto& a = j["auth"];
            cfg.auth.token = a.value("token", cfg.auth.token);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid config " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("invalid config " + path + ": " + e.what());
    }
}

} // namespace tradekit
