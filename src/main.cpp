#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include "core/config.hpp"
#include "core/backtest_engine.hpp"
#include "core/report.hpp"
#include "core/strategy.hpp"
#ifdef TRADEKIT_WITH_DROGON
#include <drogon/drogon.h>
#include "core/task_manager.hpp"
#include "control/control_server.hpp"
#endif

namespace {

void setup_logging(const tradekit::LoggingConfig& cfg) {
    if (!cfg.file.empty()) {
        try {
            auto logger = spdlog::basic_logger_mt("tradekit", cfg.file);
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", cfg.file, e.what());
        }
    }
    spdlog::set_level(spdlog::level::from_str(cfg.level));
}

int run_batch(const tradekit::Config& cfg) {
    auto factory = tradekit::make_strategy_factory(cfg.strategy.name, cfg.strategy.params);
    tradekit::BacktestEngine engine(std::move(factory), cfg.backtest);
    auto report = engine.run();

    if (!cfg.output.report_file.empty()) {
        tradekit::save_report(report, cfg.output.report_file, cfg.output.indent);
    } else {
        std::cout << tradekit::report_to_json(report, cfg.backtest.include_details).dump(cfg.output.indent)
                  << std::endl;
    }
    return 0;
}

int run_serve(const tradekit::Config& cfg) {
#ifdef TRADEKIT_WITH_DROGON
    auto task_mgr = std::make_shared<tradekit::TaskManager>(cfg.services.max_tasks);
    auto api_ctrl = std::make_shared<tradekit::ControlServer>(task_mgr, cfg);
    drogon::app().addListener(cfg.services.bind_address, cfg.services.control_port);
    drogon::app().registerController(api_ctrl);
    spdlog::info("Control server listening on {}:{}", cfg.services.bind_address, cfg.services.control_port);
    drogon::app().run();
    return 0;
#else
    spdlog::error("Serve mode requested but this binary was built without the control server");
    return 1;
#endif
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    tradekit::Config cfg;
    try {
        tradekit::load_config(cfg, config_path);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    setup_logging(cfg.logging);

    spdlog::info("tradekit starting. mode={} strategy={} folder={} history_size={}",
                 cfg.mode, cfg.strategy.name, cfg.backtest.data_folder, cfg.backtest.history_size);

    try {
        if (cfg.mode == "serve") return run_serve(cfg);
        if (cfg.mode != "batch") {
            spdlog::error("Unknown mode '{}', expected batch or serve", cfg.mode);
            return 1;
        }
        return run_batch(cfg);
    } catch (const std::exception& e) {
        spdlog::error("Backtest failed: {}", e.what());
        return 1;
    }
}
