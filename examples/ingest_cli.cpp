/**
 * @file ingest_cli.cpp
 * @brief Command-line front end: imports a batch, resumes or lists paused ones
 *
 * USAGE:
 *   ingest_cli [--config file] --archive <dir> <source>...
 *   ingest_cli [--config file] --resume <session-id>
 *   ingest_cli [--config file] --list
 *
 * Exit codes: 0 completed, 1 failed or cancelled, 2 paused (resumable).
 */

#include "ingest/config/config.hpp"
#include "ingest/events/components.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/import/catalog.hpp"
#include "ingest/import/file_operations.hpp"
#include "ingest/import/orchestrator.hpp"
#include "ingest/import/serialization.hpp"
#include "ingest/import/session_store.hpp"
#include "ingest/monitoring/alert_manager.hpp"
#include "ingest/monitoring/metrics_collector.hpp"
#include "ingest/monitoring/monitoring_store.hpp"
#include "ingest/monitoring/tracer.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace ingest;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [--config file] --archive <dir> <source>...\n"
              << "  " << program << " [--config file] --resume <session-id>\n"
              << "  " << program << " [--config file] --list\n";
}

int exit_code(import::ImportStatus status) {
    switch (status) {
        case import::ImportStatus::Completed: return 0;
        case import::ImportStatus::Paused: return 2;
        default: return 1;
    }
}

void print_result(const import::ImportResult& result) {
    const auto& c = result.completion;
    spdlog::info("Session:    {}", result.session_id);
    spdlog::info("Status:     {}", import::to_string(result.status));
    spdlog::info("Imported:   {}", c.total_imported);
    spdlog::info("Duplicates: {}", c.total_duplicates);
    spdlog::info("Errors:     {}", c.total_errors);
    spdlog::info("Duration:   {}ms", result.total_duration_ms);
    if (!result.error.empty()) {
        spdlog::info("Error:      {}", result.error);
    }
    if (result.status == import::ImportStatus::Paused) {
        spdlog::info("Resume with: --resume {}", result.session_id);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    std::string archive_root;
    std::string resume_id;
    bool list_only = false;
    std::vector<std::string> sources;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-a" || arg == "--archive") && i + 1 < argc) {
            archive_root = argv[++i];
        } else if ((arg == "-r" || arg == "--resume") && i + 1 < argc) {
            resume_id = argv[++i];
        } else if (arg == "-l" || arg == "--list") {
            list_only = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        } else {
            sources.push_back(arg);
        }
    }

    config::IngestConfig cfg;
    if (!config_path.empty()) {
        auto loaded = config::load_config(config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config: {}", loaded.error());
            return 1;
        }
        cfg = loaded.take();
    }
    if (!archive_root.empty()) {
        cfg.archive_root = archive_root;
    }

    auto level = config::parse_log_level(cfg.log_level);
    if (level.is_error()) {
        spdlog::error("{}", level.error());
        return 1;
    }
    spdlog::set_level(level.value());

    import::JsonSessionStore sessions(cfg.state_dir);

    if (list_only) {
        auto resumable = sessions.list_resumable();
        for (const auto& info : resumable) {
            std::cout << import::session_to_json(info).dump(2) << "\n";
        }
        spdlog::info("{} resumable session(s) in {}", resumable.size(), cfg.state_dir);
        return 0;
    }

    if (resume_id.empty() && (sources.empty() || cfg.archive_root.empty())) {
        print_usage(argv[0]);
        return 1;
    }

    // The store must outlive the collectors that flush into it.
    monitoring::JsonMonitoringStore monitoring_store(std::filesystem::path(cfg.state_dir) / "monitoring",
                                                     config::retention_policy(cfg));
    monitoring::MetricsCollector metrics(config::metrics_options(cfg));
    monitoring::Tracer tracer(config::tracer_options(cfg));
    monitoring::AlertManager alerts(config::alert_options(cfg));
    monitoring_store.attach(metrics, tracer, alerts);
    monitoring_store.start_cleanup(std::chrono::hours(1));
    alerts.start(std::chrono::milliseconds(cfg.alert_check_interval_ms), {}, &metrics);

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::ImportStatsComponent stats(bus);
    events::AlertRelayComponent relay(bus, alerts);
    events::MetricsBridgeComponent bridge(bus, metrics);

    import::InMemoryCatalog catalog;
    import::LocalFileOperations ops;
    import::Orchestrator orchestrator(config::orchestrator_config(cfg), ops, sessions, catalog, &catalog,
                                      bus, monitoring::Instruments{&metrics, &tracer});

    import::ImportOptions options;
    options.source_paths = sources;
    options.archive_root = cfg.archive_root;
    int last_step = -1;
    options.on_progress = [&last_step](const import::ImportProgress& p) {
        if (p.step != last_step) {
            last_step = p.step;
            spdlog::info("[{}/{}] {} ({:.0f}%)", p.step, p.total_steps, import::to_string(p.status), p.percent);
        }
    };

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::string session_id;
    if (resume_id.empty()) {
        session_id = orchestrator.start_import(options);
        spdlog::info("Started session {} ({} source(s) -> {})", session_id, sources.size(), cfg.archive_root);
    } else {
        auto started = orchestrator.resume_import(resume_id, options);
        if (started.is_error()) {
            spdlog::error("Cannot resume {}: {}", resume_id, started.error());
            return 1;
        }
        session_id = started.value();
        spdlog::info("Resuming session {}", session_id);
    }

    std::thread watcher([&options, &orchestrator, &session_id]() {
        while (true) {
            auto status = orchestrator.status(session_id);
            if (!status || import::ImportSession::is_terminal(*status) || *status == import::ImportStatus::Paused) {
                return;
            }
            if (g_interrupted.load()) {
                spdlog::warn("Interrupted, cancelling session {}", session_id);
                options.abort.abort();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto result = orchestrator.wait(session_id);
    watcher.join();

    alerts.stop();
    monitoring_store.stop_cleanup();

    if (result.is_error()) {
        spdlog::error("Import failed: {}", result.error());
        return 1;
    }

    print_result(result.value());
    stats.print_stats();
    return exit_code(result.value().status);
}
