/**
 * @file components.hpp
 * @brief Observers that react to import events
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator only publishes. Logging, statistics and metric
 * counting are attached from the outside by constructing a component on
 * the same bus.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ImportStatsComponent stats(bus);
 * // Run an import; both components react automatically
 */

#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"
#include "ingest/monitoring/alert_manager.hpp"
#include "ingest/monitoring/metric_names.hpp"
#include "ingest/monitoring/metrics_collector.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace ingest::events {

/**
 * @brief Logs every import event with spdlog
 *
 * Per-file progress is logged at debug; session transitions at info or
 * above.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        progress_id_ = bus_.subscribe<ImportProgressEvent>([](const ImportProgressEvent& e) {
            const auto& p = e.progress;
            spdlog::debug("[ImportProgress] session={} status={} step={}/{} percent={:.1f} files={}/{} file={}",
                          p.session_id, import::to_string(p.status), p.step, p.total_steps, p.percent,
                          p.files_processed, p.files_total, p.current_file);
        }, "logger");

        completed_id_ = bus_.subscribe<ImportCompletedEvent>([](const ImportCompletedEvent& e) {
            const auto& c = e.completion;
            spdlog::info("[ImportCompleted] session={} status={} imported={} duplicates={} errors={} duration={}ms",
                         c.session_id, import::to_string(c.status), c.total_imported,
                         c.total_duplicates, c.total_errors, c.total_duration_ms);
        }, "logger");

        paused_id_ = bus_.subscribe<ImportPausedEvent>([](const ImportPausedEvent& e) {
            spdlog::warn("[ImportPaused] session={} last_step={} reason={}", e.session_id, e.last_step, e.reason);
        }, "logger");

        copied_id_ = bus_.subscribe<FileCopiedEvent>([](const FileCopiedEvent& e) {
            if (e.success) {
                spdlog::debug("[FileCopied] session={} file={} bytes={} retries={}",
                              e.session_id, e.filename, e.bytes, e.retry_count);
            } else {
                spdlog::warn("[FileCopyFailed] session={} file={} retries={} error={}",
                             e.session_id, e.filename, e.retry_count, e.error);
            }
        }, "logger");

        validated_id_ = bus_.subscribe<FileValidatedEvent>([](const FileValidatedEvent& e) {
            if (e.valid) {
                spdlog::debug("[FileValidated] session={} file={}", e.session_id, e.filename);
            } else {
                spdlog::warn("[FileInvalid] session={} file={} error={}", e.session_id, e.filename, e.error);
            }
        }, "logger");

        rolled_back_id_ = bus_.subscribe<FileRolledBackEvent>([](const FileRolledBackEvent& e) {
            spdlog::warn("[FileRolledBack] session={} path={} reason={}", e.session_id, e.archive_path, e.reason);
        }, "logger");

        alert_id_ = bus_.subscribe<AlertRaisedEvent>([](const AlertRaisedEvent& e) {
            spdlog::warn("[Alert] {} ({}) {}", e.name, e.severity, e.message);
        }, "logger");
    }

    ~LoggerComponent() {
        bus_.unsubscribe<ImportProgressEvent>(progress_id_);
        bus_.unsubscribe<ImportCompletedEvent>(completed_id_);
        bus_.unsubscribe<ImportPausedEvent>(paused_id_);
        bus_.unsubscribe<FileCopiedEvent>(copied_id_);
        bus_.unsubscribe<FileValidatedEvent>(validated_id_);
        bus_.unsubscribe<FileRolledBackEvent>(rolled_back_id_);
        bus_.unsubscribe<AlertRaisedEvent>(alert_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    size_t progress_id_ = 0;
    size_t completed_id_ = 0;
    size_t paused_id_ = 0;
    size_t copied_id_ = 0;
    size_t validated_id_ = 0;
    size_t rolled_back_id_ = 0;
    size_t alert_id_ = 0;
};

/**
 * @brief Running totals across every session seen on the bus
 *
 * USAGE:
 * ImportStatsComponent stats(bus);
 * // Later...
 * stats.print_stats();
 */
class ImportStatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_copied{0};
        std::atomic<uint64_t> bytes_copied{0};
        std::atomic<uint64_t> copy_failures{0};
        std::atomic<uint64_t> copy_retries{0};
        std::atomic<uint64_t> files_valid{0};
        std::atomic<uint64_t> files_invalid{0};
        std::atomic<uint64_t> rollbacks{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_paused{0};
    };

    explicit ImportStatsComponent(EventBus& bus) : bus_(bus) {
        copied_id_ = bus_.subscribe<FileCopiedEvent>([this](const FileCopiedEvent& e) {
            stats_.copy_retries += e.retry_count;
            if (e.success) {
                stats_.files_copied++;
                stats_.bytes_copied += e.bytes;
            } else {
                stats_.copy_failures++;
            }
        }, "import-stats");

        validated_id_ = bus_.subscribe<FileValidatedEvent>([this](const FileValidatedEvent& e) {
            if (e.valid) {
                stats_.files_valid++;
            } else {
                stats_.files_invalid++;
            }
        }, "import-stats");

        rolled_back_id_ = bus_.subscribe<FileRolledBackEvent>([this](const FileRolledBackEvent&) {
            stats_.rollbacks++;
        }, "import-stats");

        completed_id_ = bus_.subscribe<ImportCompletedEvent>([this](const ImportCompletedEvent& e) {
            if (e.completion.status == import::ImportStatus::Completed) {
                stats_.sessions_completed++;
            }
        }, "import-stats");

        paused_id_ = bus_.subscribe<ImportPausedEvent>([this](const ImportPausedEvent&) {
            stats_.sessions_paused++;
        }, "import-stats");
    }

    ~ImportStatsComponent() {
        bus_.unsubscribe<FileCopiedEvent>(copied_id_);
        bus_.unsubscribe<FileValidatedEvent>(validated_id_);
        bus_.unsubscribe<FileRolledBackEvent>(rolled_back_id_);
        bus_.unsubscribe<ImportCompletedEvent>(completed_id_);
        bus_.unsubscribe<ImportPausedEvent>(paused_id_);
    }

    ImportStatsComponent(const ImportStatsComponent&) = delete;
    ImportStatsComponent& operator=(const ImportStatsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Import Statistics:");
        spdlog::info("  Files copied:    {}", stats_.files_copied.load());
        spdlog::info("  Bytes copied:    {}", stats_.bytes_copied.load());
        spdlog::info("  Copy failures:   {}", stats_.copy_failures.load());
        spdlog::info("  Copy retries:    {}", stats_.copy_retries.load());
        spdlog::info("  Files valid:     {}", stats_.files_valid.load());
        spdlog::info("  Files invalid:   {}", stats_.files_invalid.load());
        spdlog::info("  Rollbacks:       {}", stats_.rollbacks.load());
        spdlog::info("  Sessions done:   {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions paused: {}", stats_.sessions_paused.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
    size_t copied_id_ = 0;
    size_t validated_id_ = 0;
    size_t rolled_back_id_ = 0;
    size_t completed_id_ = 0;
    size_t paused_id_ = 0;
};

/**
 * @brief Republishes fired alerts as AlertRaisedEvent
 *
 * Lets bus observers (logger, CLI) see alerts without depending on the
 * AlertManager directly.
 */
class AlertRelayComponent {
public:
    AlertRelayComponent(EventBus& bus, monitoring::AlertManager& alerts) : alerts_(alerts) {
        subscription_ = alerts_.subscribe([&bus](const monitoring::Alert& alert) {
            bus.emit(AlertRaisedEvent{alert.id, alert.name, monitoring::to_string(alert.severity),
                                      alert.message, alert.timestamp});
        });
    }

    ~AlertRelayComponent() {
        alerts_.unsubscribe(subscription_);
    }

    AlertRelayComponent(const AlertRelayComponent&) = delete;
    AlertRelayComponent& operator=(const AlertRelayComponent&) = delete;

private:
    monitoring::AlertManager& alerts_;
    size_t subscription_ = 0;
};

/**
 * @brief Feeds per-file failures and the session error rate into a MetricsCollector
 */
class MetricsBridgeComponent {
public:
    MetricsBridgeComponent(EventBus& bus, monitoring::MetricsCollector& metrics)
        : bus_(bus), metrics_(metrics) {
        copied_id_ = bus_.subscribe<FileCopiedEvent>([this](const FileCopiedEvent& e) {
            if (!e.success) {
                metrics_.increment(monitoring::metric::kErrorsCount, 1.0, {{"component", "copy"}});
            }
        }, "metrics-bridge");

        validated_id_ = bus_.subscribe<FileValidatedEvent>([this](const FileValidatedEvent& e) {
            if (!e.valid && e.error != "Not copied") {
                metrics_.increment(monitoring::metric::kErrorsCount, 1.0, {{"component", "validation"}});
            }
        }, "metrics-bridge");

        progress_id_ = bus_.subscribe<ImportProgressEvent>([this](const ImportProgressEvent& e) {
            const auto& p = e.progress;
            if (p.files_total > 0) {
                metrics_.gauge(monitoring::metric::kImportErrorRate,
                               static_cast<double>(p.errors_found) / static_cast<double>(p.files_total));
            }
        }, "metrics-bridge");
    }

    ~MetricsBridgeComponent() {
        bus_.unsubscribe<FileCopiedEvent>(copied_id_);
        bus_.unsubscribe<FileValidatedEvent>(validated_id_);
        bus_.unsubscribe<ImportProgressEvent>(progress_id_);
    }

    MetricsBridgeComponent(const MetricsBridgeComponent&) = delete;
    MetricsBridgeComponent& operator=(const MetricsBridgeComponent&) = delete;

private:
    EventBus& bus_;
    monitoring::MetricsCollector& metrics_;
    size_t copied_id_ = 0;
    size_t validated_id_ = 0;
    size_t progress_id_ = 0;
};

} // namespace ingest::events
