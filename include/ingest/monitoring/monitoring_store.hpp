#pragma once

#include "ingest/monitoring/alert_manager.hpp"
#include "ingest/monitoring/metrics_collector.hpp"
#include "ingest/monitoring/tracer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ingest::monitoring {

struct RetentionPolicy {
    std::chrono::hours metrics{7 * 24};
    std::chrono::hours traces{3 * 24};
    std::chrono::hours alerts{30 * 24};
};

struct CleanupReport {
    std::size_t metrics_deleted = 0;
    std::size_t traces_deleted = 0;
    std::size_t alerts_deleted = 0;
};

/**
 * @brief Durable home for flushed metrics, finished spans and fired alerts
 *
 * Retention is enforced by cleanup(), which deletes rows older than the
 * policy windows. Call it directly or let start_cleanup() run it on a
 * background thread.
 */
class MonitoringStore {
public:
    explicit MonitoringStore(RetentionPolicy policy = {}) : policy_(policy) {}
    virtual ~MonitoringStore();

    MonitoringStore(const MonitoringStore&) = delete;
    MonitoringStore& operator=(const MonitoringStore&) = delete;

    virtual void save_metrics(const std::vector<Metric>& metrics) = 0;
    virtual void save_span(const Span& span) = 0;
    virtual void save_alert(const Alert& alert) = 0;

    virtual CleanupReport cleanup(std::chrono::system_clock::time_point now) = 0;

    const RetentionPolicy& policy() const noexcept { return policy_; }

    void start_cleanup(std::chrono::milliseconds interval);

    /// Implementations must call this from their destructor before releasing storage.
    void stop_cleanup();

    /**
     * @brief Routes flushed metrics, persisted spans and alerts into this store
     *
     * The collector's flush thread is started with this store as its sink.
     */
    void attach(MetricsCollector& metrics, Tracer& tracer, AlertManager& alerts);

private:
    RetentionPolicy policy_;

    std::atomic<bool> running_{false};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
    std::thread cleanup_thread_;
};

class InMemoryMonitoringStore : public MonitoringStore {
public:
    explicit InMemoryMonitoringStore(RetentionPolicy policy = {}) : MonitoringStore(policy) {}
    ~InMemoryMonitoringStore() override;

    void save_metrics(const std::vector<Metric>& metrics) override;
    void save_span(const Span& span) override;
    void save_alert(const Alert& alert) override;

    CleanupReport cleanup(std::chrono::system_clock::time_point now) override;

    std::vector<Metric> metrics() const;
    std::vector<Span> spans() const;
    std::vector<Alert> alerts() const;

private:
    mutable std::mutex mutex_;
    std::vector<Metric> metrics_;
    std::vector<Span> spans_;
    std::vector<Alert> alerts_;
};

/**
 * @brief Monitoring rows kept as JSON lines under one directory
 *
 * LAYOUT:
 *   <dir>/metrics.jsonl   one flushed observation per line
 *   <dir>/traces.jsonl    one finished span per line
 *   <dir>/alerts.jsonl    one fired alert per line
 *
 * Saves append. cleanup() rewrites each file without the expired rows
 * through a temp file and rename, so a crash leaves either the old or the
 * new table. Lines that no longer parse are dropped by cleanup(), which
 * throws std::runtime_error when a table cannot be rewritten.
 */
class JsonMonitoringStore : public MonitoringStore {
public:
    explicit JsonMonitoringStore(std::filesystem::path dir, RetentionPolicy policy = {});
    ~JsonMonitoringStore() override;

    void save_metrics(const std::vector<Metric>& metrics) override;
    void save_span(const Span& span) override;
    void save_alert(const Alert& alert) override;

    CleanupReport cleanup(std::chrono::system_clock::time_point now) override;

    const std::filesystem::path& dir() const noexcept { return dir_; }
    std::filesystem::path metrics_path() const { return dir_ / "metrics.jsonl"; }
    std::filesystem::path traces_path() const { return dir_ / "traces.jsonl"; }
    std::filesystem::path alerts_path() const { return dir_ / "alerts.jsonl"; }

private:
    void append(const std::filesystem::path& path, const std::vector<std::string>& lines);
    std::size_t prune(const std::filesystem::path& path, const char* time_key,
                      std::chrono::system_clock::time_point cutoff);

    std::filesystem::path dir_;
    std::mutex mutex_;
};

} // namespace ingest::monitoring
