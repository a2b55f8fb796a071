#pragma once

#include "ingest/monitoring/metrics_collector.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ingest::monitoring {

enum class AlertSeverity {
    Info,
    Warning,
    Critical
};

const char* to_string(AlertSeverity severity) noexcept;

/**
 * @brief Snapshot of system health evaluated by the alert rules
 */
struct AlertMetrics {
    double disk_space_percent = 100.0;
    double disk_space_free_gb = 0.0;

    double jobs_pending = 0.0;
    double jobs_processing = 0.0;
    double jobs_failed = 0.0;
    double jobs_dead = 0.0;
    double oldest_job_age_minutes = 0.0;

    double active_imports = 0.0;
    double import_error_rate = 0.0;

    double workers_active = 0.0;
    double workers_idle = 0.0;

    double errors_last_hour = 0.0;
    double error_rate_per_minute = 0.0;
};

void to_json(nlohmann::json& j, const AlertMetrics& metrics);

struct Alert {
    std::string id;
    std::string name;
    AlertSeverity severity = AlertSeverity::Info;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json context = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const Alert& alert);

struct AlertRule {
    std::string id;
    std::string name;
    std::string description;
    AlertSeverity severity = AlertSeverity::Warning;
    std::function<bool(const AlertMetrics&)> condition;
    std::function<std::string(const AlertMetrics&)> message;
    std::chrono::milliseconds cooldown{0};
    bool enabled = true;
};

struct AlertManagerOptions {
    std::size_t max_history = 100;
};

/**
 * @brief Evaluates threshold rules and records the alerts they fire
 *
 * A rule fires when it is enabled, its condition holds, and its cooldown
 * has elapsed since it last fired. Firing restarts the cooldown. A rule
 * whose condition or message throws is logged and skipped.
 */
class AlertManager {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using Subscriber = std::function<void(const Alert&)>;
    using MetricsProvider = std::function<AlertMetrics()>;

    explicit AlertManager(AlertManagerOptions options = {}, Clock clock = {});
    ~AlertManager();

    AlertManager(const AlertManager&) = delete;
    AlertManager& operator=(const AlertManager&) = delete;

    /// Adds a rule, replacing any rule with the same id.
    void add_rule(AlertRule rule);
    void remove_rule(const std::string& rule_id);
    void set_rule_enabled(const std::string& rule_id, bool enabled);
    std::vector<AlertRule> rules() const;

    std::vector<Alert> check_alerts(const AlertMetrics& metrics);

    /// Newest first; limit 0 returns everything retained.
    std::vector<Alert> history(std::size_t limit = 0) const;
    void clear_history();

    Alert trigger_manual_alert(const std::string& name,
                               const std::string& message,
                               AlertSeverity severity = AlertSeverity::Info,
                               nlohmann::json context = nlohmann::json::object());

    size_t subscribe(Subscriber subscriber);
    void unsubscribe(size_t id);

    /**
     * @brief Evaluates rules every interval on a background thread
     *
     * Without a provider the snapshot comes from metrics_from_collector()
     * on the collector given here, or a default snapshot when none.
     */
    void start(std::chrono::milliseconds interval,
               MetricsProvider provider = {},
               const MetricsCollector* collector = nullptr);
    void stop();

    static std::vector<AlertRule> default_rules();

    /// Builds a snapshot from the standard gauges and counters. Errors are
    /// summed across every tag set over the last hour.
    static AlertMetrics metrics_from_collector(const MetricsCollector& collector);

private:
    void record(const Alert& alert);
    void check_loop(std::chrono::milliseconds interval, MetricsProvider provider);

    AlertManagerOptions options_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::vector<AlertRule> rules_;
    std::unordered_map<std::string, std::chrono::system_clock::time_point> last_fired_;
    std::deque<Alert> history_;

    std::mutex subscribers_mutex_;
    std::vector<std::pair<size_t, Subscriber>> subscribers_;
    size_t next_subscriber_id_ = 0;

    std::atomic<bool> running_{false};
    std::mutex check_mutex_;
    std::condition_variable check_cv_;
    std::thread check_thread_;
};

} // namespace ingest::monitoring
