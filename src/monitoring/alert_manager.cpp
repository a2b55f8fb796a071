#include "ingest/monitoring/alert_manager.hpp"

#include "ingest/monitoring/metric_names.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace ingest::monitoring {

using namespace std::chrono_literals;

const char* to_string(AlertSeverity severity) noexcept {
    switch (severity) {
        case AlertSeverity::Info: return "info";
        case AlertSeverity::Warning: return "warning";
        case AlertSeverity::Critical: return "critical";
    }
    return "info";
}

void to_json(nlohmann::json& j, const AlertMetrics& m) {
    j = nlohmann::json{
        {"disk_space_percent", m.disk_space_percent},
        {"disk_space_free_gb", m.disk_space_free_gb},
        {"jobs_pending", m.jobs_pending},
        {"jobs_processing", m.jobs_processing},
        {"jobs_failed", m.jobs_failed},
        {"jobs_dead", m.jobs_dead},
        {"oldest_job_age_minutes", m.oldest_job_age_minutes},
        {"active_imports", m.active_imports},
        {"import_error_rate", m.import_error_rate},
        {"workers_active", m.workers_active},
        {"workers_idle", m.workers_idle},
        {"errors_last_hour", m.errors_last_hour},
        {"error_rate_per_minute", m.error_rate_per_minute}
    };
}

void to_json(nlohmann::json& j, const Alert& alert) {
    j = nlohmann::json{
        {"id", alert.id},
        {"name", alert.name},
        {"severity", to_string(alert.severity)},
        {"message", alert.message},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
            alert.timestamp.time_since_epoch()).count()},
        {"context", alert.context}
    };
}

AlertManager::AlertManager(AlertManagerOptions options, Clock clock)
    : options_(options),
      clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })),
      rules_(default_rules()) {}

AlertManager::~AlertManager() {
    stop();
}

std::vector<AlertRule> AlertManager::default_rules() {
    std::vector<AlertRule> rules;

    rules.push_back({
        "disk_space_critical", "Critical Disk Space", "Disk space below 5%",
        AlertSeverity::Critical,
        [](const AlertMetrics& m) { return m.disk_space_percent < 5; },
        [](const AlertMetrics& m) {
            return fmt::format("Critical: Only {:.1f}GB free ({:.1f}%)", m.disk_space_free_gb, m.disk_space_percent);
        },
        5min, true});

    rules.push_back({
        "disk_space_low", "Low Disk Space", "Disk space below 15%",
        AlertSeverity::Warning,
        [](const AlertMetrics& m) { return m.disk_space_percent >= 5 && m.disk_space_percent < 15; },
        [](const AlertMetrics& m) {
            return fmt::format("Warning: Disk space at {:.1f}% ({:.1f}GB free)", m.disk_space_percent, m.disk_space_free_gb);
        },
        15min, true});

    rules.push_back({
        "job_queue_stuck", "Job Queue Stuck", "Oldest job is older than 60 minutes",
        AlertSeverity::Warning,
        [](const AlertMetrics& m) { return m.oldest_job_age_minutes > 60; },
        [](const AlertMetrics& m) {
            return fmt::format("Job stuck in queue for {:.0f} minutes", m.oldest_job_age_minutes);
        },
        10min, true});

    rules.push_back({
        "high_error_rate", "High Error Rate", "More than 10 errors in the last hour",
        AlertSeverity::Warning,
        [](const AlertMetrics& m) { return m.errors_last_hour > 10; },
        [](const AlertMetrics& m) {
            return fmt::format("High error rate: {:.0f} errors in the last hour", m.errors_last_hour);
        },
        10min, true});

    rules.push_back({
        "dead_letter_queue_growing", "Dead Letter Queue Growing", "More than 5 jobs in dead letter queue",
        AlertSeverity::Warning,
        [](const AlertMetrics& m) { return m.jobs_dead > 5; },
        [](const AlertMetrics& m) {
            return fmt::format("{:.0f} jobs have permanently failed and need attention", m.jobs_dead);
        },
        30min, true});

    rules.push_back({
        "no_workers_available", "No Workers Available", "All workers are busy with pending jobs",
        AlertSeverity::Warning,
        [](const AlertMetrics& m) { return m.workers_idle == 0 && m.jobs_pending > 10; },
        [](const AlertMetrics& m) {
            return fmt::format("All workers busy with {:.0f} jobs pending", m.jobs_pending);
        },
        5min, true});

    return rules;
}

AlertMetrics AlertManager::metrics_from_collector(const MetricsCollector& collector) {
    AlertMetrics m;
    m.disk_space_percent = collector.get_gauge(metric::kSystemDiskPercent).value_or(100.0);
    m.disk_space_free_gb = collector.get_gauge(metric::kSystemDiskFree).value_or(0.0);
    m.jobs_pending = collector.get_gauge(metric::kJobsQueueDepth).value_or(0.0);
    m.jobs_processing = collector.get_gauge(metric::kJobsProcessing).value_or(0.0);
    m.jobs_failed = collector.get_counter(metric::kJobsFailed);
    m.jobs_dead = collector.get_counter(metric::kJobsDead);
    m.oldest_job_age_minutes = collector.get_gauge(metric::kJobsQueueOldest).value_or(0.0);
    m.active_imports = collector.get_gauge(metric::kImportActive).value_or(0.0);
    m.import_error_rate = collector.get_gauge(metric::kImportErrorRate).value_or(0.0);
    m.workers_active = collector.get_gauge(metric::kWorkersActive).value_or(0.0);
    m.workers_idle = collector.get_gauge(metric::kWorkersIdle).value_or(0.0);
    m.errors_last_hour = collector.sum_counter_since(metric::kErrorsCount,
                                                     std::chrono::system_clock::now() - std::chrono::hours{1});
    m.error_rate_per_minute = collector.get_gauge(metric::kErrorsRatePerMinute).value_or(0.0);
    return m;
}

void AlertManager::add_rule(AlertRule rule) {
    std::lock_guard lock(mutex_);
    rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                [&rule](const AlertRule& r) { return r.id == rule.id; }),
                 rules_.end());
    rules_.push_back(std::move(rule));
}

void AlertManager::remove_rule(const std::string& rule_id) {
    std::lock_guard lock(mutex_);
    rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                [&rule_id](const AlertRule& r) { return r.id == rule_id; }),
                 rules_.end());
}

void AlertManager::set_rule_enabled(const std::string& rule_id, bool enabled) {
    std::lock_guard lock(mutex_);
    for (auto& rule : rules_) {
        if (rule.id == rule_id) {
            rule.enabled = enabled;
        }
    }
}

std::vector<AlertRule> AlertManager::rules() const {
    std::lock_guard lock(mutex_);
    return rules_;
}

std::vector<Alert> AlertManager::check_alerts(const AlertMetrics& metrics) {
    std::vector<Alert> triggered;
    {
        std::lock_guard lock(mutex_);
        for (const auto& rule : rules_) {
            if (!rule.enabled || !rule.condition) {
                continue;
            }

            try {
                if (!rule.condition(metrics)) {
                    continue;
                }

                const auto now = clock_();
                auto last = last_fired_.find(rule.id);
                if (last != last_fired_.end() && now - last->second < rule.cooldown) {
                    continue;
                }

                Alert alert;
                alert.id = rule.id;
                alert.name = rule.name;
                alert.severity = rule.severity;
                alert.message = rule.message ? rule.message(metrics) : rule.description;
                alert.timestamp = now;
                alert.context = nlohmann::json{{"metrics", metrics}};

                last_fired_[rule.id] = now;
                spdlog::warn("[AlertManager] Alert triggered: {} ({}) {}",
                             rule.name, to_string(rule.severity), alert.message);
                triggered.push_back(std::move(alert));
            } catch (const std::exception& e) {
                spdlog::error("[AlertManager] Error evaluating rule {}: {}", rule.id, e.what());
            } catch (...) {
                spdlog::error("[AlertManager] Error evaluating rule {}: unknown exception", rule.id);
            }
        }
    }

    for (const auto& alert : triggered) {
        record(alert);
    }
    return triggered;
}

std::vector<Alert> AlertManager::history(std::size_t limit) const {
    std::lock_guard lock(mutex_);
    std::vector<Alert> result(history_.rbegin(), history_.rend());
    if (limit > 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

void AlertManager::clear_history() {
    std::lock_guard lock(mutex_);
    history_.clear();
}

Alert AlertManager::trigger_manual_alert(const std::string& name,
                                         const std::string& message,
                                         AlertSeverity severity,
                                         nlohmann::json context) {
    Alert alert;
    alert.timestamp = clock_();
    alert.id = "manual_" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        alert.timestamp.time_since_epoch()).count());
    alert.name = name;
    alert.severity = severity;
    alert.message = message;
    alert.context = std::move(context);

    record(alert);
    return alert;
}

size_t AlertManager::subscribe(Subscriber subscriber) {
    std::lock_guard lock(subscribers_mutex_);
    size_t id = next_subscriber_id_++;
    subscribers_.emplace_back(id, std::move(subscriber));
    return id;
}

void AlertManager::unsubscribe(size_t id) {
    std::lock_guard lock(subscribers_mutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
            [id](const auto& entry) { return entry.first == id; }),
        subscribers_.end());
}

void AlertManager::start(std::chrono::milliseconds interval,
                         MetricsProvider provider,
                         const MetricsCollector* collector) {
    if (running_.exchange(true)) {
        return;
    }

    if (!provider) {
        provider = [collector]() {
            return collector != nullptr ? metrics_from_collector(*collector) : AlertMetrics{};
        };
    }

    check_thread_ = std::thread([this, interval, provider = std::move(provider)]() {
        check_loop(interval, provider);
    });
    spdlog::info("[AlertManager] Started alert monitoring every {}ms", interval.count());
}

void AlertManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    check_cv_.notify_all();
    if (check_thread_.joinable()) {
        check_thread_.join();
    }
}

void AlertManager::record(const Alert& alert) {
    {
        std::lock_guard lock(mutex_);
        history_.push_back(alert);
        while (history_.size() > options_.max_history) {
            history_.pop_front();
        }
    }

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard lock(subscribers_mutex_);
        for (const auto& [id, subscriber] : subscribers_) {
            subscribers.push_back(subscriber);
        }
    }
    for (const auto& subscriber : subscribers) {
        try {
            subscriber(alert);
        } catch (const std::exception& e) {
            spdlog::warn("[AlertManager] Subscriber threw on {}: {}", alert.id, e.what());
        } catch (...) {
            spdlog::warn("[AlertManager] Subscriber threw a non-standard exception on {}", alert.id);
        }
    }
}

void AlertManager::check_loop(std::chrono::milliseconds interval, MetricsProvider provider) {
    std::unique_lock lock(check_mutex_);
    while (running_.load()) {
        check_cv_.wait_for(lock, interval, [this]() { return !running_.load(); });
        if (!running_.load()) {
            break;
        }

        try {
            check_alerts(provider());
        } catch (const std::exception& e) {
            spdlog::error("[AlertManager] Failed to check alerts: {}", e.what());
        } catch (...) {
            spdlog::error("[AlertManager] Failed to check alerts: unknown exception");
        }
    }
}

} // namespace ingest::monitoring
