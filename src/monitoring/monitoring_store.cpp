#include "ingest/monitoring/monitoring_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace ingest::monitoring {

MonitoringStore::~MonitoringStore() {
    stop_cleanup();
}

void MonitoringStore::start_cleanup(std::chrono::milliseconds interval) {
    if (running_.exchange(true)) {
        return;
    }

    cleanup_thread_ = std::thread([this, interval]() {
        std::unique_lock lock(cleanup_mutex_);
        while (running_.load()) {
            cleanup_cv_.wait_for(lock, interval, [this]() { return !running_.load(); });
            if (!running_.load()) {
                break;
            }
            try {
                auto report = cleanup(std::chrono::system_clock::now());
                spdlog::info("[MonitoringStore] Cleanup removed {} metrics, {} traces, {} alerts",
                             report.metrics_deleted, report.traces_deleted, report.alerts_deleted);
            } catch (const std::exception& e) {
                spdlog::error("[MonitoringStore] Cleanup failed: {}", e.what());
            } catch (...) {
                spdlog::error("[MonitoringStore] Cleanup failed: unknown exception");
            }
        }
    });
}

void MonitoringStore::stop_cleanup() {
    if (!running_.exchange(false)) {
        return;
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

void MonitoringStore::attach(MetricsCollector& metrics, Tracer& tracer, AlertManager& alerts) {
    metrics.start([this](const std::vector<Metric>& batch) { save_metrics(batch); });
    tracer.set_persist_callback([this](const Span& span) { save_span(span); });
    alerts.subscribe([this](const Alert& alert) { save_alert(alert); });
}

// ════════════════════════════════════════════════════════
// InMemoryMonitoringStore
// ════════════════════════════════════════════════════════

InMemoryMonitoringStore::~InMemoryMonitoringStore() {
    stop_cleanup();
}

void InMemoryMonitoringStore::save_metrics(const std::vector<Metric>& metrics) {
    std::lock_guard lock(mutex_);
    metrics_.insert(metrics_.end(), metrics.begin(), metrics.end());
}

void InMemoryMonitoringStore::save_span(const Span& span) {
    std::lock_guard lock(mutex_);
    spans_.push_back(span);
}

void InMemoryMonitoringStore::save_alert(const Alert& alert) {
    std::lock_guard lock(mutex_);
    alerts_.push_back(alert);
}

CleanupReport InMemoryMonitoringStore::cleanup(std::chrono::system_clock::time_point now) {
    const auto metrics_cutoff = now - policy().metrics;
    const auto traces_cutoff = now - policy().traces;
    const auto alerts_cutoff = now - policy().alerts;

    CleanupReport report;
    std::lock_guard lock(mutex_);

    const auto metrics_before = metrics_.size();
    metrics_.erase(std::remove_if(metrics_.begin(), metrics_.end(),
                                  [&](const Metric& m) { return m.timestamp < metrics_cutoff; }),
                   metrics_.end());
    report.metrics_deleted = metrics_before - metrics_.size();

    const auto spans_before = spans_.size();
    spans_.erase(std::remove_if(spans_.begin(), spans_.end(),
                                [&](const Span& s) { return s.start_time < traces_cutoff; }),
                 spans_.end());
    report.traces_deleted = spans_before - spans_.size();

    const auto alerts_before = alerts_.size();
    alerts_.erase(std::remove_if(alerts_.begin(), alerts_.end(),
                                 [&](const Alert& a) { return a.timestamp < alerts_cutoff; }),
                  alerts_.end());
    report.alerts_deleted = alerts_before - alerts_.size();

    return report;
}

std::vector<Metric> InMemoryMonitoringStore::metrics() const {
    std::lock_guard lock(mutex_);
    return metrics_;
}

std::vector<Span> InMemoryMonitoringStore::spans() const {
    std::lock_guard lock(mutex_);
    return spans_;
}

std::vector<Alert> InMemoryMonitoringStore::alerts() const {
    std::lock_guard lock(mutex_);
    return alerts_;
}

// ════════════════════════════════════════════════════════
// JsonMonitoringStore
// ════════════════════════════════════════════════════════

namespace {

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json metric_row(const Metric& metric) {
    return nlohmann::json{
        {"name", metric.name},
        {"value", metric.value},
        {"timestamp", to_epoch_ms(metric.timestamp)},
        {"tags", metric.tags},
        {"type", to_string(metric.type)}
    };
}

} // namespace

JsonMonitoringStore::JsonMonitoringStore(std::filesystem::path dir, RetentionPolicy policy)
    : MonitoringStore(policy), dir_(std::move(dir)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        spdlog::error("[MonitoringStore] Cannot create {}: {}", dir_.string(), ec.message());
    }
}

JsonMonitoringStore::~JsonMonitoringStore() {
    stop_cleanup();
}

void JsonMonitoringStore::save_metrics(const std::vector<Metric>& metrics) {
    std::vector<std::string> lines;
    lines.reserve(metrics.size());
    for (const auto& metric : metrics) {
        lines.push_back(metric_row(metric).dump());
    }
    append(metrics_path(), lines);
}

void JsonMonitoringStore::save_span(const Span& span) {
    append(traces_path(), {nlohmann::json(span).dump()});
}

void JsonMonitoringStore::save_alert(const Alert& alert) {
    append(alerts_path(), {nlohmann::json(alert).dump()});
}

void JsonMonitoringStore::append(const std::filesystem::path& path, const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return;
    }

    std::lock_guard lock(mutex_);
    std::ofstream output(path, std::ios::binary | std::ios::app);
    if (!output) {
        spdlog::error("[MonitoringStore] Cannot open {}; dropped {} rows", path.string(), lines.size());
        return;
    }
    for (const auto& line : lines) {
        output << line << '\n';
    }
    if (!output) {
        spdlog::error("[MonitoringStore] Write to {} failed", path.string());
    }
}

CleanupReport JsonMonitoringStore::cleanup(std::chrono::system_clock::time_point now) {
    CleanupReport report;
    std::lock_guard lock(mutex_);
    report.metrics_deleted = prune(metrics_path(), "timestamp", now - policy().metrics);
    report.traces_deleted = prune(traces_path(), "start_time", now - policy().traces);
    report.alerts_deleted = prune(alerts_path(), "timestamp", now - policy().alerts);
    return report;
}

std::size_t JsonMonitoringStore::prune(const std::filesystem::path& path, const char* time_key,
                                       std::chrono::system_clock::time_point cutoff) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return 0;
    }

    const auto cutoff_ms = to_epoch_ms(cutoff);
    std::vector<std::string> kept;
    std::size_t deleted = 0;
    std::string line;
    while (std::getline(input, line)) {
        if (line.empty()) {
            continue;
        }
        auto row = nlohmann::json::parse(line, nullptr, false);
        if (row.is_discarded() || !row.is_object() || !row.contains(time_key) || !row[time_key].is_number()) {
            spdlog::warn("[MonitoringStore] Dropping unreadable row in {}", path.string());
            ++deleted;
            continue;
        }
        if (row[time_key].get<std::int64_t>() < cutoff_ms) {
            ++deleted;
            continue;
        }
        kept.push_back(std::move(line));
    }
    input.close();

    if (deleted == 0) {
        return 0;
    }

    auto staging = path;
    staging += ".tmp";
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Cannot open " + staging.string());
        }
        for (const auto& row : kept) {
            output << row << '\n';
        }
        if (!output) {
            throw std::runtime_error("Cannot write " + staging.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::filesystem::remove(staging, ec);
        throw std::runtime_error("Cannot replace " + path.string());
    }
    return deleted;
}

} // namespace ingest::monitoring
