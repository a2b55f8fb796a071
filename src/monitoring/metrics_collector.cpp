#include "ingest/monitoring/metrics_collector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace ingest::monitoring {

const char* to_string(MetricType type) noexcept {
    switch (type) {
        case MetricType::Counter: return "counter";
        case MetricType::Gauge: return "gauge";
        case MetricType::Histogram: return "histogram";
    }
    return "counter";
}

// ════════════════════════════════════════════════════════
// Timer
// ════════════════════════════════════════════════════════

MetricsCollector::Timer::Timer(MetricsCollector& owner, std::string name, Tags tags)
    : owner_(&owner),
      name_(std::move(name)),
      tags_(std::move(tags)),
      start_(std::chrono::steady_clock::now()) {}

double MetricsCollector::Timer::end(const Tags& extra_tags) {
    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_).count();
    if (ended_) {
        return elapsed;
    }
    ended_ = true;

    Tags merged = tags_;
    for (const auto& [key, value] : extra_tags) {
        merged[key] = value;
    }
    owner_->histogram(name_, elapsed, merged);
    return elapsed;
}

// ════════════════════════════════════════════════════════
// MetricsCollector
// ════════════════════════════════════════════════════════

MetricsCollector::MetricsCollector(MetricsOptions options)
    : options_(options) {
    if (options_.histogram_window == 0) {
        options_.histogram_window = 1;
    }
}

MetricsCollector::~MetricsCollector() {
    stop();
}

void MetricsCollector::increment(const std::string& name, double value, const Tags& tags) {
    {
        std::lock_guard lock(mutex_);
        counters_[metric_key(name, tags)] += value;

        const auto now = std::chrono::system_clock::now();
        auto& recent = increments_[name];
        recent.emplace_back(now, value);
        while (!recent.empty() && recent.front().first < now - options_.counter_window) {
            recent.pop_front();
        }
    }
    record(name, value, tags, MetricType::Counter);
}

void MetricsCollector::gauge(const std::string& name, double value, const Tags& tags) {
    {
        std::lock_guard lock(mutex_);
        gauges_[metric_key(name, tags)] = value;
    }
    record(name, value, tags, MetricType::Gauge);
}

void MetricsCollector::histogram(const std::string& name, double value, const Tags& tags) {
    {
        std::lock_guard lock(mutex_);
        auto& window = histograms_[metric_key(name, tags)];
        window.push_back(value);
        while (window.size() > options_.histogram_window) {
            window.pop_front();
        }
    }
    record(name, value, tags, MetricType::Histogram);
}

MetricsCollector::Timer MetricsCollector::start_timer(const std::string& name, Tags tags) {
    return Timer(*this, name, std::move(tags));
}

double MetricsCollector::get_counter(const std::string& name, const Tags& tags) const {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(metric_key(name, tags));
    return it != counters_.end() ? it->second : 0.0;
}

double MetricsCollector::sum_counter_since(const std::string& name,
                                           std::chrono::system_clock::time_point since) const {
    std::lock_guard lock(mutex_);
    auto it = increments_.find(name);
    if (it == increments_.end()) {
        return 0.0;
    }

    const auto horizon = std::max(since, std::chrono::system_clock::now() - options_.counter_window);
    double total = 0.0;
    for (const auto& [timestamp, value] : it->second) {
        if (timestamp >= horizon) {
            total += value;
        }
    }
    return total;
}

std::optional<double> MetricsCollector::get_gauge(const std::string& name, const Tags& tags) const {
    std::lock_guard lock(mutex_);
    auto it = gauges_.find(metric_key(name, tags));
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<HistogramStats> MetricsCollector::get_histogram_stats(const std::string& name,
                                                                    const Tags& tags) const {
    std::vector<double> values;
    {
        std::lock_guard lock(mutex_);
        auto it = histograms_.find(metric_key(name, tags));
        if (it == histograms_.end()) {
            return std::nullopt;
        }
        values.assign(it->second.begin(), it->second.end());
    }
    return compute_stats(std::move(values));
}

MetricsSummary MetricsCollector::summary() const {
    MetricsSummary result;
    std::vector<std::pair<std::string, std::vector<double>>> windows;
    {
        std::lock_guard lock(mutex_);
        result.counters.insert(counters_.begin(), counters_.end());
        result.gauges.insert(gauges_.begin(), gauges_.end());
        for (const auto& [key, window] : histograms_) {
            windows.emplace_back(key, std::vector<double>(window.begin(), window.end()));
        }
    }

    for (auto& [key, values] : windows) {
        if (auto stats = compute_stats(std::move(values))) {
            result.histograms.emplace(key, *stats);
        }
    }
    return result;
}

std::size_t MetricsCollector::buffered_count() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

std::vector<Metric> MetricsCollector::flush() {
    std::lock_guard lock(mutex_);
    std::vector<Metric> drained(std::make_move_iterator(buffer_.begin()),
                                std::make_move_iterator(buffer_.end()));
    buffer_.clear();
    return drained;
}

void MetricsCollector::start(FlushCallback callback) {
    if (running_.exchange(true)) {
        return;
    }

    {
        std::lock_guard lock(flush_mutex_);
        flush_callback_ = std::move(callback);
    }
    flush_thread_ = std::thread([this]() { flush_loop(); });

    spdlog::info("[MetricsCollector] Started (flush every {}ms, buffer cap {})",
                 options_.flush_interval.count(), options_.max_buffered);
}

std::vector<Metric> MetricsCollector::stop() {
    if (running_.exchange(false)) {
        flush_cv_.notify_all();
        if (flush_thread_.joinable()) {
            flush_thread_.join();
        }
        spdlog::info("[MetricsCollector] Stopped");
    }
    return flush();
}

void MetricsCollector::flush_loop() {
    std::unique_lock lock(flush_mutex_);
    while (running_.load()) {
        flush_cv_.wait_for(lock, options_.flush_interval, [this]() { return !running_.load(); });
        if (!running_.load()) {
            break;
        }

        auto drained = flush();
        if (drained.empty() || !flush_callback_) {
            continue;
        }
        try {
            flush_callback_(drained);
        } catch (const std::exception& e) {
            spdlog::error("[MetricsCollector] Failed to flush {} metrics: {}", drained.size(), e.what());
        } catch (...) {
            spdlog::error("[MetricsCollector] Failed to flush {} metrics: unknown exception", drained.size());
        }
    }
}

size_t MetricsCollector::subscribe(Subscriber subscriber) {
    std::lock_guard lock(subscribers_mutex_);
    size_t id = next_subscriber_id_++;
    subscribers_.emplace_back(id, std::move(subscriber));
    return id;
}

void MetricsCollector::unsubscribe(size_t id) {
    std::lock_guard lock(subscribers_mutex_);
    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
            [id](const auto& entry) { return entry.first == id; }),
        subscribers_.end());
}

void MetricsCollector::reset() {
    std::lock_guard lock(mutex_);
    buffer_.clear();
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
    increments_.clear();
}

std::string MetricsCollector::metric_key(const std::string& name, const Tags& tags) {
    if (tags.empty()) {
        return name;
    }

    std::string key = name + "{";
    bool first = true;
    for (const auto& [tag, value] : tags) {
        if (!first) {
            key += ',';
        }
        key += tag + "=" + value;
        first = false;
    }
    key += '}';
    return key;
}

double MetricsCollector::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    const auto n = static_cast<double>(sorted.size());
    auto index = static_cast<long long>(std::ceil((p / 100.0) * n)) - 1;
    index = std::clamp<long long>(index, 0, static_cast<long long>(sorted.size()) - 1);
    return sorted[static_cast<std::size_t>(index)];
}

std::optional<HistogramStats> MetricsCollector::compute_stats(std::vector<double> values) {
    if (values.empty()) {
        return std::nullopt;
    }

    std::sort(values.begin(), values.end());

    HistogramStats stats;
    stats.count = values.size();
    stats.sum = std::accumulate(values.begin(), values.end(), 0.0);
    stats.min = values.front();
    stats.max = values.back();
    stats.mean = stats.sum / static_cast<double>(values.size());
    stats.p50 = percentile(values, 50);
    stats.p90 = percentile(values, 90);
    stats.p95 = percentile(values, 95);
    stats.p99 = percentile(values, 99);
    return stats;
}

void MetricsCollector::record(const std::string& name, double value, const Tags& tags, MetricType type) {
    Metric metric{name, value, std::chrono::system_clock::now(), tags, type};

    {
        std::lock_guard lock(mutex_);
        buffer_.push_back(metric);
        while (buffer_.size() > options_.max_buffered) {
            buffer_.pop_front();
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
            subscriber(metric);
        } catch (const std::exception& e) {
            spdlog::warn("[MetricsCollector] Subscriber threw on {}: {}", name, e.what());
        } catch (...) {
            spdlog::warn("[MetricsCollector] Subscriber threw a non-standard exception on {}", name);
        }
    }
}

} // namespace ingest::monitoring
