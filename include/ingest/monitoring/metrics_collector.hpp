/**
 * @file metrics_collector.hpp
 * @brief In-memory counters, gauges and histograms with periodic flushing
 *
 * WHAT IT DOES:
 * - Keeps cumulative counter and latest gauge values per series
 * - Keeps a sliding window of observations per histogram series
 * - Buffers every raw observation until flush() hands it to a sink
 * - Notifies subscribers of each observation as it is recorded
 *
 * A series is identified by its name plus its tags, rendered as
 * name{k1=v1,k2=v2} with keys sorted.
 *
 * EXAMPLE:
 * MetricsCollector metrics;
 * metrics.increment(metric::kImportFilesProcessed, 1, {{"status", "ok"}});
 * auto timer = metrics.start_timer(metric::kFileCopyDuration);
 * ...
 * timer.end({{"result", "success"}});
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ingest::monitoring {

using Tags = std::map<std::string, std::string>;

enum class MetricType {
    Counter,
    Gauge,
    Histogram
};

const char* to_string(MetricType type) noexcept;

struct Metric {
    std::string name;
    double value = 0.0;
    std::chrono::system_clock::time_point timestamp;
    Tags tags;
    MetricType type = MetricType::Counter;
};

struct HistogramStats {
    std::size_t count = 0;
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

struct MetricsSummary {
    std::map<std::string, double> counters;
    std::map<std::string, double> gauges;
    std::map<std::string, HistogramStats> histograms;
};

struct MetricsOptions {
    std::size_t max_buffered = 10000;
    std::size_t histogram_window = 1000;
    std::chrono::milliseconds flush_interval{60000};
    /// How long counter increments stay visible to sum_counter_since().
    std::chrono::milliseconds counter_window{std::chrono::hours{1}};
};

class MetricsCollector {
public:
    using FlushCallback = std::function<void(const std::vector<Metric>&)>;
    using Subscriber = std::function<void(const Metric&)>;

    /**
     * @brief Measures one operation; records a histogram observation on end()
     *
     * Ending twice records only once. A timer that is never ended records nothing.
     */
    class Timer {
    public:
        /// Returns the elapsed milliseconds.
        double end(const Tags& extra_tags = {});

    private:
        friend class MetricsCollector;
        Timer(MetricsCollector& owner, std::string name, Tags tags);

        MetricsCollector* owner_;
        std::string name_;
        Tags tags_;
        std::chrono::steady_clock::time_point start_;
        bool ended_ = false;
    };

    explicit MetricsCollector(MetricsOptions options = {});
    ~MetricsCollector();

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void increment(const std::string& name, double value = 1.0, const Tags& tags = {});
    void gauge(const std::string& name, double value, const Tags& tags = {});
    void histogram(const std::string& name, double value, const Tags& tags = {});

    Timer start_timer(const std::string& name, Tags tags = {});

    double get_counter(const std::string& name, const Tags& tags = {}) const;

    /// Sum of increments to name across every tag set at or after since,
    /// limited to the last counter_window.
    double sum_counter_since(const std::string& name, std::chrono::system_clock::time_point since) const;
    std::optional<double> get_gauge(const std::string& name, const Tags& tags = {}) const;
    std::optional<HistogramStats> get_histogram_stats(const std::string& name, const Tags& tags = {}) const;

    MetricsSummary summary() const;

    /// Number of raw observations waiting for the next flush.
    std::size_t buffered_count() const;

    /**
     * @brief Drains the raw observation buffer
     *
     * Counter and gauge values are cumulative state and survive a flush.
     */
    std::vector<Metric> flush();

    /**
     * @brief Starts a background thread that flushes into callback every interval
     *
     * Callback failures are logged; the drained observations are dropped.
     */
    void start(FlushCallback callback);

    /// Stops the flush thread and returns whatever was still buffered.
    std::vector<Metric> stop();

    bool running() const noexcept { return running_.load(); }

    size_t subscribe(Subscriber subscriber);
    void unsubscribe(size_t id);

    void reset();

    static std::string metric_key(const std::string& name, const Tags& tags);

    /// Percentile by ceil(p/100 * n) - 1 over sorted values, clamped to the range.
    static double percentile(const std::vector<double>& sorted, double p);
    static std::optional<HistogramStats> compute_stats(std::vector<double> values);

private:
    void record(const std::string& name, double value, const Tags& tags, MetricType type);
    void flush_loop();

    MetricsOptions options_;

    mutable std::mutex mutex_;
    std::deque<Metric> buffer_;
    std::unordered_map<std::string, double> counters_;
    std::unordered_map<std::string, double> gauges_;
    std::unordered_map<std::string, std::deque<double>> histograms_;
    std::unordered_map<std::string, std::deque<std::pair<std::chrono::system_clock::time_point, double>>> increments_;

    std::mutex subscribers_mutex_;
    std::vector<std::pair<size_t, Subscriber>> subscribers_;
    size_t next_subscriber_id_ = 0;

    std::atomic<bool> running_{false};
    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    FlushCallback flush_callback_;
    std::thread flush_thread_;
};

} // namespace ingest::monitoring
