#include <gtest/gtest.h>

#include "ingest/monitoring/alert_manager.hpp"
#include "ingest/monitoring/metrics_collector.hpp"
#include "ingest/monitoring/monitoring_store.hpp"
#include "ingest/monitoring/tracer.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace ingest::monitoring;
using namespace std::chrono_literals;

namespace {

Metric metric_at(std::chrono::system_clock::time_point when) {
    Metric m;
    m.name = "import.files.total";
    m.value = 1;
    m.timestamp = when;
    return m;
}

Span span_at(std::chrono::system_clock::time_point when) {
    Span span;
    span.trace_id = "t";
    span.span_id = "s";
    span.operation = "import.copy";
    span.start_time = when;
    return span;
}

Alert alert_at(std::chrono::system_clock::time_point when) {
    Alert alert;
    alert.id = "disk_space_low";
    alert.timestamp = when;
    return alert;
}

std::filesystem::path temp_store_dir() {
    static int counter = 0;
    auto dir = std::filesystem::temp_directory_path() /
               ("ingest_monitoring_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                "_" + std::to_string(counter++));
    std::filesystem::remove_all(dir);
    return dir;
}

std::vector<nlohmann::json> read_rows(const std::filesystem::path& path) {
    std::vector<nlohmann::json> rows;
    std::ifstream input(path);
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty()) {
            rows.push_back(nlohmann::json::parse(line));
        }
    }
    return rows;
}

} // namespace

TEST(MonitoringStoreTest, CleanupHonorsRetentionWindows) {
    InMemoryMonitoringStore store;
    const auto now = std::chrono::system_clock::now();

    store.save_metrics({metric_at(now - 8 * 24h), metric_at(now - 6 * 24h), metric_at(now)});
    store.save_span(span_at(now - 4 * 24h));
    store.save_span(span_at(now - 1h));
    store.save_alert(alert_at(now - 31 * 24h));
    store.save_alert(alert_at(now - 29 * 24h));

    auto report = store.cleanup(now);

    EXPECT_EQ(report.metrics_deleted, 1u);
    EXPECT_EQ(report.traces_deleted, 1u);
    EXPECT_EQ(report.alerts_deleted, 1u);
    EXPECT_EQ(store.metrics().size(), 2u);
    EXPECT_EQ(store.spans().size(), 1u);
    EXPECT_EQ(store.alerts().size(), 1u);
}

TEST(MonitoringStoreTest, CustomPolicyApplies) {
    RetentionPolicy policy;
    policy.metrics = 1h;
    InMemoryMonitoringStore store(policy);
    const auto now = std::chrono::system_clock::now();

    store.save_metrics({metric_at(now - 2h), metric_at(now - 30min)});
    EXPECT_EQ(store.cleanup(now).metrics_deleted, 1u);
    EXPECT_EQ(store.policy().metrics, 1h);
}

TEST(MonitoringStoreTest, AttachRoutesAllSignals) {
    InMemoryMonitoringStore store;

    MetricsOptions metrics_options;
    metrics_options.flush_interval = 10ms;
    MetricsCollector metrics(metrics_options);
    Tracer tracer;
    AlertManager alerts;

    store.attach(metrics, tracer, alerts);

    metrics.increment("import.started");
    tracer.start_span("import.session").end();
    alerts.trigger_manual_alert("Import paused", "network down", AlertSeverity::Warning);

    tracer.flush_persistence();
    for (int i = 0; i < 500 && store.metrics().empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    metrics.stop();

    ASSERT_EQ(store.metrics().size(), 1u);
    EXPECT_EQ(store.metrics()[0].name, "import.started");
    ASSERT_EQ(store.spans().size(), 1u);
    EXPECT_EQ(store.spans()[0].operation, "import.session");
    ASSERT_EQ(store.alerts().size(), 1u);
    EXPECT_EQ(store.alerts()[0].name, "Import paused");
}

TEST(MonitoringStoreTest, BackgroundCleanupStops) {
    InMemoryMonitoringStore store;
    store.save_metrics({metric_at(std::chrono::system_clock::now() - 30 * 24h)});

    store.start_cleanup(5ms);
    for (int i = 0; i < 500 && !store.metrics().empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    store.stop_cleanup();

    EXPECT_TRUE(store.metrics().empty());
}

TEST(JsonMonitoringStoreTest, RowsSurviveReopen) {
    const auto dir = temp_store_dir();
    const auto now = std::chrono::system_clock::now();
    {
        JsonMonitoringStore store(dir);
        store.save_metrics({metric_at(now), metric_at(now)});
        store.save_span(span_at(now));
        store.save_alert(alert_at(now));
    }

    JsonMonitoringStore reopened(dir);
    auto metrics = read_rows(reopened.metrics_path());
    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_EQ(metrics[0]["name"], "import.files.total");
    EXPECT_EQ(metrics[0]["type"], "counter");
    ASSERT_EQ(read_rows(reopened.traces_path()).size(), 1u);
    EXPECT_EQ(read_rows(reopened.traces_path())[0]["operation"], "import.copy");
    ASSERT_EQ(read_rows(reopened.alerts_path()).size(), 1u);
    EXPECT_EQ(read_rows(reopened.alerts_path())[0]["id"], "disk_space_low");

    std::filesystem::remove_all(dir);
}

TEST(JsonMonitoringStoreTest, CleanupRewritesTables) {
    const auto dir = temp_store_dir();
    const auto now = std::chrono::system_clock::now();
    JsonMonitoringStore store(dir);

    store.save_metrics({metric_at(now - 8 * 24h), metric_at(now - 6 * 24h), metric_at(now)});
    store.save_span(span_at(now - 4 * 24h));
    store.save_span(span_at(now - 1h));
    store.save_alert(alert_at(now - 31 * 24h));
    store.save_alert(alert_at(now - 29 * 24h));
    {
        std::ofstream corrupt(store.alerts_path(), std::ios::app);
        corrupt << "{not json\n";
    }

    auto report = store.cleanup(now);

    EXPECT_EQ(report.metrics_deleted, 1u);
    EXPECT_EQ(report.traces_deleted, 1u);
    EXPECT_EQ(report.alerts_deleted, 2u);
    EXPECT_EQ(read_rows(store.metrics_path()).size(), 2u);
    EXPECT_EQ(read_rows(store.traces_path()).size(), 1u);
    EXPECT_EQ(read_rows(store.alerts_path()).size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(store.alerts_path().string() + ".tmp"));

    auto again = store.cleanup(now);
    EXPECT_EQ(again.metrics_deleted + again.traces_deleted + again.alerts_deleted, 0u);

    std::filesystem::remove_all(dir);
}

TEST(JsonMonitoringStoreTest, CleanupOfEmptyDirectoryIsNoop) {
    const auto dir = temp_store_dir();
    JsonMonitoringStore store(dir);

    auto report = store.cleanup(std::chrono::system_clock::now());
    EXPECT_EQ(report.metrics_deleted, 0u);
    EXPECT_TRUE(std::filesystem::is_directory(dir));

    std::filesystem::remove_all(dir);
}
