#include <gtest/gtest.h>

#include "ingest/config/config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace ingest;
using namespace ingest::config;
using json = nlohmann::json;

namespace {

std::filesystem::path write_temp_config(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

} // namespace

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    auto result = config_from_json(json::object());
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& c = result.value();
    EXPECT_TRUE(c.archive_root.empty());
    EXPECT_EQ(c.max_retries, 3u);
    EXPECT_EQ(c.retry_delays_ms, (std::vector<std::int64_t>{1000, 3000, 5000}));
    EXPECT_EQ(c.network_abort_threshold, import::kNetworkAbortThreshold);
    EXPECT_EQ(c.copy_timeout_ms, import::kCopyTimeout.count());
    EXPECT_TRUE(c.auto_rollback);
    EXPECT_EQ(c.log_level, "info");
}

TEST(ConfigTest, ParsesNestedSections) {
    auto j = json::parse(R"({
        "archive_root": "/archive",
        "state_dir": "/archive/.sessions",
        "retry": { "max_retries": 5, "delays_ms": [10, 20] },
        "network_abort_threshold": 8,
        "timeouts_ms": { "copy": 1000, "validation": 2000, "hash": 3000 },
        "auto_rollback": false,
        "metrics": { "max_buffered": 50, "histogram_window": 10, "flush_interval_ms": 500 },
        "tracing": { "max_completed_spans": 20 },
        "alerts": { "max_history": 7, "check_interval_ms": 250 },
        "retention_hours": { "metrics": 1, "traces": 2, "alerts": 3 },
        "log_level": "debug"
    })");

    auto result = config_from_json(j);
    ASSERT_TRUE(result.is_ok()) << result.error();
    const auto& c = result.value();

    EXPECT_EQ(c.archive_root, "/archive");
    EXPECT_EQ(c.state_dir, "/archive/.sessions");
    EXPECT_EQ(c.max_retries, 5u);
    EXPECT_EQ(c.retry_delays_ms, (std::vector<std::int64_t>{10, 20}));
    EXPECT_EQ(c.network_abort_threshold, 8u);
    EXPECT_EQ(c.copy_timeout_ms, 1000);
    EXPECT_EQ(c.validation_timeout_ms, 2000);
    EXPECT_EQ(c.hash_timeout_ms, 3000);
    EXPECT_FALSE(c.auto_rollback);
    EXPECT_EQ(c.metrics_max_buffered, 50u);
    EXPECT_EQ(c.histogram_window, 10u);
    EXPECT_EQ(c.metrics_flush_interval_ms, 500);
    EXPECT_EQ(c.max_completed_spans, 20u);
    EXPECT_EQ(c.alert_history, 7u);
    EXPECT_EQ(c.alert_check_interval_ms, 250);
    EXPECT_EQ(c.retention_metrics_hours, 1);
    EXPECT_EQ(c.retention_traces_hours, 2);
    EXPECT_EQ(c.retention_alerts_hours, 3);
    EXPECT_EQ(c.log_level, "debug");
}

TEST(ConfigTest, RejectsWrongTypes) {
    EXPECT_TRUE(config_from_json(json::parse(R"({"archive_root": 5})")).is_error());
    EXPECT_TRUE(config_from_json(json::parse(R"({"auto_rollback": "yes"})")).is_error());
    EXPECT_TRUE(config_from_json(json::parse(R"({"retry": {"delays_ms": ["soon"]}})")).is_error());
    EXPECT_TRUE(config_from_json(json::parse(R"({"retry": 3})")).is_error());
    EXPECT_TRUE(config_from_json(json::parse(R"([1, 2])")).is_error());

    auto negative = config_from_json(json::parse(R"({"retry": {"max_retries": -1}})"));
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error(), "'retry.max_retries' must be a non-negative integer");
}

TEST(ConfigTest, RejectsInvalidValues) {
    auto zero_timeout = config_from_json(json::parse(R"({"timeouts_ms": {"copy": 0}})"));
    ASSERT_TRUE(zero_timeout.is_error());
    EXPECT_EQ(zero_timeout.error(), "Timeouts must be positive");

    auto level = config_from_json(json::parse(R"({"log_level": "verbose"})"));
    ASSERT_TRUE(level.is_error());
    EXPECT_EQ(level.error(), "Unknown log level: verbose");

    EXPECT_TRUE(config_from_json(json::parse(R"({"retry": {"delays_ms": [100, -5]}})")).is_error());
}

TEST(ConfigTest, NullKeysKeepDefaults) {
    auto result = config_from_json(json::parse(R"({"archive_root": null, "retry": null})"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().max_retries, 3u);
}

TEST(ConfigTest, SerializationRoundTrip) {
    IngestConfig original;
    original.archive_root = "/mnt/archive";
    original.max_retries = 1;
    original.retry_delays_ms = {50};
    original.auto_rollback = false;
    original.log_level = "warn";

    json j = original;
    auto parsed = config_from_json(j);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    EXPECT_EQ(parsed.value().archive_root, "/mnt/archive");
    EXPECT_EQ(parsed.value().max_retries, 1u);
    EXPECT_EQ(parsed.value().retry_delays_ms, (std::vector<std::int64_t>{50}));
    EXPECT_FALSE(parsed.value().auto_rollback);
    EXPECT_EQ(parsed.value().log_level, "warn");
}

TEST(ConfigTest, LoadConfigFromFile) {
    auto path = write_temp_config("ingest_config_test.json", R"({"archive_root": "/data/archive"})");
    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    EXPECT_EQ(loaded.value().archive_root, "/data/archive");
    std::filesystem::remove(path);

    auto broken = write_temp_config("ingest_config_broken.json", "{ not json");
    EXPECT_TRUE(load_config(broken).is_error());
    std::filesystem::remove(broken);

    auto missing = load_config("/nonexistent/ingest.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().rfind("Cannot open config file", 0), 0u);
}

TEST(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("error").value(), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off").value(), spdlog::level::off);
    EXPECT_TRUE(parse_log_level("INFO").is_error());
}

TEST(ConfigTest, BuildsComponentOptions) {
    IngestConfig c;
    c.max_retries = 2;
    c.retry_delays_ms = {100, 200};
    c.network_abort_threshold = 4;
    c.copy_timeout_ms = 1500;
    c.validation_timeout_ms = 2500;
    c.hash_timeout_ms = 3500;
    c.auto_rollback = false;
    c.metrics_flush_interval_ms = 42;
    c.max_completed_spans = 9;
    c.alert_history = 11;
    c.retention_traces_hours = 5;

    auto orchestrator = orchestrator_config(c);
    EXPECT_EQ(orchestrator.copy_policy.retry.max_retries, 2u);
    ASSERT_EQ(orchestrator.copy_policy.retry.delays.size(), 2u);
    EXPECT_EQ(orchestrator.copy_policy.retry.delays[1], std::chrono::milliseconds(200));
    EXPECT_EQ(orchestrator.copy_policy.network_abort_threshold, 4u);
    EXPECT_EQ(orchestrator.copy_policy.timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(orchestrator.validation_policy.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(orchestrator.validation_policy.retry.delays.size(), 2u);
    EXPECT_EQ(orchestrator.hash_timeout, std::chrono::milliseconds(3500));
    EXPECT_FALSE(orchestrator.auto_rollback);

    EXPECT_EQ(metrics_options(c).flush_interval, std::chrono::milliseconds(42));
    EXPECT_EQ(tracer_options(c).max_completed_spans, 9u);
    EXPECT_EQ(alert_options(c).max_history, 11u);
    EXPECT_EQ(retention_policy(c).traces, std::chrono::hours(5));
}
