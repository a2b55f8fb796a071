#pragma once

/**
 * @file config.hpp
 * @brief Runtime settings for the importer, loaded from a JSON file
 *
 * Every key is optional; a missing key keeps the default below. A key that
 * is present with the wrong JSON type is rejected rather than ignored.
 *
 * EXAMPLE FILE:
 * {
 *   "archive_root": "/archive",
 *   "state_dir": "/archive/.sessions",
 *   "retry": { "max_retries": 3, "delays_ms": [1000, 3000, 5000] },
 *   "network_abort_threshold": 5,
 *   "timeouts_ms": { "copy": 300000, "validation": 120000, "hash": 120000 },
 *   "auto_rollback": true,
 *   "metrics": { "max_buffered": 10000, "histogram_window": 1000, "flush_interval_ms": 60000 },
 *   "tracing": { "max_completed_spans": 1000 },
 *   "alerts": { "max_history": 100, "check_interval_ms": 60000 },
 *   "retention_hours": { "metrics": 168, "traces": 72, "alerts": 720 },
 *   "log_level": "info"
 * }
 */

#include "ingest/core/result.hpp"
#include "ingest/import/orchestrator.hpp"
#include "ingest/monitoring/alert_manager.hpp"
#include "ingest/monitoring/metrics_collector.hpp"
#include "ingest/monitoring/monitoring_store.hpp"
#include "ingest/monitoring/tracer.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ingest::config {

struct IngestConfig {
    std::string archive_root;
    std::string state_dir = ".ingest-sessions";

    std::size_t max_retries = 3;
    std::vector<std::int64_t> retry_delays_ms{1000, 3000, 5000};
    std::size_t network_abort_threshold = import::kNetworkAbortThreshold;

    std::int64_t copy_timeout_ms = import::kCopyTimeout.count();
    std::int64_t validation_timeout_ms = import::kValidationTimeout.count();
    std::int64_t hash_timeout_ms = import::kHashTimeout.count();
    bool auto_rollback = true;

    std::size_t metrics_max_buffered = 10000;
    std::size_t histogram_window = 1000;
    std::int64_t metrics_flush_interval_ms = 60000;
    std::size_t max_completed_spans = 1000;
    std::size_t alert_history = 100;
    std::int64_t alert_check_interval_ms = 60000;

    std::int64_t retention_metrics_hours = 7 * 24;
    std::int64_t retention_traces_hours = 3 * 24;
    std::int64_t retention_alerts_hours = 30 * 24;

    std::string log_level = "info";
};

Result<IngestConfig> load_config(const std::filesystem::path& path);
Result<IngestConfig> config_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const IngestConfig& config);

/// Accepts trace, debug, info, warn, error, critical, off.
Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

import::OrchestratorConfig orchestrator_config(const IngestConfig& config);
monitoring::MetricsOptions metrics_options(const IngestConfig& config);
monitoring::TracerOptions tracer_options(const IngestConfig& config);
monitoring::AlertManagerOptions alert_options(const IngestConfig& config);
monitoring::RetentionPolicy retention_policy(const IngestConfig& config);

} // namespace ingest::config
