#include "ingest/config/config.hpp"

#include <array>
#include <fstream>
#include <iterator>
#include <optional>
#include <type_traits>

namespace ingest::config {
namespace {

using json = nlohmann::json;

constexpr std::array<std::pair<const char*, spdlog::level::level_enum>, 7> kLevels{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

/**
 * Copies j[key] into target when present. Returns an error message when the
 * value has the wrong type.
 */
template<typename T>
std::optional<std::string> read_key(const json& j, const char* key, T& target, const std::string& scope = {}) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }

    const std::string name = scope.empty() ? key : scope + "." + key;
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (!it->is_number_unsigned()) {
            return "'" + name + "' must be a non-negative integer";
        }
    } else if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!it->is_number_integer()) {
            return "'" + name + "' must be an integer";
        }
    }

    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        return "'" + name + "' has the wrong type: " + e.what();
    }
    return std::nullopt;
}

std::optional<std::string> read_section(const json& j, const char* key, const json*& section) {
    section = nullptr;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_object()) {
        return std::string("'") + key + "' must be an object";
    }
    section = &*it;
    return std::nullopt;
}

} // namespace

Result<IngestConfig> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<IngestConfig>(std::string("Configuration root must be an object"));
    }

    IngestConfig config;
    std::optional<std::string> error;
    auto check = [&error](std::optional<std::string> result) {
        if (!error && result) {
            error = std::move(result);
        }
    };

    check(read_key(j, "archive_root", config.archive_root));
    check(read_key(j, "state_dir", config.state_dir));
    check(read_key(j, "network_abort_threshold", config.network_abort_threshold));
    check(read_key(j, "auto_rollback", config.auto_rollback));
    check(read_key(j, "log_level", config.log_level));

    const json* section = nullptr;
    check(read_section(j, "retry", section));
    if (section != nullptr) {
        check(read_key(*section, "max_retries", config.max_retries, "retry"));
        check(read_key(*section, "delays_ms", config.retry_delays_ms, "retry"));
    }

    check(read_section(j, "timeouts_ms", section));
    if (section != nullptr) {
        check(read_key(*section, "copy", config.copy_timeout_ms, "timeouts_ms"));
        check(read_key(*section, "validation", config.validation_timeout_ms, "timeouts_ms"));
        check(read_key(*section, "hash", config.hash_timeout_ms, "timeouts_ms"));
    }

    check(read_section(j, "metrics", section));
    if (section != nullptr) {
        check(read_key(*section, "max_buffered", config.metrics_max_buffered, "metrics"));
        check(read_key(*section, "histogram_window", config.histogram_window, "metrics"));
        check(read_key(*section, "flush_interval_ms", config.metrics_flush_interval_ms, "metrics"));
    }

    check(read_section(j, "tracing", section));
    if (section != nullptr) {
        check(read_key(*section, "max_completed_spans", config.max_completed_spans, "tracing"));
    }

    check(read_section(j, "alerts", section));
    if (section != nullptr) {
        check(read_key(*section, "max_history", config.alert_history, "alerts"));
        check(read_key(*section, "check_interval_ms", config.alert_check_interval_ms, "alerts"));
    }

    check(read_section(j, "retention_hours", section));
    if (section != nullptr) {
        check(read_key(*section, "metrics", config.retention_metrics_hours, "retention_hours"));
        check(read_key(*section, "traces", config.retention_traces_hours, "retention_hours"));
        check(read_key(*section, "alerts", config.retention_alerts_hours, "retention_hours"));
    }

    if (error) {
        return Err<IngestConfig>(*error);
    }

    if (auto level = parse_log_level(config.log_level); level.is_error()) {
        return Err<IngestConfig>(level.error());
    }
    if (config.copy_timeout_ms <= 0 || config.validation_timeout_ms <= 0 || config.hash_timeout_ms <= 0) {
        return Err<IngestConfig>(std::string("Timeouts must be positive"));
    }
    for (auto delay : config.retry_delays_ms) {
        if (delay < 0) {
            return Err<IngestConfig>(std::string("'retry.delays_ms' entries must be non-negative"));
        }
    }
    return Ok(std::move(config));
}

Result<IngestConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<IngestConfig>(std::string("Cannot open config file: " + path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    auto parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<IngestConfig>(std::string("Config file is not valid JSON: " + path.string()));
    }
    return config_from_json(parsed);
}

void to_json(json& j, const IngestConfig& config) {
    j = json{
        {"archive_root", config.archive_root},
        {"state_dir", config.state_dir},
        {"retry", {{"max_retries", config.max_retries}, {"delays_ms", config.retry_delays_ms}}},
        {"network_abort_threshold", config.network_abort_threshold},
        {"timeouts_ms", {
            {"copy", config.copy_timeout_ms},
            {"validation", config.validation_timeout_ms},
            {"hash", config.hash_timeout_ms}}},
        {"auto_rollback", config.auto_rollback},
        {"metrics", {
            {"max_buffered", config.metrics_max_buffered},
            {"histogram_window", config.histogram_window},
            {"flush_interval_ms", config.metrics_flush_interval_ms}}},
        {"tracing", {{"max_completed_spans", config.max_completed_spans}}},
        {"alerts", {
            {"max_history", config.alert_history},
            {"check_interval_ms", config.alert_check_interval_ms}}},
        {"retention_hours", {
            {"metrics", config.retention_metrics_hours},
            {"traces", config.retention_traces_hours},
            {"alerts", config.retention_alerts_hours}}},
        {"log_level", config.log_level},
    };
}

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    for (const auto& [text, level] : kLevels) {
        if (name == text) {
            return Ok(level);
        }
    }
    return Err<spdlog::level::level_enum>("Unknown log level: " + name);
}

import::OrchestratorConfig orchestrator_config(const IngestConfig& config) {
    import::RetryConfig retry;
    retry.max_retries = config.max_retries;
    retry.delays.clear();
    for (auto delay : config.retry_delays_ms) {
        retry.delays.emplace_back(delay);
    }

    import::OrchestratorConfig result;
    result.copy_policy.retry = retry;
    result.copy_policy.network_abort_threshold = config.network_abort_threshold;
    result.copy_policy.timeout = std::chrono::milliseconds(config.copy_timeout_ms);

    result.validation_policy.retry = retry;
    result.validation_policy.network_abort_threshold = config.network_abort_threshold;
    result.validation_policy.timeout = std::chrono::milliseconds(config.validation_timeout_ms);

    result.hash_timeout = std::chrono::milliseconds(config.hash_timeout_ms);
    result.auto_rollback = config.auto_rollback;
    return result;
}

monitoring::MetricsOptions metrics_options(const IngestConfig& config) {
    monitoring::MetricsOptions options;
    options.max_buffered = config.metrics_max_buffered;
    options.histogram_window = config.histogram_window;
    options.flush_interval = std::chrono::milliseconds(config.metrics_flush_interval_ms);
    return options;
}

monitoring::TracerOptions tracer_options(const IngestConfig& config) {
    monitoring::TracerOptions options;
    options.max_completed_spans = config.max_completed_spans;
    return options;
}

monitoring::AlertManagerOptions alert_options(const IngestConfig& config) {
    monitoring::AlertManagerOptions options;
    options.max_history = config.alert_history;
    return options;
}

monitoring::RetentionPolicy retention_policy(const IngestConfig& config) {
    monitoring::RetentionPolicy policy;
    policy.metrics = std::chrono::hours(config.retention_metrics_hours);
    policy.traces = std::chrono::hours(config.retention_traces_hours);
    policy.alerts = std::chrono::hours(config.retention_alerts_hours);
    return policy;
}

} // namespace ingest::config
