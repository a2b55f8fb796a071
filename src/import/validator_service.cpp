#include "ingest/import/validator_service.hpp"

#include "ingest/monitoring/metric_names.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <thread>

namespace ingest::import {

ValidatorService::ValidatorService(FileOperations& ops,
                                   TimeoutRunner& runner,
                                   TransferPolicy policy,
                                   monitoring::Instruments instruments)
    : ops_(ops),
      runner_(runner),
      policy_(std::move(policy)),
      instruments_(instruments),
      tracker_(policy_.network_abort_threshold) {}

TransferPolicy ValidatorService::default_policy() {
    TransferPolicy policy;
    policy.timeout = kValidationTimeout;
    return policy;
}

ValidatedFile ValidatorService::validate(const CopiedFile& file, bool auto_rollback) {
    Check result = check(file, 64 * 1024, std::nullopt);
    settle(result, auto_rollback);
    return std::move(result.file);
}

ValidationResult ValidatorService::validate_batch(const std::vector<CopiedFile>& files,
                                                  const ValidateOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    tracker_.reset();

    ValidationResult result;
    result.files.reserve(files.size());

    std::size_t done = 0;
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (options.abort.aborted()) {
            for (std::size_t k = i; k < files.size(); ++k) {
                ValidatedFile cancelled;
                cancelled.copied = files[k];
                cancelled.validation_error = "Cancelled";
                result.files.push_back(std::move(cancelled));
            }
            spdlog::info("[ValidatorService] Aborted; {} files cancelled", files.size() - i);
            break;
        }

        Check current = check(files[i], options.buffer_size, options.trace_parent);
        if (current.outcome != Outcome::Skipped) {
            ++result.total_validated;
        }
        if (current.retries > 0) {
            ++result.total_retried;
        }

        ++done;
        if (options.on_progress) {
            options.on_progress(done, files.size(), current.file.filename());
        }

        // Network escalation happens here, before rollback of this file. The
        // file that crosses the threshold is still reported before rethrow.
        std::exception_ptr escalation;
        try {
            settle(current, options.auto_rollback);
        } catch (const NetworkFailureError&) {
            escalation = std::current_exception();
        }

        if (current.file.is_valid) {
            ++result.total_valid;
        } else if (current.outcome != Outcome::Skipped) {
            ++result.total_invalid;
        }
        if (current.file.rolled_back) {
            ++result.total_rolled_back;
        }
        if (options.on_file_complete) {
            options.on_file_complete(current.file);
        }
        result.files.push_back(std::move(current.file));
        if (escalation) {
            std::rethrow_exception(escalation);
        }
    }

    result.validation_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    spdlog::info("[ValidatorService] Validated {} files: {} valid, {} invalid, {} rolled back in {}ms",
                 result.total_validated, result.total_valid, result.total_invalid,
                 result.total_rolled_back, result.validation_time_ms);
    return result;
}

ValidatorService::Check ValidatorService::check(const CopiedFile& file,
                                                std::size_t buffer_size,
                                                const std::optional<monitoring::TraceContext>& trace_parent) {
    Check result;
    result.file.copied = file;

    if (!file.copied() || !file.hashed.hash) {
        result.file.validation_error = "Not copied";
        return result;
    }

    std::optional<monitoring::SpanHandle> span;
    if (instruments_.tracer != nullptr && trace_parent) {
        span = instruments_.tracer->start_child_span(monitoring::span::kFileValidate, *trace_parent,
                                                     {{"file_id", file.id()}});
    }
    const auto started = std::chrono::steady_clock::now();

    const auto path = *file.archive_path;
    const auto& expected = *file.hashed.hash;

    FileOperations& ops = ops_;
    for (std::size_t attempt = 0;; ++attempt) {
        auto rehash = runner_.run<std::string>(
            [&ops, path, buffer_size]() { return ops.hash_file(path, buffer_size); },
            policy_.timeout);

        if (rehash.is_ok()) {
            const auto& actual = rehash.value();
            if (actual == expected) {
                result.file.is_valid = true;
                result.outcome = Outcome::Valid;
            } else {
                result.file.validation_error = "Hash mismatch: expected " + expected + ", got " + actual;
                result.outcome = Outcome::Mismatch;
            }
            break;
        }

        const auto& error = rehash.error();
        const bool retryable = is_retryable(error.code);
        if (!retryable || attempt >= policy_.retry.max_retries) {
            result.file.validation_error = "Re-hash failed: " + error.message;
            result.outcome = retryable ? Outcome::RehashNetworkFailed : Outcome::RehashFailed;
            break;
        }

        const auto delay = policy_.retry.delay_for(attempt);
        spdlog::warn("[ValidatorService] Network error re-hashing {}, retry {}/{} after {}ms: {}",
                     file.filename(), attempt + 1, policy_.retry.max_retries, delay.count(), error.message);
        ++result.retries;
        std::this_thread::sleep_for(delay);
    }

    if (instruments_.metrics != nullptr) {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        instruments_.metrics->histogram(monitoring::metric::kFileValidateDuration, elapsed,
                                        {{"result", result.file.is_valid ? "valid" : "invalid"}});
    }
    if (span) {
        if (result.file.validation_error) {
            span->log(*result.file.validation_error);
        }
        span->end(result.file.is_valid ? monitoring::SpanStatus::Success : monitoring::SpanStatus::Error);
    }
    return result;
}

void ValidatorService::settle(Check& check, bool auto_rollback) {
    switch (check.outcome) {
        case Outcome::Skipped:
            return;
        case Outcome::Valid:
            tracker_.record_success();
            return;
        case Outcome::Mismatch:
            spdlog::error("[ValidatorService] {} {}", check.file.filename(), *check.file.validation_error);
            if (instruments_.metrics != nullptr) {
                instruments_.metrics->increment(monitoring::metric::kErrorsHashMismatch);
            }
            tracker_.record_non_network();
            break;
        case Outcome::RehashFailed:
            tracker_.record_non_network();
            break;
        case Outcome::RehashNetworkFailed:
            if (instruments_.metrics != nullptr) {
                instruments_.metrics->increment(monitoring::metric::kErrorsNetwork);
            }
            tracker_.record_network_error(*check.file.validation_error);
            break;
    }

    if (auto_rollback) {
        roll_back(check.file);
    }
}

void ValidatorService::roll_back(ValidatedFile& file) {
    const auto& path = *file.copied.archive_path;
    auto removed = ops_.remove(path);
    if (removed.is_error()) {
        spdlog::error("[ValidatorService] Rollback of {} failed: {}", path.string(), removed.error().message);
        return;
    }

    file.rolled_back = true;
    spdlog::info("[ValidatorService] Rolled back {}", path.string());
    if (instruments_.metrics != nullptr) {
        instruments_.metrics->increment(monitoring::metric::kFileRollbacks);
    }
}

} // namespace ingest::import
