#include "ingest/import/copy_service.hpp"

#include "ingest/monitoring/metric_names.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>
#include <thread>

namespace ingest::import {
namespace fs = std::filesystem;

CopyService::CopyService(FileOperations& ops,
                         TimeoutRunner& runner,
                         fs::path archive_root,
                         TransferPolicy policy,
                         monitoring::Instruments instruments)
    : ops_(ops),
      runner_(runner),
      archive_root_(std::move(archive_root)),
      policy_(std::move(policy)),
      instruments_(instruments),
      tracker_(policy_.network_abort_threshold) {}

std::optional<std::string> CopyService::skip_reason(const HashedFile& file) {
    if (file.is_duplicate) {
        return std::string("Duplicate");
    }
    if (file.hash_error) {
        return *file.hash_error;
    }
    return std::nullopt;
}

fs::path CopyService::destination_for(const std::string& hash,
                                      FileType type,
                                      const std::string& extension) const {
    const std::string bucket = hash.substr(0, std::min<std::size_t>(2, hash.size()));
    std::string name = hash;
    if (!extension.empty()) {
        name += "." + extension;
    }
    return archive_root_ / to_string(type) / bucket / name;
}

CopiedFile CopyService::copy_file(const HashedFile& file, const StorageConfig& storage) {
    Attempt attempt = attempt_copy(file, storage, std::nullopt);
    record_outcome(attempt);
    return std::move(attempt.file);
}

CopyResult CopyService::copy_batch(const std::vector<HashedFile>& files, const CopyOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    tracker_.reset();

    CopyResult result;
    result.strategy = options.storage.concurrency > 1 ? "parallel" : "sequential";
    result.files.resize(files.size());

    std::vector<std::size_t> eligible;
    for (std::size_t i = 0; i < files.size(); ++i) {
        auto& slot = result.files[i];
        slot.hashed = files[i];
        slot.category = to_string(files[i].scanned.type);
        if (auto reason = skip_reason(files[i])) {
            slot.copy_error = *reason;
        } else {
            eligible.push_back(i);
        }
    }

    spdlog::info("[CopyService] Copying {} of {} files ({}, {})",
                 eligible.size(), files.size(), result.strategy, options.storage.description);

    std::size_t done = 0;
    auto finish = [&](std::size_t index, Attempt& attempt) {
        result.files[index] = attempt.file;
        if (attempt.file.copied()) {
            ++result.total_copied;
            result.total_bytes += attempt.bytes;
        }
        if (attempt.file.retry_count > 0) {
            ++result.total_retried;
        }
        ++done;
        if (options.on_progress) {
            options.on_progress(done, eligible.size(), result.total_bytes, attempt.file.filename());
        }
        if (options.on_file_complete) {
            options.on_file_complete(attempt.file);
        }
        record_outcome(attempt);
    };

    auto cancel_from = [&](std::size_t position) {
        for (std::size_t k = position; k < eligible.size(); ++k) {
            result.files[eligible[k]].copy_error = "Cancelled";
        }
        spdlog::info("[CopyService] Aborted; {} files cancelled", eligible.size() - position);
    };

    const std::size_t window = std::max<std::size_t>(1, options.storage.concurrency);

    if (window == 1) {
        for (std::size_t k = 0; k < eligible.size(); ++k) {
            if (options.abort.aborted()) {
                cancel_from(k);
                break;
            }
            if (k > 0 && options.storage.operation_delay.count() > 0) {
                std::this_thread::sleep_for(options.storage.operation_delay);
            }

            Attempt attempt = attempt_copy(files[eligible[k]], options.storage, options.trace_parent);
            finish(eligible[k], attempt);
        }
    } else {
        boost::asio::thread_pool pool(window);

        for (std::size_t k = 0; k < eligible.size(); k += window) {
            if (options.abort.aborted()) {
                cancel_from(k);
                break;
            }
            if (k > 0 && options.storage.operation_delay.count() > 0) {
                std::this_thread::sleep_for(options.storage.operation_delay);
            }

            const std::size_t end = std::min(eligible.size(), k + window);
            std::vector<std::future<Attempt>> pending;
            for (std::size_t j = k; j < end; ++j) {
                auto task = std::make_shared<std::packaged_task<Attempt()>>(
                    [this, &file = files[eligible[j]], &options]() {
                        return attempt_copy(file, options.storage, options.trace_parent);
                    });
                pending.push_back(task->get_future());
                boost::asio::post(pool, [task]() { (*task)(); });
            }

            // Outcomes are recorded in array order so the error counter sees
            // the same sequence as a sequential run.
            std::vector<Attempt> attempts;
            attempts.reserve(pending.size());
            for (auto& future : pending) {
                attempts.push_back(future.get());
            }
            for (std::size_t j = k; j < end; ++j) {
                finish(eligible[j], attempts[j - k]);
            }
        }

        pool.join();
    }

    for (const auto& file : result.files) {
        if (file.copy_error && !file.hashed.is_duplicate) {
            ++result.total_errors;
        }
    }

    result.copy_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    spdlog::info("[CopyService] Completed: {} files, {} bytes in {}ms ({} errors, {} retried)",
                 result.total_copied, result.total_bytes, result.copy_time_ms,
                 result.total_errors, result.total_retried);
    return result;
}

IoResult<void> CopyService::rollback(const fs::path& archive_path) {
    auto removed = ops_.remove(archive_path);
    if (removed.is_error()) {
        spdlog::error("[CopyService] Rollback of {} failed: {}", archive_path.string(), removed.error().message);
        return removed;
    }
    spdlog::info("[CopyService] Rolled back {}", archive_path.string());
    if (instruments_.metrics != nullptr) {
        instruments_.metrics->increment(monitoring::metric::kFileRollbacks);
    }
    return removed;
}

CopyService::Attempt CopyService::attempt_copy(const HashedFile& file,
                                               const StorageConfig& storage,
                                               const std::optional<monitoring::TraceContext>& trace_parent) {
    Attempt attempt;
    attempt.file.hashed = file;
    attempt.file.category = to_string(file.scanned.type);

    std::optional<monitoring::SpanHandle> span;
    if (instruments_.tracer != nullptr && trace_parent) {
        span = instruments_.tracer->start_child_span(monitoring::span::kFileCopy, *trace_parent,
                                                     {{"file_id", file.id()}, {"filename", file.filename()}});
    }
    const auto started = std::chrono::steady_clock::now();

    for (std::size_t attempt_index = 0;; ++attempt_index) {
        fs::path archive_path;
        std::string hash;
        auto copied = copy_once(file, storage, archive_path, hash);

        if (copied.is_ok()) {
            attempt.file.hashed.hash = hash;
            attempt.file.archive_path = archive_path;
            attempt.file.bucket = hash.substr(0, std::min<std::size_t>(2, hash.size()));
            attempt.file.copy_error.reset();
            attempt.file.retry_count = static_cast<std::uint32_t>(attempt_index);
            attempt.bytes = copied.value().bytes_copied;
            attempt.retryable_failure = false;
            break;
        }

        const auto& error = copied.error();
        const bool retryable = is_retryable(error.code);
        attempt.file.retry_count = static_cast<std::uint32_t>(attempt_index);

        if (!retryable || attempt_index >= policy_.retry.max_retries) {
            attempt.file.copy_error = error.message;
            attempt.retryable_failure = retryable;
            spdlog::error("[CopyService] Failed {} after {} attempt(s): {}",
                          file.filename(), attempt_index + 1, error.message);
            break;
        }

        const auto delay = policy_.retry.delay_for(attempt_index);
        spdlog::warn("[CopyService] Network error on {}, retry {}/{} after {}ms: {}",
                     file.filename(), attempt_index + 1, policy_.retry.max_retries, delay.count(), error.message);
        if (span) {
            span->log("retry", {{"attempt", attempt_index + 1}, {"error", error.message}});
        }
        if (instruments_.metrics != nullptr) {
            instruments_.metrics->increment(monitoring::metric::kFileCopyRetries);
        }
        std::this_thread::sleep_for(delay);
    }

    const bool ok = attempt.file.copied();
    if (instruments_.metrics != nullptr) {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        instruments_.metrics->histogram(monitoring::metric::kFileCopyDuration, elapsed,
                                        {{"result", ok ? "success" : "error"}});
        if (ok) {
            instruments_.metrics->histogram(monitoring::metric::kFileSize, static_cast<double>(attempt.bytes));
        }
    }
    if (span) {
        span->end(ok ? monitoring::SpanStatus::Success : monitoring::SpanStatus::Error,
                  {{"retry_count", attempt.file.retry_count}, {"bytes", attempt.bytes}});
    }
    return attempt;
}

IoResult<CopyStats> CopyService::copy_once(const HashedFile& file,
                                           const StorageConfig& storage,
                                           fs::path& archive_path,
                                           std::string& hash) {
    const fs::path staging = staging_dir();
    if (auto created = ops_.create_directories(staging); created.is_error()) {
        return Err<CopyStats>(created.error());
    }

    // Process-wide so a retry never reuses the name of an abandoned, still running copy.
    static std::atomic<std::uint64_t> temp_counter{0};
    const fs::path temp = staging / (file.id() + "-" + std::to_string(temp_counter++) + ".tmp");
    const bool inline_hash = !file.hash.has_value();
    const std::size_t buffer_size = storage.buffer_size;
    FileOperations& ops = ops_;

    auto copied = runner_.run<CopyStats>(
        [&ops, source = file.scanned.source_path, temp, buffer_size, inline_hash]() {
            return ops.copy_file(source, temp, buffer_size, inline_hash);
        },
        policy_.timeout,
        [&ops, temp]() {
            auto removed = ops.remove(temp);
            if (removed.is_error()) {
                spdlog::warn("[CopyService] Could not remove abandoned temp {}: {}", temp.string(), removed.error().message);
            }
        });

    auto discard_temp = [&]() {
        auto removed = ops_.remove(temp);
        if (removed.is_error()) {
            spdlog::warn("[CopyService] Could not remove temp {}: {}", temp.string(), removed.error().message);
        }
    };

    if (copied.is_error()) {
        if (copied.error().code != std::errc::timed_out) {
            discard_temp();
        }
        return copied;
    }

    if (inline_hash) {
        if (!copied.value().hash) {
            discard_temp();
            return Err<CopyStats>(IoError{std::make_error_code(std::errc::io_error),
                                          "Inline hash missing for " + file.filename()});
        }
        hash = *copied.value().hash;
    } else {
        hash = *file.hash;
    }

    archive_path = destination_for(hash, file.scanned.type, file.scanned.extension);
    if (auto created = ops_.create_directories(archive_path.parent_path()); created.is_error()) {
        discard_temp();
        return Err<CopyStats>(created.error());
    }
    if (auto moved = ops_.rename(temp, archive_path); moved.is_error()) {
        discard_temp();
        return Err<CopyStats>(moved.error());
    }
    return copied;
}

void CopyService::record_outcome(const Attempt& attempt) {
    if (attempt.file.copied()) {
        tracker_.record_success();
        return;
    }
    if (!attempt.retryable_failure) {
        tracker_.record_non_network();
        return;
    }

    if (instruments_.metrics != nullptr) {
        instruments_.metrics->increment(monitoring::metric::kErrorsNetwork);
    }
    tracker_.record_network_error(attempt.file.copy_error.value_or("unknown error"));
}

} // namespace ingest::import
