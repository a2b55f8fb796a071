#include "ingest/import/hasher.hpp"

#include "ingest/monitoring/metric_names.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace ingest::import {

Hasher::Hasher(FileOperations& ops,
               TimeoutRunner& runner,
               const DuplicateIndex* index,
               std::chrono::milliseconds timeout,
               monitoring::Instruments instruments)
    : ops_(ops),
      runner_(runner),
      index_(index),
      timeout_(timeout),
      instruments_(instruments) {}

HashedFile Hasher::hash_file(const ScannedFile& file, std::size_t buffer_size) {
    HashedFile hashed;
    hashed.scanned = file;

    const auto started = std::chrono::steady_clock::now();
    FileOperations& ops = ops_;
    auto result = runner_.run<std::string>(
        [&ops, path = file.source_path, buffer_size]() { return ops.hash_file(path, buffer_size); },
        timeout_);

    if (result.is_ok()) {
        hashed.hash = result.take();
    } else {
        hashed.hash_error = result.error().message;
        spdlog::warn("[Hasher] Failed to hash {}: {}", file.filename, result.error().message);
    }

    if (instruments_.metrics != nullptr) {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        instruments_.metrics->histogram(monitoring::metric::kFileHashDuration, elapsed,
                                        {{"result", hashed.hash ? "success" : "error"}});
    }
    return hashed;
}

HashResult Hasher::hash_batch(const std::vector<ScannedFile>& files, const HashOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    HashResult result;
    result.files.reserve(files.size());

    for (std::size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];

        if (options.abort.aborted()) {
            HashedFile cancelled;
            cancelled.scanned = file;
            cancelled.hash_error = "Cancelled";
            result.files.push_back(std::move(cancelled));
            continue;
        }

        if (options.defer_hashing) {
            HashedFile deferred;
            deferred.scanned = file;
            result.files.push_back(std::move(deferred));
        } else {
            result.files.push_back(hash_file(file, options.buffer_size));
        }

        if (options.on_progress) {
            options.on_progress(i + 1, files.size(), file.filename);
        }
    }

    result.total_duplicates = mark_duplicates(result.files);
    for (const auto& file : result.files) {
        if (file.hash) {
            ++result.total_hashed;
        }
        if (file.hash_error) {
            ++result.total_errors;
        }
    }

    result.hashing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (options.defer_hashing) {
        spdlog::info("[Hasher] Deferred hashing of {} files to the copy step", files.size());
    } else {
        spdlog::info("[Hasher] Hashed {} files ({} duplicates, {} errors) in {}ms",
                     result.total_hashed, result.total_duplicates, result.total_errors, result.hashing_time_ms);
    }
    return result;
}

std::size_t Hasher::mark_duplicates(std::vector<HashedFile>& files) const {
    std::unordered_set<std::string> seen;
    std::size_t flagged = 0;

    for (auto& file : files) {
        if (!file.hash) {
            continue;
        }
        if (file.is_duplicate) {
            seen.insert(*file.hash);
            continue;
        }

        if (index_ != nullptr) {
            if (auto location = index_->find_by_hash(*file.hash)) {
                file.is_duplicate = true;
                file.duplicate_in = *location;
                ++flagged;
                continue;
            }
        }

        if (!seen.insert(*file.hash).second) {
            file.is_duplicate = true;
            file.duplicate_in = "batch";
            ++flagged;
        }
    }
    return flagged;
}

} // namespace ingest::import
