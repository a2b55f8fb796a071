#pragma once

#include "ingest/core/abort_token.hpp"
#include "ingest/core/io_error.hpp"
#include "ingest/import/file_operations.hpp"
#include "ingest/import/network_error_tracker.hpp"
#include "ingest/import/timeout_runner.hpp"
#include "ingest/import/types.hpp"
#include "ingest/monitoring/instruments.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ingest::import {

struct CopyOptions {
    StorageConfig storage;
    std::function<void(std::size_t done, std::size_t total, std::uint64_t bytes, const std::string& current)> on_progress;
    /// Called for every file that reached a terminal copy outcome, in array order.
    std::function<void(const CopiedFile&)> on_file_complete;
    AbortToken abort;
    std::optional<monitoring::TraceContext> trace_parent;
};

/**
 * @brief Copies hashed files into the content-addressed archive (step 3)
 *
 * Layout: <archive_root>/<category>/<hash[0:2]>/<hash>.<ext>
 *
 * Bytes are written to a unique temp file under <archive_root>/.staging and
 * renamed into place, so the archive never holds a partial file at its
 * final path. Transport errors are retried with the policy's backoff
 * schedule; each file that still fails on a transport error counts toward
 * the network abort threshold.
 *
 * THREAD SAFETY:
 * One batch at a time per instance. Parallel windows are internal.
 */
class CopyService {
public:
    CopyService(FileOperations& ops,
                TimeoutRunner& runner,
                std::filesystem::path archive_root,
                TransferPolicy policy = {},
                monitoring::Instruments instruments = {});

    /**
     * @brief Copies one file with retry and timeout
     *
     * THROWS: NetworkFailureError when this failure crosses the threshold
     */
    CopiedFile copy_file(const HashedFile& file, const StorageConfig& storage);

    /**
     * @brief Copies every eligible file of a batch
     *
     * Duplicates and files without a usable hash are carried through with
     * copy_error set. Files left when the abort flag is seen are marked
     * "Cancelled". Output preserves input order.
     *
     * THROWS: NetworkFailureError; files finished before it were already
     * reported through on_file_complete
     */
    CopyResult copy_batch(const std::vector<HashedFile>& files, const CopyOptions& options);

    /// Deletes an archived file.
    IoResult<void> rollback(const std::filesystem::path& archive_path);

    std::filesystem::path destination_for(const std::string& hash,
                                          FileType type,
                                          const std::string& extension) const;

    [[nodiscard]] const std::filesystem::path& archive_root() const noexcept { return archive_root_; }
    [[nodiscard]] std::filesystem::path staging_dir() const { return archive_root_ / ".staging"; }

    [[nodiscard]] std::size_t consecutive_errors() const noexcept { return tracker_.consecutive(); }
    void reset_error_counter() noexcept { tracker_.reset(); }

    /// Copy error for files the batch does not copy; nullopt when eligible.
    static std::optional<std::string> skip_reason(const HashedFile& file);

private:
    struct Attempt {
        CopiedFile file;
        std::uint64_t bytes = 0;
        bool retryable_failure = false;
    };

    Attempt attempt_copy(const HashedFile& file,
                         const StorageConfig& storage,
                         const std::optional<monitoring::TraceContext>& trace_parent);
    IoResult<CopyStats> copy_once(const HashedFile& file,
                                  const StorageConfig& storage,
                                  std::filesystem::path& archive_path,
                                  std::string& hash);
    void record_outcome(const Attempt& attempt);

    FileOperations& ops_;
    TimeoutRunner& runner_;
    std::filesystem::path archive_root_;
    TransferPolicy policy_;
    monitoring::Instruments instruments_;
    NetworkErrorTracker tracker_;
};

} // namespace ingest::import
