#pragma once

#include "ingest/core/abort_token.hpp"
#include "ingest/import/catalog.hpp"
#include "ingest/import/file_operations.hpp"
#include "ingest/import/timeout_runner.hpp"
#include "ingest/import/types.hpp"
#include "ingest/monitoring/instruments.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace ingest::import {

struct HashOptions {
    /// Leave hashes empty; the copy step hashes inline (network sources).
    bool defer_hashing = false;
    std::size_t buffer_size = 64 * 1024;
    std::function<void(std::size_t done, std::size_t total, const std::string& current)> on_progress;
    AbortToken abort;
};

/**
 * @brief Computes content hashes and flags duplicates (step 2)
 *
 * A file whose hash cannot be computed keeps hash_error and stays in the
 * batch; it is never copied.
 */
class Hasher {
public:
    Hasher(FileOperations& ops,
           TimeoutRunner& runner,
           const DuplicateIndex* index = nullptr,
           std::chrono::milliseconds timeout = kHashTimeout,
           monitoring::Instruments instruments = {});

    HashedFile hash_file(const ScannedFile& file, std::size_t buffer_size);

    HashResult hash_batch(const std::vector<ScannedFile>& files, const HashOptions& options = {});

    /**
     * @brief Flags files whose content is already archived or repeated in the batch
     *
     * The first occurrence in array order is kept; later ones get
     * duplicate_in = "batch". Files already flagged are left alone.
     * Returns the number of newly flagged files.
     */
    std::size_t mark_duplicates(std::vector<HashedFile>& files) const;

private:
    FileOperations& ops_;
    TimeoutRunner& runner_;
    const DuplicateIndex* index_;
    std::chrono::milliseconds timeout_;
    monitoring::Instruments instruments_;
};

} // namespace ingest::import
