#pragma once

#include "ingest/core/abort_token.hpp"
#include "ingest/import/file_operations.hpp"
#include "ingest/import/network_error_tracker.hpp"
#include "ingest/import/timeout_runner.hpp"
#include "ingest/import/types.hpp"
#include "ingest/monitoring/instruments.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ingest::import {

struct ValidateOptions {
    bool auto_rollback = true;
    std::size_t buffer_size = 64 * 1024;
    std::function<void(std::size_t done, std::size_t total, const std::string& current)> on_progress;
    std::function<void(const ValidatedFile&)> on_file_complete;
    AbortToken abort;
    std::optional<monitoring::TraceContext> trace_parent;
};

/**
 * @brief Re-hashes archived copies and removes the ones that do not match (step 4)
 *
 * A file is valid only when the re-computed hash equals the recorded one.
 * Mismatches and re-hash failures roll the archive copy back unless
 * auto_rollback is off. A mismatch is corruption, not connectivity, so it
 * resets the network error count; a re-hash that keeps failing on a
 * transport error counts toward the threshold, and crossing it throws
 * before that file is rolled back.
 *
 * Files are always processed one at a time.
 */
class ValidatorService {
public:
    ValidatorService(FileOperations& ops,
                     TimeoutRunner& runner,
                     TransferPolicy policy = default_policy(),
                     monitoring::Instruments instruments = {});

    static TransferPolicy default_policy();

    /// THROWS: NetworkFailureError
    ValidatedFile validate(const CopiedFile& file, bool auto_rollback = true);

    /// THROWS: NetworkFailureError
    ValidationResult validate_batch(const std::vector<CopiedFile>& files, const ValidateOptions& options = {});

    [[nodiscard]] std::size_t consecutive_errors() const noexcept { return tracker_.consecutive(); }
    void reset_error_counter() noexcept { tracker_.reset(); }

private:
    enum class Outcome {
        Skipped,
        Valid,
        Mismatch,
        RehashFailed,
        RehashNetworkFailed
    };

    struct Check {
        ValidatedFile file;
        Outcome outcome = Outcome::Skipped;
        std::uint32_t retries = 0;
    };

    Check check(const CopiedFile& file,
                std::size_t buffer_size,
                const std::optional<monitoring::TraceContext>& trace_parent);
    void settle(Check& check, bool auto_rollback);
    void roll_back(ValidatedFile& file);

    FileOperations& ops_;
    TimeoutRunner& runner_;
    TransferPolicy policy_;
    monitoring::Instruments instruments_;
    NetworkErrorTracker tracker_;
};

} // namespace ingest::import
