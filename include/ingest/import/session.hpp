#pragma once

#include "ingest/core/result.hpp"
#include "ingest/import/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace ingest::import {

/// Status entered while running the given 1-based step.
ImportStatus status_for_step(int step) noexcept;

/**
 * @brief State machine and snapshot holder for one import batch
 *
 * WHY: the orchestrator must never move a batch backwards or restart a
 * terminal one. Every status change goes through transition_to(), which
 * rejects illegal moves instead of silently applying them.
 *
 * WHAT:
 *   pending -> scanning -> hashing -> copying -> validating -> finalizing -> completed
 *   any active step -> paused (network failure, resumable)
 *   paused -> any step state (resume), cancelled, failed
 *   any non-terminal -> cancelled | failed
 *
 * completed, cancelled and failed are terminal.
 */
class ImportSession {
public:
    ImportSession(std::string session_id,
                  std::vector<std::string> source_paths,
                  std::string archive_root);

    /// Rebuilds a session from a persisted snapshot.
    explicit ImportSession(ImportSessionInfo info);

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] ImportStatus status() const noexcept { return info_.status; }
    [[nodiscard]] const ImportSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool can_resume() const noexcept { return info_.can_resume; }

    Result<void> start();
    Result<void> transition_to(ImportStatus next);

    /// Marks step 1..5 as complete; later resumes start after it.
    void complete_step(int step);

    /// Errors when no step is running.
    Result<void> pause(std::string error);

    /// Re-enters the first step that has not completed.
    Result<void> resume();

    Result<void> cancel();
    Result<void> mark_failed(std::string error);
    Result<void> mark_completed();

    void record_scan(ScanResult result);
    void record_hash(HashResult result);
    void record_copy(CopyResult result);
    void record_validation(ValidationResult result);

    void add_partial_copy(CopiedFile file);
    void add_partial_validation(ValidatedFile file);

    void update_counters(std::size_t processed_files,
                         std::uint64_t processed_bytes,
                         std::size_t duplicate_files,
                         std::size_t error_files);

    [[nodiscard]] static bool is_terminal(ImportStatus status) noexcept;
    [[nodiscard]] static bool is_step(ImportStatus status) noexcept;

private:
    [[nodiscard]] bool can_transition(ImportStatus target) const noexcept;

    ImportSessionInfo info_;
};

} // namespace ingest::import
