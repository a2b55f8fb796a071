#pragma once

/**
 * @file types.hpp
 * @brief Records that flow through the import pipeline
 *
 * Each stage wraps the previous stage's record instead of mutating it:
 *
 *   ScannedFile -> HashedFile -> CopiedFile -> ValidatedFile -> FinalizedFile
 *
 * so a batch stopped between two steps can be inspected exactly as the
 * last completed step left it.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ingest::import {

constexpr std::size_t kHashLength = 16;             ///< hex characters
constexpr std::size_t kNetworkAbortThreshold = 5;   ///< consecutive retryable failures
constexpr std::chrono::milliseconds kCopyTimeout{5 * 60 * 1000};
constexpr std::chrono::milliseconds kValidationTimeout{2 * 60 * 1000};
constexpr std::chrono::milliseconds kHashTimeout{2 * 60 * 1000};

enum class StorageType {
    Local,
    Network
};

/**
 * @brief I/O policy chosen from where a path lives
 */
struct StorageConfig {
    StorageType type = StorageType::Local;
    std::size_t buffer_size = 64 * 1024;
    std::size_t concurrency = 4;
    std::chrono::milliseconds operation_delay{0};
    std::string description;
};

enum class ImportStatus {
    Pending,
    Scanning,
    Hashing,
    Copying,
    Validating,
    Finalizing,
    Completed,
    Cancelled,
    Failed,
    Paused ///< Network failure; resumable
};

const char* to_string(ImportStatus status) noexcept;
std::optional<ImportStatus> import_status_from_string(const std::string& text);

enum class FileType {
    Video,
    Image,
    Audio,
    Sidecar,
    Document,
    Other
};

const char* to_string(FileType type) noexcept;
std::optional<FileType> file_type_from_string(const std::string& text);

/**
 * @brief Bounded retry schedule shared by copy and validation
 */
struct RetryConfig {
    std::size_t max_retries = 3;
    std::vector<std::chrono::milliseconds> delays{
        std::chrono::milliseconds{1000},
        std::chrono::milliseconds{3000},
        std::chrono::milliseconds{5000}};

    /// Delay before retry number attempt+1; reuses the last entry past the end.
    std::chrono::milliseconds delay_for(std::size_t attempt) const;
};

/**
 * @brief Retry, timeout and escalation knobs for one transfer service
 */
struct TransferPolicy {
    RetryConfig retry;
    std::size_t network_abort_threshold = kNetworkAbortThreshold;
    std::chrono::milliseconds timeout = kCopyTimeout;
};

// ════════════════════════════════════════════════════════
// Pipeline records
// ════════════════════════════════════════════════════════

struct ScannedFile {
    std::string id;
    std::string filename;
    std::filesystem::path source_path;
    std::string extension; ///< lower case, without the dot
    std::uint64_t size = 0;
    FileType type = FileType::Other;
    std::time_t modified_time = 0;
};

struct HashedFile {
    ScannedFile scanned;
    std::optional<std::string> hash;       ///< empty until computed (deferred for network sources)
    std::optional<std::string> hash_error;
    bool is_duplicate = false;
    std::optional<std::string> duplicate_in;

    const std::string& id() const noexcept { return scanned.id; }
    const std::string& filename() const noexcept { return scanned.filename; }
};

struct CopiedFile {
    HashedFile hashed;
    std::optional<std::filesystem::path> archive_path; ///< set iff copy_error is empty
    std::optional<std::string> copy_error;
    std::uint32_t retry_count = 0;
    std::string category; ///< top-level archive folder derived from the file type
    std::string bucket;   ///< first two hash characters

    const std::string& id() const noexcept { return hashed.id(); }
    const std::string& filename() const noexcept { return hashed.filename(); }
    bool copied() const noexcept { return archive_path.has_value() && !copy_error.has_value(); }
};

struct ValidatedFile {
    CopiedFile copied;
    bool is_valid = false;
    std::optional<std::string> validation_error;
    bool rolled_back = false;

    const std::string& id() const noexcept { return copied.id(); }
    const std::string& filename() const noexcept { return copied.filename(); }
};

struct FinalizedFile {
    ValidatedFile validated;
    std::optional<std::int64_t> record_id;
    std::time_t imported_at = 0;
    std::time_t source_modified_at = 0;

    const std::string& id() const noexcept { return validated.id(); }
};

// ════════════════════════════════════════════════════════
// Step summaries
// ════════════════════════════════════════════════════════

struct ScanResult {
    std::vector<ScannedFile> files;
    std::size_t total_files = 0;
    std::uint64_t total_bytes = 0;
    std::size_t video_files = 0;
    std::size_t image_files = 0;
    std::size_t audio_files = 0;
    std::size_t sidecar_files = 0;
};

struct HashResult {
    std::vector<HashedFile> files;
    std::size_t total_hashed = 0;
    std::size_t total_duplicates = 0;
    std::size_t total_errors = 0;
    std::int64_t hashing_time_ms = 0;
};

struct CopyResult {
    std::vector<CopiedFile> files;
    std::size_t total_copied = 0;
    std::uint64_t total_bytes = 0;
    std::size_t total_errors = 0;
    std::size_t total_retried = 0;
    std::int64_t copy_time_ms = 0;
    std::string strategy = "sequential";
};

struct ValidationResult {
    std::vector<ValidatedFile> files;
    std::size_t total_validated = 0;
    std::size_t total_valid = 0;
    std::size_t total_invalid = 0;
    std::size_t total_rolled_back = 0;
    std::size_t total_retried = 0;
    std::int64_t validation_time_ms = 0;
};

struct FinalizationResult {
    std::vector<FinalizedFile> files;
    std::size_t total_finalized = 0;
    std::size_t total_errors = 0;
    std::int64_t finalize_time_ms = 0;
};

// ════════════════════════════════════════════════════════
// Session and progress
// ════════════════════════════════════════════════════════

constexpr int kTotalSteps = 5;

struct ImportProgress {
    std::string session_id;
    ImportStatus status = ImportStatus::Pending;
    int step = 0;
    int total_steps = kTotalSteps;
    double percent = 0.0;
    std::string current_file;
    std::size_t files_processed = 0;
    std::size_t files_total = 0;
    std::uint64_t bytes_processed = 0;
    std::uint64_t bytes_total = 0;
    std::size_t duplicates_found = 0;
    std::size_t errors_found = 0;
    std::int64_t estimated_remaining_ms = 0;
};

struct ImportCompletion {
    std::string session_id;
    ImportStatus status = ImportStatus::Pending;
    std::size_t total_imported = 0;
    std::size_t total_duplicates = 0;
    std::size_t total_errors = 0;
    std::int64_t total_duration_ms = 0;
};

/**
 * @brief Persisted state of one batch run
 *
 * The optional step results are the resume points; the partial vectors hold
 * per-file outcomes of a step that was interrupted by a network pause.
 */
struct ImportSessionInfo {
    std::string session_id;
    ImportStatus status = ImportStatus::Pending;
    int last_step = 0;
    bool can_resume = false;
    std::vector<std::string> source_paths;
    std::string archive_root;
    std::size_t total_files = 0;
    std::size_t processed_files = 0;
    std::size_t duplicate_files = 0;
    std::size_t error_files = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t processed_bytes = 0;
    std::optional<ScanResult> scan_result;
    std::optional<HashResult> hash_result;
    std::optional<CopyResult> copy_result;
    std::optional<ValidationResult> validation_result;
    std::vector<CopiedFile> partial_copies;
    std::vector<ValidatedFile> partial_validations;
    std::string error;
    std::chrono::system_clock::time_point started_at{};
    std::optional<std::chrono::system_clock::time_point> completed_at;
};

struct ImportResult {
    std::string session_id;
    ImportStatus status = ImportStatus::Pending;
    std::optional<ScanResult> scan_result;
    std::optional<HashResult> hash_result;
    std::optional<CopyResult> copy_result;
    std::optional<ValidationResult> validation_result;
    std::optional<FinalizationResult> finalization_result;
    std::string error;
    std::int64_t total_duration_ms = 0;
    ImportCompletion completion;
};

} // namespace ingest::import
