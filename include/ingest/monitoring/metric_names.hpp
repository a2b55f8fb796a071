#pragma once

namespace ingest::monitoring {

/**
 * @brief Standard metric names, dot separated domain.component.metric
 */
namespace metric {

// Import pipeline
inline constexpr const char* kImportStarted = "import.started";
inline constexpr const char* kImportCompleted = "import.completed";
inline constexpr const char* kImportFailed = "import.failed";
inline constexpr const char* kImportPaused = "import.paused";
inline constexpr const char* kImportCancelled = "import.cancelled";
inline constexpr const char* kImportFilesScanned = "import.files.scanned";
inline constexpr const char* kImportFilesProcessed = "import.files.processed";
inline constexpr const char* kImportFilesDuplicates = "import.files.duplicates";
inline constexpr const char* kImportFilesErrors = "import.files.errors";
inline constexpr const char* kImportBytesProcessed = "import.bytes.processed";
inline constexpr const char* kImportDuration = "import.duration";
inline constexpr const char* kImportThroughputMbps = "import.throughput.mbps";
inline constexpr const char* kImportActive = "import.active";
inline constexpr const char* kImportErrorRate = "import.error_rate";

// Per-step timing
inline constexpr const char* kImportScanDuration = "import.scan.duration";
inline constexpr const char* kImportHashDuration = "import.hash.duration";
inline constexpr const char* kImportCopyDuration = "import.copy.duration";
inline constexpr const char* kImportValidateDuration = "import.validate.duration";
inline constexpr const char* kImportFinalizeDuration = "import.finalize.duration";

// File operations
inline constexpr const char* kFileHashDuration = "file.hash.duration";
inline constexpr const char* kFileCopyDuration = "file.copy.duration";
inline constexpr const char* kFileCopyRetries = "file.copy.retries";
inline constexpr const char* kFileValidateDuration = "file.validate.duration";
inline constexpr const char* kFileRollbacks = "file.rollbacks";
inline constexpr const char* kFileSize = "file.size";

// Job queue
inline constexpr const char* kJobsEnqueued = "jobs.enqueued";
inline constexpr const char* kJobsCompleted = "jobs.completed";
inline constexpr const char* kJobsFailed = "jobs.failed";
inline constexpr const char* kJobsRetried = "jobs.retried";
inline constexpr const char* kJobsDead = "jobs.dead";
inline constexpr const char* kJobsDuration = "jobs.duration";
inline constexpr const char* kJobsQueueDepth = "jobs.queue.depth";
inline constexpr const char* kJobsQueueOldest = "jobs.queue.oldest";
inline constexpr const char* kJobsProcessing = "jobs.processing";

// Workers
inline constexpr const char* kWorkersActive = "workers.active";
inline constexpr const char* kWorkersIdle = "workers.idle";

// Resources
inline constexpr const char* kSystemDiskFree = "system.disk.free";
inline constexpr const char* kSystemDiskPercent = "system.disk.percent";

// Errors
inline constexpr const char* kErrorsCount = "errors.count";
inline constexpr const char* kErrorsRatePerMinute = "errors.rate_per_minute";
inline constexpr const char* kErrorsNetwork = "errors.network";
inline constexpr const char* kErrorsDiskFull = "errors.disk_full";
inline constexpr const char* kErrorsPermissionDenied = "errors.permission_denied";
inline constexpr const char* kErrorsHashMismatch = "errors.hash_mismatch";

} // namespace metric

/**
 * @brief Standard span operation names
 */
namespace span {

inline constexpr const char* kImportSession = "import.session";
inline constexpr const char* kImportScan = "import.scan";
inline constexpr const char* kImportHash = "import.hash";
inline constexpr const char* kImportCopy = "import.copy";
inline constexpr const char* kImportValidate = "import.validate";
inline constexpr const char* kImportFinalize = "import.finalize";
inline constexpr const char* kFileHash = "file.hash";
inline constexpr const char* kFileCopy = "file.copy";
inline constexpr const char* kFileValidate = "file.validate";
inline constexpr const char* kJobProcess = "job.process";

} // namespace span

} // namespace ingest::monitoring
