#pragma once

/**
 * @file orchestrator.hpp
 * @brief Drives scan -> hash -> copy -> validate -> finalize over one batch
 *
 * WHY THIS FILE EXISTS:
 * Each service handles one step and knows nothing about the others. The
 * orchestrator chains them, keeps the session record current, persists it
 * after every step, and turns a NetworkFailureError into a paused session
 * that can be resumed later instead of a failed one.
 *
 * RESUME:
 * A paused session restarts at the first step without a stored result.
 * Inside the interrupted step, files that already succeeded (copied, or
 * validated/rolled back) are carried over and not touched again.
 *
 * THREADING:
 * start_import() and resume_import() run the pipeline on a dedicated
 * thread and return at once; run() and resume() block the caller.
 * All runs share one TimeoutRunner. A transfer that hangs past its timeout
 * keeps a worker busy but never holds up the pause; the orchestrator's
 * destructor is the only place that waits for it.
 */

#include "ingest/core/abort_token.hpp"
#include "ingest/core/result.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/import/catalog.hpp"
#include "ingest/import/copy_service.hpp"
#include "ingest/import/file_operations.hpp"
#include "ingest/import/hasher.hpp"
#include "ingest/import/progress.hpp"
#include "ingest/import/session.hpp"
#include "ingest/import/session_store.hpp"
#include "ingest/import/storage_classifier.hpp"
#include "ingest/import/timeout_runner.hpp"
#include "ingest/import/types.hpp"
#include "ingest/import/validator_service.hpp"
#include "ingest/monitoring/instruments.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ingest::import {

struct ImportOptions {
    std::vector<std::string> source_paths;
    std::string archive_root;
    std::function<void(const ImportProgress&)> on_progress;
    AbortToken abort;
    /// Replaces the policy the classifier would pick for the sources.
    std::optional<StorageConfig> storage;
};

struct OrchestratorConfig {
    TransferPolicy copy_policy;
    TransferPolicy validation_policy = ValidatorService::default_policy();
    std::chrono::milliseconds hash_timeout = kHashTimeout;
    bool auto_rollback = true;
    /// Workers racing I/O calls against their timeouts, shared by every run.
    std::size_t io_threads = 8;
};

class Orchestrator {
public:
    Orchestrator(OrchestratorConfig config,
                 FileOperations& ops,
                 SessionStore& store,
                 CatalogWriter& catalog,
                 const DuplicateIndex* duplicates,
                 events::EventBus& bus,
                 monitoring::Instruments instruments = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Returns the new session id immediately; the batch runs in the background.
    std::string start_import(ImportOptions options);

    /// Background resume of a paused session. Errors for unknown or non-paused sessions.
    Result<std::string> resume_import(const std::string& session_id, ImportOptions options);

    ImportResult run(ImportOptions options);
    Result<ImportResult> resume(const std::string& session_id, ImportOptions options);

    /// Blocks until a background batch finishes.
    Result<ImportResult> wait(const std::string& session_id);

    std::optional<ImportStatus> status(const std::string& session_id) const;
    std::vector<ImportSessionInfo> resumable_sessions() const;

    StorageClassifier& classifier() noexcept { return classifier_; }

    static std::string generate_session_id();

private:
    struct Run;

    Result<ImportSession> prepare_resume(const std::string& session_id);
    std::string launch(ImportSession session, ImportOptions options);

    ImportResult execute(ImportSession session, ImportOptions options);

    ScanResult scan_step(Run& run);
    HashResult hash_step(Run& run, Hasher& hasher, const ScanResult& scanned, bool defer_hashing);
    CopyResult copy_step(Run& run, CopyService& copier, const Hasher& hasher, const HashResult& hashed);
    ValidationResult validate_step(Run& run, ValidatorService& validator, const CopyResult& copied);
    FinalizationResult finalize_step(Run& run, const ValidationResult& validated);

    std::size_t remove_post_copy_duplicates(Run& run, std::vector<CopiedFile>& files,
                                            CopyService& copier, const Hasher& hasher);

    void enter(Run& run, ImportStatus status);
    void report(Run& run, int step, std::size_t done, std::size_t total,
                const std::string& current = {}, std::uint64_t bytes = 0);
    void persist(const ImportSession& session);
    void set_status(const std::string& session_id, ImportStatus status);

    template<typename Fn>
    auto run_step(Run& run, const char* operation, const char* duration_metric, Fn&& fn);

    OrchestratorConfig config_;
    FileOperations& ops_;
    SessionStore& store_;
    CatalogWriter& catalog_;
    const DuplicateIndex* duplicates_;
    events::EventBus& bus_;
    monitoring::Instruments instruments_;
    TimeoutRunner runner_;
    StorageClassifier classifier_;

    struct Job {
        std::thread thread;
        std::future<ImportResult> result;
    };

    mutable std::mutex mutex_;
    std::map<std::string, ImportStatus> statuses_;
    std::map<std::string, Job> jobs_;
    std::atomic<int> active_{0};
};

} // namespace ingest::import
