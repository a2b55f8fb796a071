#include "ingest/import/orchestrator.hpp"

#include "ingest/events/events.hpp"
#include "ingest/import/finalizer.hpp"
#include "ingest/import/scanner.hpp"
#include "ingest/monitoring/metric_names.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace ingest::import {
namespace fs = std::filesystem;
namespace metric = monitoring::metric;
namespace span = monitoring::span;

struct Orchestrator::Run {
    Run(ImportSession s, ImportOptions o)
        : session(std::move(s)), options(std::move(o)), progress(session.session_id()) {}

    ImportSession session;
    ImportOptions options;
    ProgressTracker progress;
    StorageConfig storage;
    bool defer_hashing = false;
    std::optional<monitoring::SpanHandle> root;
    std::size_t duplicates = 0;
    std::size_t errors = 0;
};

namespace {

void throw_if_aborted(const AbortToken& abort) {
    if (abort.aborted()) {
        throw std::runtime_error("Import cancelled");
    }
}

std::size_t count_duplicates(const std::vector<CopiedFile>& files) {
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(),
        [](const CopiedFile& file) { return file.hashed.is_duplicate; }));
}

} // namespace

Orchestrator::Orchestrator(OrchestratorConfig config,
                           FileOperations& ops,
                           SessionStore& store,
                           CatalogWriter& catalog,
                           const DuplicateIndex* duplicates,
                           events::EventBus& bus,
                           monitoring::Instruments instruments)
    : config_(std::move(config)),
      ops_(ops),
      store_(store),
      catalog_(catalog),
      duplicates_(duplicates),
      bus_(bus),
      instruments_(instruments),
      runner_(std::max<std::size_t>(1, config_.io_threads)) {}

Orchestrator::~Orchestrator() {
    std::map<std::string, Job> jobs;
    {
        std::lock_guard lock(mutex_);
        jobs.swap(jobs_);
    }
    for (auto& [id, job] : jobs) {
        if (job.thread.joinable()) {
            job.thread.join();
        }
    }
}

std::string Orchestrator::generate_session_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream out;
    out << "import-" << ms << "-" << std::hex << std::setw(4) << std::setfill('0') << (rng() & 0xffff);
    return out.str();
}

// ════════════════════════════════════════════════════════
// Entry points
// ════════════════════════════════════════════════════════

std::string Orchestrator::start_import(ImportOptions options) {
    ImportSession session(generate_session_id(), options.source_paths, options.archive_root);
    return launch(std::move(session), std::move(options));
}

Result<std::string> Orchestrator::resume_import(const std::string& session_id, ImportOptions options) {
    auto prepared = prepare_resume(session_id);
    if (prepared.is_error()) {
        return Err<std::string>(prepared.error());
    }
    return Ok(launch(prepared.take(), std::move(options)));
}

ImportResult Orchestrator::run(ImportOptions options) {
    ImportSession session(generate_session_id(), options.source_paths, options.archive_root);
    set_status(session.session_id(), session.status());
    return execute(std::move(session), std::move(options));
}

Result<ImportResult> Orchestrator::resume(const std::string& session_id, ImportOptions options) {
    auto prepared = prepare_resume(session_id);
    if (prepared.is_error()) {
        return Err<ImportResult>(prepared.error());
    }
    return Ok(execute(prepared.take(), std::move(options)));
}

Result<ImportSession> Orchestrator::prepare_resume(const std::string& session_id) {
    auto loaded = store_.load(session_id);
    if (loaded.is_error()) {
        return Err<ImportSession>(loaded.error());
    }

    ImportSession session(loaded.take());
    if (auto resumed = session.resume(); resumed.is_error()) {
        return Err<ImportSession>("Session " + session_id + " cannot be resumed: " + resumed.error());
    }

    spdlog::info("[Orchestrator] Resuming {} at step {}", session_id, session.info().last_step + 1);
    set_status(session_id, session.status());
    return Ok(std::move(session));
}

std::string Orchestrator::launch(ImportSession session, ImportOptions options) {
    const std::string id = session.session_id();
    set_status(id, session.status());

    Job previous;
    {
        std::lock_guard lock(mutex_);
        if (auto it = jobs_.find(id); it != jobs_.end()) {
            previous = std::move(it->second);
            jobs_.erase(it);
        }
    }
    if (previous.thread.joinable()) {
        previous.thread.join();
    }

    auto task = std::make_shared<std::packaged_task<ImportResult()>>(
        [this, session = std::move(session), options = std::move(options)]() mutable {
            return execute(std::move(session), std::move(options));
        });

    Job job;
    job.result = task->get_future();
    job.thread = std::thread([task]() { (*task)(); });

    std::lock_guard lock(mutex_);
    jobs_[id] = std::move(job);
    return id;
}

Result<ImportResult> Orchestrator::wait(const std::string& session_id) {
    Job job;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(session_id);
        if (it == jobs_.end()) {
            return Err<ImportResult>(std::string("No background import: " + session_id));
        }
        job = std::move(it->second);
        jobs_.erase(it);
    }

    if (job.thread.joinable()) {
        job.thread.join();
    }
    return Ok(job.result.get());
}

std::optional<ImportStatus> Orchestrator::status(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto it = statuses_.find(session_id);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ImportSessionInfo> Orchestrator::resumable_sessions() const {
    return store_.list_resumable();
}

// ════════════════════════════════════════════════════════
// Pipeline
// ════════════════════════════════════════════════════════

template<typename Fn>
auto Orchestrator::run_step(Run& run, const char* operation, const char* duration_metric, Fn&& fn) {
    const auto started = std::chrono::steady_clock::now();
    auto record_duration = [this, started, duration_metric]() {
        if (instruments_.metrics != nullptr) {
            instruments_.metrics->histogram(duration_metric,
                std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
        }
    };

    if (instruments_.tracer != nullptr && run.root) {
        auto result = instruments_.tracer->trace_child(
            operation, run.root->context(),
            [&fn](monitoring::SpanHandle& step_span) {
                return fn(std::optional<monitoring::TraceContext>(step_span.context()));
            },
            {{"session_id", run.session.session_id()}});
        record_duration();
        return result;
    }

    auto result = fn(std::optional<monitoring::TraceContext>{});
    record_duration();
    return result;
}

ImportResult Orchestrator::execute(ImportSession session, ImportOptions options) {
    const auto started = std::chrono::steady_clock::now();
    options.source_paths = session.info().source_paths;
    options.archive_root = session.info().archive_root;

    Run run(std::move(session), std::move(options));
    const std::string id = run.session.session_id();

    ++active_;
    if (instruments_.metrics != nullptr) {
        instruments_.metrics->increment(metric::kImportStarted);
        instruments_.metrics->gauge(metric::kImportActive, active_.load());
    }
    if (instruments_.tracer != nullptr) {
        run.root = instruments_.tracer->start_span(span::kImportSession,
            {{"session_id", id}, {"sources", run.options.source_paths.size()}});
    }

    auto fail = [&run, &id](const std::string& message) {
        if (auto failed = run.session.mark_failed(message); failed.is_error()) {
            spdlog::error("[Orchestrator] Cannot mark {} failed: {}", id, failed.error());
        }
    };

    std::optional<FinalizationResult> finalized;
    try {
        if (run.session.status() == ImportStatus::Pending) {
            if (auto begun = run.session.start(); begun.is_error()) {
                throw std::logic_error(begun.error());
            }
            set_status(id, run.session.status());
            persist(run.session);
        }
        if (run.options.archive_root.empty()) {
            throw std::invalid_argument("Archive root is not set");
        }

        run.storage = run.options.storage
            ? *run.options.storage
            : classifier_.config_for_paths(run.options.source_paths);
        run.defer_hashing = run.storage.type == StorageType::Network;
        spdlog::info("[Orchestrator] Session {}: {} source(s) -> {} ({})",
                     id, run.options.source_paths.size(), run.options.archive_root, run.storage.description);

        Hasher hasher(ops_, runner_, duplicates_, config_.hash_timeout, instruments_);
        CopyService copier(ops_, runner_, run.options.archive_root, config_.copy_policy, instruments_);
        ValidatorService validator(ops_, runner_, config_.validation_policy, instruments_);

        // Steps with a stored result were completed by an earlier run.
        const ScanResult scanned = run.session.info().scan_result
            ? *run.session.info().scan_result
            : scan_step(run);
        run.progress.set_totals(scanned.total_files, scanned.total_bytes);
        throw_if_aborted(run.options.abort);

        const HashResult hashed = run.session.info().hash_result
            ? *run.session.info().hash_result
            : hash_step(run, hasher, scanned, run.defer_hashing);
        run.duplicates = hashed.total_duplicates;
        throw_if_aborted(run.options.abort);

        const CopyResult copied = run.session.info().copy_result
            ? *run.session.info().copy_result
            : copy_step(run, copier, hasher, hashed);
        run.duplicates = count_duplicates(copied.files);
        run.errors += copied.total_errors;
        throw_if_aborted(run.options.abort);

        const ValidationResult validated = run.session.info().validation_result
            ? *run.session.info().validation_result
            : validate_step(run, validator, copied);
        run.errors += validated.total_invalid;
        throw_if_aborted(run.options.abort);

        finalized = finalize_step(run, validated);
        run.errors += finalized->total_errors;

        run.session.update_counters(finalized->total_finalized, copied.total_bytes, run.duplicates, run.errors);
        if (auto done = run.session.mark_completed(); done.is_error()) {
            throw std::logic_error(done.error());
        }
        report(run, kTotalSteps, finalized->total_finalized, finalized->total_finalized);

        if (instruments_.metrics != nullptr) {
            instruments_.metrics->increment(metric::kImportCompleted);
            instruments_.metrics->increment(metric::kImportFilesDuplicates, static_cast<double>(run.duplicates));
            instruments_.metrics->increment(metric::kImportFilesErrors, static_cast<double>(run.errors));
        }
        spdlog::info("[Orchestrator] Session {} completed: {} imported, {} duplicates, {} errors",
                     id, finalized->total_finalized, run.duplicates, run.errors);
    } catch (const NetworkFailureError& e) {
        const std::string reason = "network unavailable, resumable: " + e.last_error();
        if (auto paused = run.session.pause(reason); paused.is_error()) {
            spdlog::error("[Orchestrator] Cannot pause {}: {}", id, paused.error());
            fail(reason);
        } else {
            spdlog::warn("[Orchestrator] Session {} paused after {} consecutive network errors: {}",
                         id, e.consecutive_errors(), e.last_error());
            if (instruments_.metrics != nullptr) {
                instruments_.metrics->increment(metric::kImportPaused);
            }
            bus_.emit(events::ImportPausedEvent{id, run.session.info().last_step, reason});
        }
    } catch (const std::exception& e) {
        if (run.options.abort.aborted()) {
            if (auto cancelled = run.session.cancel(); cancelled.is_error()) {
                spdlog::error("[Orchestrator] Cannot cancel {}: {}", id, cancelled.error());
            }
            spdlog::warn("[Orchestrator] Session {} cancelled", id);
            if (instruments_.metrics != nullptr) {
                instruments_.metrics->increment(metric::kImportCancelled);
            }
        } else {
            fail(e.what());
            spdlog::error("[Orchestrator] Session {} failed at step {}: {}",
                          id, run.session.info().last_step + 1, e.what());
            if (instruments_.metrics != nullptr) {
                instruments_.metrics->increment(metric::kImportFailed);
                instruments_.metrics->increment(metric::kErrorsCount, 1.0,
                                                {{"component", "orchestrator"}, {"type", "import_failure"}});
            }
        }
    }

    const auto& info = run.session.info();
    set_status(id, info.status);
    persist(run.session);
    if (info.status != ImportStatus::Completed) {
        report(run, info.last_step + 1, 0, 1);
    }

    const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    --active_;
    if (instruments_.metrics != nullptr) {
        instruments_.metrics->gauge(metric::kImportActive, active_.load());
        instruments_.metrics->histogram(metric::kImportDuration, static_cast<double>(duration_ms));
        if (info.copy_result && info.copy_result->total_bytes > 0 && duration_ms > 0) {
            const double mb = static_cast<double>(info.copy_result->total_bytes) / (1024.0 * 1024.0);
            instruments_.metrics->gauge(metric::kImportThroughputMbps, mb / (static_cast<double>(duration_ms) / 1000.0));
        }
    }

    if (run.root) {
        if (info.status == ImportStatus::Completed) {
            run.root->end(monitoring::SpanStatus::Success,
                          {{"imported", finalized ? finalized->total_finalized : 0},
                           {"duplicates", run.duplicates}});
        } else {
            run.root->log("Import error", {{"error", info.error}, {"step", info.last_step + 1}});
            run.root->end(monitoring::SpanStatus::Error,
                          {{"status", to_string(info.status)}, {"error", info.error}});
        }
    }

    ImportResult result;
    result.session_id = id;
    result.status = info.status;
    result.scan_result = info.scan_result;
    result.hash_result = info.hash_result;
    result.copy_result = info.copy_result;
    result.validation_result = info.validation_result;
    result.finalization_result = finalized;
    result.error = info.status == ImportStatus::Cancelled ? "Import cancelled" : info.error;
    result.total_duration_ms = duration_ms;

    result.completion.session_id = id;
    result.completion.status = info.status;
    result.completion.total_imported = finalized ? finalized->total_finalized : 0;
    result.completion.total_duplicates = run.duplicates;
    result.completion.total_errors = run.errors;
    result.completion.total_duration_ms = duration_ms;

    bus_.emit(events::ImportCompletedEvent{result.completion});
    return result;
}

ScanResult Orchestrator::scan_step(Run& run) {
    enter(run, ImportStatus::Scanning);
    report(run, 1, 0, 1);

    ScanResult result = run_step(run, span::kImportScan, metric::kImportScanDuration,
        [this, &run](const std::optional<monitoring::TraceContext>&) {
            std::vector<fs::path> sources(run.options.source_paths.begin(), run.options.source_paths.end());
            Scanner::Options options;
            options.abort = run.options.abort;
            options.on_progress = [this, &run](std::size_t, const std::string& current) {
                report(run, 1, 0, 1, current);
            };
            return Scanner().scan(sources, run.session.session_id(), options);
        });

    if (instruments_.metrics != nullptr) {
        instruments_.metrics->increment(metric::kImportFilesScanned, static_cast<double>(result.total_files));
    }
    spdlog::info("[Orchestrator] Scan found {} files ({} bytes)", result.total_files, result.total_bytes);

    run.session.record_scan(result);
    run.session.complete_step(1);
    persist(run.session);
    return result;
}

HashResult Orchestrator::hash_step(Run& run, Hasher& hasher, const ScanResult& scanned, bool defer_hashing) {
    enter(run, ImportStatus::Hashing);
    report(run, 2, 0, scanned.files.size());

    HashResult result = run_step(run, span::kImportHash, metric::kImportHashDuration,
        [this, &run, &hasher, &scanned, defer_hashing](const std::optional<monitoring::TraceContext>&) {
            HashOptions options;
            options.defer_hashing = defer_hashing;
            options.buffer_size = run.storage.buffer_size;
            options.abort = run.options.abort;
            options.on_progress = [this, &run](std::size_t done, std::size_t total, const std::string& current) {
                report(run, 2, done, total, current);
            };
            return hasher.hash_batch(scanned.files, options);
        });

    if (defer_hashing) {
        spdlog::info("[Orchestrator] Network source: hashing deferred to the copy step");
    }

    run.session.record_hash(result);
    run.session.complete_step(2);
    persist(run.session);
    return result;
}

CopyResult Orchestrator::copy_step(Run& run, CopyService& copier, const Hasher& hasher, const HashResult& hashed) {
    enter(run, ImportStatus::Copying);
    const std::string& id = run.session.session_id();

    std::unordered_map<std::string, CopiedFile> carried;
    std::uint64_t carried_bytes = 0;
    for (const auto& file : run.session.info().partial_copies) {
        if (file.copied() && carried.emplace(file.id(), file).second) {
            carried_bytes += file.hashed.scanned.size;
        }
    }

    std::vector<HashedFile> pending;
    for (const auto& file : hashed.files) {
        if (carried.find(file.id()) == carried.end()) {
            pending.push_back(file);
        }
    }
    if (!carried.empty()) {
        spdlog::info("[Orchestrator] Resuming copy: {} already archived, {} remaining", carried.size(), pending.size());
    }
    report(run, 3, carried.size(), hashed.files.size());

    CopyResult result = run_step(run, span::kImportCopy, metric::kImportCopyDuration,
        [&](const std::optional<monitoring::TraceContext>& parent) {
            CopyOptions options;
            options.storage = run.storage;
            options.abort = run.options.abort;
            options.trace_parent = parent;
            options.on_progress = [&](std::size_t done, std::size_t total, std::uint64_t bytes, const std::string& current) {
                report(run, 3, done + carried.size(), total + carried.size(), current, bytes + carried_bytes);
            };
            options.on_file_complete = [&](const CopiedFile& file) {
                run.session.add_partial_copy(file);
                bus_.emit(events::FileCopiedEvent{id, file.id(), file.filename(),
                                                  file.copied() ? file.hashed.scanned.size : 0,
                                                  file.retry_count, file.copied(),
                                                  file.copy_error.value_or("")});
            };
            return copier.copy_batch(pending, options);
        });

    if (!carried.empty()) {
        std::vector<CopiedFile> merged;
        merged.reserve(hashed.files.size());
        std::size_t next = 0;
        for (const auto& file : hashed.files) {
            auto it = carried.find(file.id());
            if (it == carried.end()) {
                merged.push_back(std::move(result.files[next++]));
                continue;
            }
            ++result.total_copied;
            result.total_bytes += it->second.hashed.scanned.size;
            if (it->second.retry_count > 0) {
                ++result.total_retried;
            }
            merged.push_back(it->second);
        }
        result.files = std::move(merged);
    }

    if (run.defer_hashing) {
        const auto removed = remove_post_copy_duplicates(run, result.files, copier, hasher);
        if (removed > 0) {
            result.total_copied = 0;
            result.total_bytes = 0;
            for (const auto& file : result.files) {
                if (file.copied()) {
                    ++result.total_copied;
                    result.total_bytes += file.hashed.scanned.size;
                }
            }
        }
        spdlog::info("[Orchestrator] Post-copy duplicate detection removed {} files", removed);
    }

    if (instruments_.metrics != nullptr) {
        instruments_.metrics->increment(metric::kImportBytesProcessed, static_cast<double>(result.total_bytes));
    }

    run.session.record_copy(result);
    run.session.complete_step(3);
    persist(run.session);
    return result;
}

std::size_t Orchestrator::remove_post_copy_duplicates(Run& run,
                                                      std::vector<CopiedFile>& files,
                                                      CopyService& copier,
                                                      const Hasher& hasher) {
    std::vector<HashedFile> hashed;
    hashed.reserve(files.size());
    for (const auto& file : files) {
        hashed.push_back(file.hashed);
    }
    if (hasher.mark_duplicates(hashed) == 0) {
        return 0;
    }

    // Identical content shares one destination; only remove paths no kept file uses.
    std::unordered_set<std::string> kept_paths;
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (files[i].copied() && !hashed[i].is_duplicate) {
            kept_paths.insert(files[i].archive_path->string());
        }
    }

    std::size_t removed = 0;
    for (std::size_t i = 0; i < files.size(); ++i) {
        auto& file = files[i];
        if (file.hashed.is_duplicate || !hashed[i].is_duplicate || !file.copied()) {
            continue;
        }

        const std::string path = file.archive_path->string();
        const bool shared = kept_paths.count(path) > 0 || hashed[i].duplicate_in == path;
        if (!shared) {
            if (auto rolled = copier.rollback(*file.archive_path); rolled.is_error()) {
                spdlog::warn("[Orchestrator] Could not remove duplicate {}: {}", path, rolled.error().message);
            }
        }

        spdlog::debug("[Orchestrator] {} duplicates {}", file.filename(), hashed[i].duplicate_in.value_or(""));
        file.hashed = hashed[i];
        file.archive_path.reset();
        file.copy_error = "Duplicate";
        ++removed;
    }

    run.duplicates += removed;
    return removed;
}

ValidationResult Orchestrator::validate_step(Run& run, ValidatorService& validator, const CopyResult& copied) {
    enter(run, ImportStatus::Validating);
    const std::string& id = run.session.session_id();

    std::unordered_map<std::string, ValidatedFile> carried;
    for (const auto& file : run.session.info().partial_validations) {
        if (file.is_valid || file.rolled_back) {
            carried.emplace(file.id(), file);
        }
    }

    std::vector<CopiedFile> pending;
    for (const auto& file : copied.files) {
        if (carried.find(file.id()) == carried.end()) {
            pending.push_back(file);
        }
    }
    if (!carried.empty()) {
        spdlog::info("[Orchestrator] Resuming validation: {} already settled, {} remaining",
                     carried.size(), pending.size());
    }
    report(run, 4, carried.size(), copied.files.size());

    ValidationResult result = run_step(run, span::kImportValidate, metric::kImportValidateDuration,
        [&](const std::optional<monitoring::TraceContext>& parent) {
            ValidateOptions options;
            options.auto_rollback = config_.auto_rollback;
            options.buffer_size = run.storage.buffer_size;
            options.abort = run.options.abort;
            options.trace_parent = parent;
            options.on_progress = [&](std::size_t done, std::size_t total, const std::string& current) {
                report(run, 4, done + carried.size(), total + carried.size(), current);
            };
            options.on_file_complete = [&](const ValidatedFile& file) {
                run.session.add_partial_validation(file);
                bus_.emit(events::FileValidatedEvent{id, file.id(), file.filename(), file.is_valid,
                                                     file.validation_error.value_or("")});
                if (file.rolled_back) {
                    bus_.emit(events::FileRolledBackEvent{id, file.id(),
                                                          file.copied.archive_path->string(),
                                                          file.validation_error.value_or("")});
                }
            };
            return validator.validate_batch(pending, options);
        });

    if (!carried.empty()) {
        std::vector<ValidatedFile> merged;
        merged.reserve(copied.files.size());
        std::size_t next = 0;
        for (const auto& file : copied.files) {
            auto it = carried.find(file.id());
            if (it == carried.end()) {
                merged.push_back(std::move(result.files[next++]));
                continue;
            }
            ++result.total_validated;
            if (it->second.is_valid) {
                ++result.total_valid;
            } else {
                ++result.total_invalid;
            }
            if (it->second.rolled_back) {
                ++result.total_rolled_back;
            }
            merged.push_back(it->second);
        }
        result.files = std::move(merged);
    }

    run.session.update_counters(result.total_valid, copied.total_bytes, run.duplicates, run.errors + result.total_invalid);
    run.session.record_validation(result);
    run.session.complete_step(4);
    persist(run.session);
    return result;
}

FinalizationResult Orchestrator::finalize_step(Run& run, const ValidationResult& validated) {
    enter(run, ImportStatus::Finalizing);
    report(run, 5, 0, validated.files.size());

    FinalizationResult result = run_step(run, span::kImportFinalize, metric::kImportFinalizeDuration,
        [this, &run, &validated](const std::optional<monitoring::TraceContext>&) {
            Finalizer finalizer(catalog_);
            return finalizer.finalize(validated.files, run.options.abort,
                [this, &run](std::size_t done, std::size_t total) {
                    report(run, 5, done, total);
                });
        });

    if (instruments_.metrics != nullptr) {
        instruments_.metrics->increment(metric::kImportFilesProcessed, static_cast<double>(result.total_finalized));
    }

    run.session.complete_step(5);
    return result;
}

// ════════════════════════════════════════════════════════
// Bookkeeping
// ════════════════════════════════════════════════════════

void Orchestrator::enter(Run& run, ImportStatus status) {
    if (auto moved = run.session.transition_to(status); moved.is_error()) {
        throw std::logic_error(moved.error());
    }
    set_status(run.session.session_id(), status);
    spdlog::debug("[Orchestrator] {} -> {}", run.session.session_id(), to_string(status));
}

void Orchestrator::report(Run& run, int step, std::size_t done, std::size_t total,
                          const std::string& current, std::uint64_t bytes) {
    run.progress.set_counts(run.duplicates, run.errors);
    const ImportProgress progress = run.progress.update(run.session.status(), step, done, total, current, bytes);

    if (run.options.on_progress) {
        run.options.on_progress(progress);
    }
    bus_.emit(events::ImportProgressEvent{progress});
}

void Orchestrator::persist(const ImportSession& session) {
    if (auto saved = store_.save(session.info()); saved.is_error()) {
        spdlog::error("[Orchestrator] Failed to persist session {}: {}", session.session_id(), saved.error());
    }
}

void Orchestrator::set_status(const std::string& session_id, ImportStatus status) {
    std::lock_guard lock(mutex_);
    statuses_[session_id] = status;
}

} // namespace ingest::import
