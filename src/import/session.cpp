#include "ingest/import/session.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace ingest::import {
namespace {

bool is_progressive(ImportStatus current, ImportStatus target) {
    static const std::map<ImportStatus, std::vector<ImportStatus>> transitions {
        {ImportStatus::Pending, {ImportStatus::Scanning}},
        {ImportStatus::Scanning, {ImportStatus::Hashing, ImportStatus::Paused}},
        {ImportStatus::Hashing, {ImportStatus::Copying, ImportStatus::Paused}},
        {ImportStatus::Copying, {ImportStatus::Validating, ImportStatus::Paused}},
        {ImportStatus::Validating, {ImportStatus::Finalizing, ImportStatus::Paused}},
        {ImportStatus::Finalizing, {ImportStatus::Completed, ImportStatus::Paused}},
        {ImportStatus::Paused, {ImportStatus::Scanning, ImportStatus::Hashing, ImportStatus::Copying,
                                ImportStatus::Validating, ImportStatus::Finalizing}},
    };

    if (target == ImportStatus::Failed || target == ImportStatus::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

ImportStatus status_for_step(int step) noexcept {
    switch (step) {
        case 1: return ImportStatus::Scanning;
        case 2: return ImportStatus::Hashing;
        case 3: return ImportStatus::Copying;
        case 4: return ImportStatus::Validating;
        case 5: return ImportStatus::Finalizing;
        default: return ImportStatus::Completed;
    }
}

ImportSession::ImportSession(std::string session_id,
                             std::vector<std::string> source_paths,
                             std::string archive_root) {
    info_.session_id = std::move(session_id);
    info_.source_paths = std::move(source_paths);
    info_.archive_root = std::move(archive_root);
    info_.status = ImportStatus::Pending;
}

ImportSession::ImportSession(ImportSessionInfo info) : info_(std::move(info)) {}

Result<void> ImportSession::start() {
    if (info_.status != ImportStatus::Pending) {
        return Err<void>(std::string("Session already started"));
    }
    info_.started_at = std::chrono::system_clock::now();
    return transition_to(ImportStatus::Scanning);
}

Result<void> ImportSession::transition_to(ImportStatus next) {
    if (info_.status == next) {
        return Ok();
    }

    if (!can_transition(next)) {
        return Err<void>(std::string("Illegal session state transition: ") +
                         to_string(info_.status) + " -> " + to_string(next));
    }

    info_.status = next;
    info_.can_resume = next == ImportStatus::Paused;
    if (is_terminal(next)) {
        info_.completed_at = std::chrono::system_clock::now();
    }
    if (is_step(next)) {
        info_.error.clear();
    }
    return Ok();
}

void ImportSession::complete_step(int step) {
    info_.last_step = std::max(info_.last_step, step);
}

Result<void> ImportSession::pause(std::string error) {
    if (!is_step(info_.status)) {
        return Err<void>(std::string("Only a running step can be paused"));
    }
    auto result = transition_to(ImportStatus::Paused);
    if (result.is_ok()) {
        info_.error = std::move(error);
    }
    return result;
}

Result<void> ImportSession::resume() {
    if (info_.status != ImportStatus::Paused) {
        return Err<void>(std::string("Only paused sessions can be resumed"));
    }
    return transition_to(status_for_step(info_.last_step + 1));
}

Result<void> ImportSession::cancel() {
    return transition_to(ImportStatus::Cancelled);
}

Result<void> ImportSession::mark_failed(std::string error) {
    auto result = transition_to(ImportStatus::Failed);
    if (result.is_ok()) {
        info_.error = std::move(error);
    }
    return result;
}

Result<void> ImportSession::mark_completed() {
    return transition_to(ImportStatus::Completed);
}

void ImportSession::record_scan(ScanResult result) {
    info_.total_files = result.total_files;
    info_.total_bytes = result.total_bytes;
    info_.scan_result = std::move(result);
}

void ImportSession::record_hash(HashResult result) {
    info_.duplicate_files = result.total_duplicates;
    info_.hash_result = std::move(result);
}

void ImportSession::record_copy(CopyResult result) {
    info_.copy_result = std::move(result);
    info_.partial_copies.clear();
}

void ImportSession::record_validation(ValidationResult result) {
    info_.validation_result = std::move(result);
    info_.partial_validations.clear();
}

void ImportSession::add_partial_copy(CopiedFile file) {
    info_.partial_copies.push_back(std::move(file));
}

void ImportSession::add_partial_validation(ValidatedFile file) {
    info_.partial_validations.push_back(std::move(file));
}

void ImportSession::update_counters(std::size_t processed_files,
                                    std::uint64_t processed_bytes,
                                    std::size_t duplicate_files,
                                    std::size_t error_files) {
    info_.processed_files = processed_files;
    info_.processed_bytes = processed_bytes;
    info_.duplicate_files = duplicate_files;
    info_.error_files = error_files;
}

bool ImportSession::is_terminal(ImportStatus status) noexcept {
    return status == ImportStatus::Completed ||
           status == ImportStatus::Cancelled ||
           status == ImportStatus::Failed;
}

bool ImportSession::is_step(ImportStatus status) noexcept {
    switch (status) {
        case ImportStatus::Scanning:
        case ImportStatus::Hashing:
        case ImportStatus::Copying:
        case ImportStatus::Validating:
        case ImportStatus::Finalizing:
            return true;
        default:
            return false;
    }
}

bool ImportSession::can_transition(ImportStatus target) const noexcept {
    if (info_.status == target) {
        return true;
    }

    if (is_terminal(info_.status)) {
        return false;
    }

    return is_progressive(info_.status, target);
}

} // namespace ingest::import
