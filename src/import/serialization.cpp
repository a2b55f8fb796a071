#include "ingest/import/serialization.hpp"

#include <chrono>

namespace ingest::import {
namespace {

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json();
}

std::optional<std::string> read_optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

template<typename T, typename Fn>
json array_of(const std::vector<T>& items, Fn&& convert) {
    json arr = json::array();
    for (const auto& item : items) {
        arr.push_back(convert(item));
    }
    return arr;
}

template<typename T, typename Fn>
std::vector<T> vector_of(const json& j, const char* key, Fn&& convert) {
    std::vector<T> items;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return items;
    }
    for (const auto& entry : *it) {
        items.push_back(convert(entry));
    }
    return items;
}

json scan_result_to_json(const ScanResult& r) {
    json j;
    j["files"] = array_of(r.files, scanned_file_to_json);
    j["total_files"] = r.total_files;
    j["total_bytes"] = r.total_bytes;
    j["video_files"] = r.video_files;
    j["image_files"] = r.image_files;
    j["audio_files"] = r.audio_files;
    j["sidecar_files"] = r.sidecar_files;
    return j;
}

ScanResult scan_result_from_json(const json& j) {
    ScanResult r;
    r.files = vector_of<ScannedFile>(j, "files", scanned_file_from_json);
    r.total_files = j.value("total_files", r.files.size());
    r.total_bytes = j.value("total_bytes", std::uint64_t{0});
    r.video_files = j.value("video_files", std::size_t{0});
    r.image_files = j.value("image_files", std::size_t{0});
    r.audio_files = j.value("audio_files", std::size_t{0});
    r.sidecar_files = j.value("sidecar_files", std::size_t{0});
    return r;
}

json hash_result_to_json(const HashResult& r) {
    json j;
    j["files"] = array_of(r.files, hashed_file_to_json);
    j["total_hashed"] = r.total_hashed;
    j["total_duplicates"] = r.total_duplicates;
    j["total_errors"] = r.total_errors;
    j["hashing_time_ms"] = r.hashing_time_ms;
    return j;
}

HashResult hash_result_from_json(const json& j) {
    HashResult r;
    r.files = vector_of<HashedFile>(j, "files", hashed_file_from_json);
    r.total_hashed = j.value("total_hashed", std::size_t{0});
    r.total_duplicates = j.value("total_duplicates", std::size_t{0});
    r.total_errors = j.value("total_errors", std::size_t{0});
    r.hashing_time_ms = j.value("hashing_time_ms", std::int64_t{0});
    return r;
}

json copy_result_to_json(const CopyResult& r) {
    json j;
    j["files"] = array_of(r.files, copied_file_to_json);
    j["total_copied"] = r.total_copied;
    j["total_bytes"] = r.total_bytes;
    j["total_errors"] = r.total_errors;
    j["total_retried"] = r.total_retried;
    j["copy_time_ms"] = r.copy_time_ms;
    j["strategy"] = r.strategy;
    return j;
}

CopyResult copy_result_from_json(const json& j) {
    CopyResult r;
    r.files = vector_of<CopiedFile>(j, "files", copied_file_from_json);
    r.total_copied = j.value("total_copied", std::size_t{0});
    r.total_bytes = j.value("total_bytes", std::uint64_t{0});
    r.total_errors = j.value("total_errors", std::size_t{0});
    r.total_retried = j.value("total_retried", std::size_t{0});
    r.copy_time_ms = j.value("copy_time_ms", std::int64_t{0});
    r.strategy = j.value("strategy", std::string("sequential"));
    return r;
}

json validation_result_to_json(const ValidationResult& r) {
    json j;
    j["files"] = array_of(r.files, validated_file_to_json);
    j["total_validated"] = r.total_validated;
    j["total_valid"] = r.total_valid;
    j["total_invalid"] = r.total_invalid;
    j["total_rolled_back"] = r.total_rolled_back;
    j["total_retried"] = r.total_retried;
    j["validation_time_ms"] = r.validation_time_ms;
    return j;
}

ValidationResult validation_result_from_json(const json& j) {
    ValidationResult r;
    r.files = vector_of<ValidatedFile>(j, "files", validated_file_from_json);
    r.total_validated = j.value("total_validated", std::size_t{0});
    r.total_valid = j.value("total_valid", std::size_t{0});
    r.total_invalid = j.value("total_invalid", std::size_t{0});
    r.total_rolled_back = j.value("total_rolled_back", std::size_t{0});
    r.total_retried = j.value("total_retried", std::size_t{0});
    r.validation_time_ms = j.value("validation_time_ms", std::int64_t{0});
    return r;
}

} // namespace

json scanned_file_to_json(const ScannedFile& file) {
    json j;
    j["id"] = file.id;
    j["filename"] = file.filename;
    j["source_path"] = file.source_path.string();
    j["extension"] = file.extension;
    j["size"] = file.size;
    j["type"] = to_string(file.type);
    j["modified_time"] = static_cast<std::int64_t>(file.modified_time);
    return j;
}

ScannedFile scanned_file_from_json(const json& j) {
    ScannedFile file;
    file.id = j.value("id", "");
    file.filename = j.value("filename", "");
    file.source_path = j.value("source_path", "");
    file.extension = j.value("extension", "");
    file.size = j.value("size", std::uint64_t{0});
    file.type = file_type_from_string(j.value("type", "other")).value_or(FileType::Other);
    file.modified_time = static_cast<std::time_t>(j.value("modified_time", std::int64_t{0}));
    return file;
}

json hashed_file_to_json(const HashedFile& file) {
    json j = scanned_file_to_json(file.scanned);
    j["hash"] = optional_string(file.hash);
    j["hash_error"] = optional_string(file.hash_error);
    j["is_duplicate"] = file.is_duplicate;
    j["duplicate_in"] = optional_string(file.duplicate_in);
    return j;
}

HashedFile hashed_file_from_json(const json& j) {
    HashedFile file;
    file.scanned = scanned_file_from_json(j);
    file.hash = read_optional_string(j, "hash");
    file.hash_error = read_optional_string(j, "hash_error");
    file.is_duplicate = j.value("is_duplicate", false);
    file.duplicate_in = read_optional_string(j, "duplicate_in");
    return file;
}

json copied_file_to_json(const CopiedFile& file) {
    json j = hashed_file_to_json(file.hashed);
    j["archive_path"] = file.archive_path ? json(file.archive_path->string()) : json();
    j["copy_error"] = optional_string(file.copy_error);
    j["retry_count"] = file.retry_count;
    j["category"] = file.category;
    j["bucket"] = file.bucket;
    return j;
}

CopiedFile copied_file_from_json(const json& j) {
    CopiedFile file;
    file.hashed = hashed_file_from_json(j);
    if (auto path = read_optional_string(j, "archive_path")) {
        file.archive_path = std::filesystem::path(*path);
    }
    file.copy_error = read_optional_string(j, "copy_error");
    file.retry_count = j.value("retry_count", std::uint32_t{0});
    file.category = j.value("category", "");
    file.bucket = j.value("bucket", "");
    return file;
}

json validated_file_to_json(const ValidatedFile& file) {
    json j = copied_file_to_json(file.copied);
    j["is_valid"] = file.is_valid;
    j["validation_error"] = optional_string(file.validation_error);
    j["rolled_back"] = file.rolled_back;
    return j;
}

ValidatedFile validated_file_from_json(const json& j) {
    ValidatedFile file;
    file.copied = copied_file_from_json(j);
    file.is_valid = j.value("is_valid", false);
    file.validation_error = read_optional_string(j, "validation_error");
    file.rolled_back = j.value("rolled_back", false);
    return file;
}

json progress_to_json(const ImportProgress& p) {
    json j;
    j["session_id"] = p.session_id;
    j["status"] = to_string(p.status);
    j["step"] = p.step;
    j["total_steps"] = p.total_steps;
    j["percent"] = p.percent;
    j["current_file"] = p.current_file;
    j["files_processed"] = p.files_processed;
    j["files_total"] = p.files_total;
    j["bytes_processed"] = p.bytes_processed;
    j["bytes_total"] = p.bytes_total;
    j["duplicates_found"] = p.duplicates_found;
    j["errors_found"] = p.errors_found;
    j["estimated_remaining_ms"] = p.estimated_remaining_ms;
    return j;
}

json session_to_json(const ImportSessionInfo& info) {
    json j;
    j["session_id"] = info.session_id;
    j["status"] = to_string(info.status);
    j["last_step"] = info.last_step;
    j["can_resume"] = info.can_resume;
    j["source_paths"] = info.source_paths;
    j["archive_root"] = info.archive_root;
    j["total_files"] = info.total_files;
    j["processed_files"] = info.processed_files;
    j["duplicate_files"] = info.duplicate_files;
    j["error_files"] = info.error_files;
    j["total_bytes"] = info.total_bytes;
    j["processed_bytes"] = info.processed_bytes;
    j["scan_result"] = info.scan_result ? scan_result_to_json(*info.scan_result) : json();
    j["hash_result"] = info.hash_result ? hash_result_to_json(*info.hash_result) : json();
    j["copy_result"] = info.copy_result ? copy_result_to_json(*info.copy_result) : json();
    j["validation_result"] = info.validation_result ? validation_result_to_json(*info.validation_result) : json();
    j["partial_copies"] = array_of(info.partial_copies, copied_file_to_json);
    j["partial_validations"] = array_of(info.partial_validations, validated_file_to_json);
    j["error"] = info.error;
    j["started_at"] = to_epoch_ms(info.started_at);
    j["completed_at"] = info.completed_at ? json(to_epoch_ms(*info.completed_at)) : json();
    return j;
}

Result<ImportSessionInfo> session_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<ImportSessionInfo>(std::string("Session document is not an object"));
    }

    try {
        ImportSessionInfo info;
        info.session_id = j.value("session_id", "");
        if (info.session_id.empty()) {
            return Err<ImportSessionInfo>(std::string("Session document has no session_id"));
        }

        const auto status_text = j.value("status", "pending");
        auto status = import_status_from_string(status_text);
        if (!status) {
            return Err<ImportSessionInfo>(std::string("Unknown session status: " + status_text));
        }
        info.status = *status;
        info.last_step = j.value("last_step", 0);
        info.can_resume = j.value("can_resume", false);
        info.source_paths = j.value("source_paths", std::vector<std::string>{});
        info.archive_root = j.value("archive_root", "");
        info.total_files = j.value("total_files", std::size_t{0});
        info.processed_files = j.value("processed_files", std::size_t{0});
        info.duplicate_files = j.value("duplicate_files", std::size_t{0});
        info.error_files = j.value("error_files", std::size_t{0});
        info.total_bytes = j.value("total_bytes", std::uint64_t{0});
        info.processed_bytes = j.value("processed_bytes", std::uint64_t{0});

        if (auto it = j.find("scan_result"); it != j.end() && it->is_object()) {
            info.scan_result = scan_result_from_json(*it);
        }
        if (auto it = j.find("hash_result"); it != j.end() && it->is_object()) {
            info.hash_result = hash_result_from_json(*it);
        }
        if (auto it = j.find("copy_result"); it != j.end() && it->is_object()) {
            info.copy_result = copy_result_from_json(*it);
        }
        if (auto it = j.find("validation_result"); it != j.end() && it->is_object()) {
            info.validation_result = validation_result_from_json(*it);
        }
        info.partial_copies = vector_of<CopiedFile>(j, "partial_copies", copied_file_from_json);
        info.partial_validations = vector_of<ValidatedFile>(j, "partial_validations", validated_file_from_json);

        info.error = j.value("error", "");
        info.started_at = from_epoch_ms(j.value("started_at", std::int64_t{0}));
        if (auto it = j.find("completed_at"); it != j.end() && it->is_number_integer()) {
            info.completed_at = from_epoch_ms(it->get<std::int64_t>());
        }
        return Ok(std::move(info));
    } catch (const json::exception& e) {
        return Err<ImportSessionInfo>(std::string("Malformed session document: ") + e.what());
    }
}

} // namespace ingest::import
