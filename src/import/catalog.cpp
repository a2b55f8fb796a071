#include "ingest/import/catalog.hpp"

#include <chrono>

namespace ingest::import {

Result<FinalizedFile> InMemoryCatalog::record(const ValidatedFile& file) {
    if (!file.is_valid || !file.copied.archive_path) {
        return Err<FinalizedFile>(std::string("File is not validated: " + file.filename()));
    }
    const auto& hash = file.copied.hashed.hash;
    if (!hash) {
        return Err<FinalizedFile>(std::string("File has no content hash: " + file.filename()));
    }

    std::lock_guard lock(mutex_);
    if (auto it = locations_.find(*hash); it != locations_.end()) {
        return Err<FinalizedFile>(std::string("Content already catalogued at " + it->second));
    }
    locations_.emplace(*hash, file.copied.archive_path->string());

    FinalizedFile finalized;
    finalized.validated = file;
    finalized.record_id = next_id_++;
    finalized.imported_at = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    finalized.source_modified_at = file.copied.hashed.scanned.modified_time;
    return Ok(std::move(finalized));
}

std::optional<std::string> InMemoryCatalog::find_by_hash(const std::string& hash) const {
    std::lock_guard lock(mutex_);
    auto it = locations_.find(hash);
    if (it == locations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryCatalog::add_existing(const std::string& hash, const std::string& location) {
    std::lock_guard lock(mutex_);
    locations_[hash] = location;
}

std::size_t InMemoryCatalog::size() const {
    std::lock_guard lock(mutex_);
    return locations_.size();
}

} // namespace ingest::import
