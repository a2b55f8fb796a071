#pragma once

#include "ingest/core/result.hpp"
#include "ingest/import/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ingest::import {

/**
 * @brief Lookup of content already present in the archive
 */
class DuplicateIndex {
public:
    virtual ~DuplicateIndex() = default;

    /// Where content with this hash already lives, if anywhere.
    virtual std::optional<std::string> find_by_hash(const std::string& hash) const = 0;
};

/**
 * @brief Persists validated files into the catalog (finalize step)
 */
class CatalogWriter {
public:
    virtual ~CatalogWriter() = default;

    virtual Result<FinalizedFile> record(const ValidatedFile& file) = 0;
};

/**
 * @brief Catalog kept in process memory
 *
 * Serves as both writer and duplicate index, so a second import of the same
 * content in one process is detected as a duplicate.
 */
class InMemoryCatalog : public CatalogWriter, public DuplicateIndex {
public:
    Result<FinalizedFile> record(const ValidatedFile& file) override;
    std::optional<std::string> find_by_hash(const std::string& hash) const override;

    /// Registers content imported by an earlier run.
    void add_existing(const std::string& hash, const std::string& location);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> locations_;
    std::int64_t next_id_ = 1;
};

} // namespace ingest::import
