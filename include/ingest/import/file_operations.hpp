#pragma once

#include "ingest/core/io_error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ingest::import {

struct CopyStats {
    std::uint64_t bytes_copied = 0;
    std::optional<std::string> hash; ///< filled when the copy hashed inline
};

/**
 * @brief File-system primitives used by the transfer services
 *
 * Every failure keeps its errno so callers can tell transport hiccups from
 * permanent local errors. Implementations must be safe to call from the
 * timeout pool's worker threads.
 */
class FileOperations {
public:
    virtual ~FileOperations() = default;

    virtual IoResult<CopyStats> copy_file(const std::filesystem::path& source,
                                          const std::filesystem::path& destination,
                                          std::size_t buffer_size,
                                          bool compute_hash) = 0;

    virtual IoResult<std::string> hash_file(const std::filesystem::path& path,
                                            std::size_t buffer_size) = 0;

    virtual IoResult<void> rename(const std::filesystem::path& from,
                                  const std::filesystem::path& to) = 0;

    virtual IoResult<void> remove(const std::filesystem::path& path) = 0;

    virtual IoResult<void> create_directories(const std::filesystem::path& path) = 0;

    virtual bool exists(const std::filesystem::path& path) = 0;
};

/**
 * @brief Buffered stdio implementation against the real file system
 */
class LocalFileOperations : public FileOperations {
public:
    IoResult<CopyStats> copy_file(const std::filesystem::path& source,
                                  const std::filesystem::path& destination,
                                  std::size_t buffer_size,
                                  bool compute_hash) override;

    IoResult<std::string> hash_file(const std::filesystem::path& path,
                                    std::size_t buffer_size) override;

    IoResult<void> rename(const std::filesystem::path& from,
                          const std::filesystem::path& to) override;

    IoResult<void> remove(const std::filesystem::path& path) override;

    IoResult<void> create_directories(const std::filesystem::path& path) override;

    bool exists(const std::filesystem::path& path) override;
};

} // namespace ingest::import
