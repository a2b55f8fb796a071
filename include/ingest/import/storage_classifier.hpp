#pragma once

#include "ingest/import/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ingest::import {

/**
 * @brief Decides whether a path is local or network-attached
 *
 * Detection order:
 * 1. Explicit network prefixes (smb://, nfs://, afp://, cifs://, //, \\)
 * 2. Mounted volumes (/Volumes/<name>): known local volume names and
 *    camera-media names are local, any other volume is network
 * 3. Generic mount points (/mnt/, /media/) are network
 * 4. Everything else is local
 *
 * Only the volume name is inspected; subdirectories below it never change
 * the outcome.
 */
class StorageClassifier {
public:
    StorageClassifier();

    StorageType classify(const std::string& path) const;
    bool is_network_path(const std::string& path) const;

    StorageConfig config_for(const std::string& path) const;

    /**
     * @brief Most constrained policy across a batch
     *
     * Network if any path is network; local policy for an empty list.
     */
    StorageConfig config_for_paths(const std::vector<std::string>& paths) const;

    static StorageConfig config_for_type(StorageType type);

    /// Name of the mounted volume for /Volumes/ paths, nullopt otherwise.
    static std::optional<std::string> volume_name(const std::string& path);

    void add_local_volume_pattern(std::string pattern);
    void add_external_media_pattern(std::string pattern);

private:
    static bool contains_any(const std::string& haystack, const std::vector<std::string>& needles);

    std::vector<std::string> network_prefixes_;
    std::vector<std::string> local_volume_patterns_;
    std::vector<std::string> external_media_patterns_;
    std::vector<std::string> mount_prefixes_;
};

const char* to_string(StorageType type) noexcept;

} // namespace ingest::import
