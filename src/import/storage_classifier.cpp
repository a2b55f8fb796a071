#include "ingest/import/storage_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace ingest::import {
namespace {

constexpr const char* kVolumesPrefix = "/Volumes/";

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

StorageClassifier::StorageClassifier()
    : network_prefixes_{"//", "\\\\", "smb://", "nfs://", "afp://", "cifs://"},
      local_volume_patterns_{"macintosh hd", "ssd", "internal", "system", "data",
                             "preboot", "recovery", "vm"},
      external_media_patterns_{"sdcard", "sd card", "dcim", "no name", "untitled",
                               "eos_digital", "canon", "nikon", "sony", "panasonic",
                               "fuji", "gopro"},
      mount_prefixes_{"/mnt/", "/media/"} {}

StorageType StorageClassifier::classify(const std::string& path) const {
    return is_network_path(path) ? StorageType::Network : StorageType::Local;
}

bool StorageClassifier::is_network_path(const std::string& path) const {
    if (path.empty()) {
        return false;
    }

    const std::string lower = to_lower(path);
    for (const auto& prefix : network_prefixes_) {
        if (starts_with(lower, prefix)) {
            return true;
        }
    }

    if (auto volume = volume_name(path)) {
        const std::string lower_volume = to_lower(*volume);
        if (contains_any(lower_volume, local_volume_patterns_) ||
            contains_any(lower_volume, external_media_patterns_)) {
            return false;
        }
        // Unrecognised volume: could be an SMB/AFP mount
        return true;
    }

    for (const auto& prefix : mount_prefixes_) {
        if (starts_with(path, prefix)) {
            return true;
        }
    }

    return false;
}

StorageConfig StorageClassifier::config_for(const std::string& path) const {
    return config_for_type(classify(path));
}

StorageConfig StorageClassifier::config_for_paths(const std::vector<std::string>& paths) const {
    const bool any_network = std::any_of(paths.begin(), paths.end(),
                                         [this](const std::string& p) { return is_network_path(p); });
    return config_for_type(any_network ? StorageType::Network : StorageType::Local);
}

StorageConfig StorageClassifier::config_for_type(StorageType type) {
    StorageConfig config;
    config.type = type;
    if (type == StorageType::Network) {
        config.buffer_size = 1024 * 1024;
        config.concurrency = 1;
        config.operation_delay = std::chrono::milliseconds{50};
        config.description = "Network storage (SMB/NFS)";
    } else {
        config.buffer_size = 64 * 1024;
        config.concurrency = 4;
        config.operation_delay = std::chrono::milliseconds{0};
        config.description = "Local storage (SSD/HDD)";
    }
    return config;
}

std::optional<std::string> StorageClassifier::volume_name(const std::string& path) {
    const std::string prefix = kVolumesPrefix;
    if (!starts_with(path, prefix)) {
        return std::nullopt;
    }
    const auto end = path.find('/', prefix.size());
    // An empty name is still a volume path; callers treat it as unknown.
    return path.substr(prefix.size(), end == std::string::npos ? std::string::npos : end - prefix.size());
}

void StorageClassifier::add_local_volume_pattern(std::string pattern) {
    local_volume_patterns_.push_back(to_lower(std::move(pattern)));
}

void StorageClassifier::add_external_media_pattern(std::string pattern) {
    external_media_patterns_.push_back(to_lower(std::move(pattern)));
}

bool StorageClassifier::contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

const char* to_string(StorageType type) noexcept {
    return type == StorageType::Network ? "network" : "local";
}

} // namespace ingest::import
