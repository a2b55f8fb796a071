#include "ingest/import/types.hpp"

#include <array>
#include <utility>

namespace ingest::import {
namespace {

constexpr std::array<std::pair<ImportStatus, const char*>, 10> kStatusNames{{
    {ImportStatus::Pending, "pending"},
    {ImportStatus::Scanning, "scanning"},
    {ImportStatus::Hashing, "hashing"},
    {ImportStatus::Copying, "copying"},
    {ImportStatus::Validating, "validating"},
    {ImportStatus::Finalizing, "finalizing"},
    {ImportStatus::Completed, "completed"},
    {ImportStatus::Cancelled, "cancelled"},
    {ImportStatus::Failed, "failed"},
    {ImportStatus::Paused, "paused"},
}};

constexpr std::array<std::pair<FileType, const char*>, 6> kFileTypeNames{{
    {FileType::Video, "video"},
    {FileType::Image, "image"},
    {FileType::Audio, "audio"},
    {FileType::Sidecar, "sidecar"},
    {FileType::Document, "document"},
    {FileType::Other, "other"},
}};

} // namespace

const char* to_string(ImportStatus status) noexcept {
    for (const auto& [value, name] : kStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ImportStatus> import_status_from_string(const std::string& text) {
    for (const auto& [value, name] : kStatusNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

const char* to_string(FileType type) noexcept {
    for (const auto& [value, name] : kFileTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "other";
}

std::optional<FileType> file_type_from_string(const std::string& text) {
    for (const auto& [value, name] : kFileTypeNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::chrono::milliseconds RetryConfig::delay_for(std::size_t attempt) const {
    if (delays.empty()) {
        return std::chrono::milliseconds{0};
    }
    if (attempt < delays.size()) {
        return delays[attempt];
    }
    return delays.back();
}

} // namespace ingest::import
