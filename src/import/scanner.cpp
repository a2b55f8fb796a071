#include "ingest/import/scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>
#include <unordered_set>

namespace ingest::import {
namespace fs = std::filesystem;
namespace {

const std::unordered_set<std::string> kSkipNames{
    ".ds_store", "thumbs.db", "desktop.ini", ".spotlight-v100", ".trashes",
    ".fseventsd", "__macosx", ".git", ".svn", ".cache", ".thumbnails"};

const std::unordered_set<std::string> kSkipExtensions{"aae", "psd", "psb", "acr"};

const std::unordered_set<std::string> kVideoExtensions{
    "mp4", "m4v", "mov", "qt", "avi", "mkv", "webm", "wmv", "mpg", "mpeg", "m2v",
    "mts", "m2ts", "ts", "3gp", "mxf", "dv", "insv", "lrv", "braw", "r3d"};

const std::unordered_set<std::string> kImageExtensions{
    "jpg", "jpeg", "png", "gif", "bmp", "tif", "tiff", "webp", "heic", "heif", "avif",
    "raw", "nef", "nrw", "cr2", "cr3", "crw", "arw", "srf", "sr2", "dng", "orf", "raf",
    "rw2", "pef", "srw", "x3f", "3fr", "iiq", "gpr"};

const std::unordered_set<std::string> kAudioExtensions{
    "wav", "mp3", "aac", "m4a", "flac", "aif", "aiff", "ogg", "opus", "wma"};

const std::unordered_set<std::string> kSidecarExtensions{"xmp", "srt", "thm", "lrf", "xml", "json"};

const std::unordered_set<std::string> kDocumentExtensions{"pdf", "txt", "md", "csv", "doc", "docx"};

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string extension_of(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return to_lower(ext);
}

std::time_t to_time_t(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(system_time);
}

} // namespace

ScanResult Scanner::scan(const std::vector<fs::path>& sources,
                         const std::string& session_id,
                         const Options& options) const {
    ScanResult result;

    for (const auto& source : sources) {
        if (options.abort.aborted()) {
            break;
        }

        std::error_code ec;
        std::vector<fs::path> candidates;
        if (fs::is_directory(source, ec)) {
            collect_directory(source, candidates);
        } else if (fs::is_regular_file(source, ec)) {
            if (!should_skip(source)) {
                candidates.push_back(source);
            }
        } else {
            spdlog::warn("[Scanner] Source not found or unreadable: {}", source.string());
            continue;
        }

        for (const auto& path : candidates) {
            if (options.abort.aborted()) {
                break;
            }

            std::error_code size_ec;
            const auto size = fs::file_size(path, size_ec);
            if (size_ec) {
                spdlog::warn("[Scanner] Cannot stat {}: {}", path.string(), size_ec.message());
                continue;
            }

            ScannedFile file;
            file.id = session_id + "-" + std::to_string(result.files.size() + 1);
            file.filename = path.filename().string();
            file.source_path = path;
            file.extension = extension_of(path);
            file.size = size;
            file.type = detect_type(file.extension);

            std::error_code time_ec;
            const auto write_time = fs::last_write_time(path, time_ec);
            if (!time_ec) {
                file.modified_time = to_time_t(write_time);
            }

            switch (file.type) {
                case FileType::Video: ++result.video_files; break;
                case FileType::Image: ++result.image_files; break;
                case FileType::Audio: ++result.audio_files; break;
                case FileType::Sidecar: ++result.sidecar_files; break;
                default: break;
            }

            result.total_bytes += file.size;
            result.files.push_back(std::move(file));

            if (options.on_progress) {
                options.on_progress(result.files.size(), path.string());
            }
        }
    }

    result.total_files = result.files.size();
    spdlog::info("[Scanner] Found {} files ({} bytes) in {} source(s)",
                 result.total_files, result.total_bytes, sources.size());
    return result;
}

FileType Scanner::detect_type(const std::string& extension) {
    const std::string ext = to_lower(extension);
    if (kVideoExtensions.count(ext) > 0) return FileType::Video;
    if (kImageExtensions.count(ext) > 0) return FileType::Image;
    if (kAudioExtensions.count(ext) > 0) return FileType::Audio;
    if (kSidecarExtensions.count(ext) > 0) return FileType::Sidecar;
    if (kDocumentExtensions.count(ext) > 0) return FileType::Document;
    return FileType::Other;
}

bool Scanner::should_skip(const fs::path& path) {
    const std::string name = to_lower(path.filename().string());
    if (name.empty() || kSkipNames.count(name) > 0) {
        return true;
    }
    if (name.front() == '.') {
        return true;
    }
    return kSkipExtensions.count(extension_of(path)) > 0;
}

void Scanner::collect_directory(const fs::path& root, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("[Scanner] Cannot open {}: {}", root.string(), ec.message());
        return;
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        if (should_skip(entry.path())) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(ec)) {
            out.push_back(entry.path());
        }
        it.increment(ec);
        if (ec) {
            spdlog::warn("[Scanner] Walk error under {}: {}", root.string(), ec.message());
            break;
        }
    }

    std::sort(out.begin(), out.end());
}

} // namespace ingest::import
