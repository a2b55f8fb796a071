#include "ingest/import/file_operations.hpp"

#include "ingest/import/content_hash.hpp"

#include <cerrno>
#include <cstdio>
#include <memory>
#include <vector>

namespace ingest::import {
namespace fs = std::filesystem;
namespace {

struct FileCloser {
    void operator()(std::FILE* file) const noexcept {
        if (file != nullptr) {
            std::fclose(file);
        }
    }
};

using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

std::error_code last_errno(int fallback = EIO) {
    const int value = errno != 0 ? errno : fallback;
    return std::error_code(value, std::generic_category());
}

IoError errno_error(const std::string& context) {
    return IoError::from(last_errno(), context);
}

} // namespace

IoResult<CopyStats> LocalFileOperations::copy_file(const fs::path& source,
                                                   const fs::path& destination,
                                                   std::size_t buffer_size,
                                                   bool compute_hash) {
    errno = 0;
    FileHandle input(std::fopen(source.c_str(), "rb"));
    if (!input) {
        return Err<CopyStats>(errno_error("Failed to open source " + source.string()));
    }

    errno = 0;
    FileHandle output(std::fopen(destination.c_str(), "wb"));
    if (!output) {
        return Err<CopyStats>(errno_error("Failed to create " + destination.string()));
    }

    std::vector<char> buffer(buffer_size == 0 ? 64 * 1024 : buffer_size);
    ContentHash hash;
    CopyStats stats;

    while (true) {
        errno = 0;
        const std::size_t read = std::fread(buffer.data(), 1, buffer.size(), input.get());
        if (read > 0) {
            if (compute_hash) {
                hash.update(buffer.data(), read);
            }
            errno = 0;
            if (std::fwrite(buffer.data(), 1, read, output.get()) != read) {
                return Err<CopyStats>(errno_error("Failed to write " + destination.string()));
            }
            stats.bytes_copied += read;
        }
        if (read < buffer.size()) {
            if (std::ferror(input.get()) != 0) {
                return Err<CopyStats>(errno_error("Failed to read " + source.string()));
            }
            break;
        }
    }

    errno = 0;
    if (std::fflush(output.get()) != 0) {
        return Err<CopyStats>(errno_error("Failed to flush " + destination.string()));
    }
    std::FILE* raw = output.release();
    errno = 0;
    if (std::fclose(raw) != 0) {
        return Err<CopyStats>(errno_error("Failed to close " + destination.string()));
    }

    if (compute_hash) {
        stats.hash = hash.hex();
    }
    return Ok<CopyStats, IoError>(std::move(stats));
}

IoResult<std::string> LocalFileOperations::hash_file(const fs::path& path, std::size_t buffer_size) {
    errno = 0;
    FileHandle input(std::fopen(path.c_str(), "rb"));
    if (!input) {
        return Err<std::string>(errno_error("Failed to open " + path.string()));
    }

    std::vector<char> buffer(buffer_size == 0 ? 64 * 1024 : buffer_size);
    ContentHash hash;
    while (true) {
        errno = 0;
        const std::size_t read = std::fread(buffer.data(), 1, buffer.size(), input.get());
        hash.update(buffer.data(), read);
        if (read < buffer.size()) {
            if (std::ferror(input.get()) != 0) {
                return Err<std::string>(errno_error("Failed to read " + path.string()));
            }
            break;
        }
    }
    return Ok<std::string, IoError>(hash.hex());
}

IoResult<void> LocalFileOperations::rename(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        return Err<void>(IoError::from(ec, "Failed to move " + from.string() + " to " + to.string()));
    }
    return Ok<IoError>();
}

IoResult<void> LocalFileOperations::remove(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Err<void>(IoError::from(ec, "Failed to remove " + path.string()));
    }
    return Ok<IoError>();
}

IoResult<void> LocalFileOperations::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::exists(path)) {
        return Err<void>(IoError::from(ec, "Failed to create directory " + path.string()));
    }
    return Ok<IoError>();
}

bool LocalFileOperations::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

} // namespace ingest::import
