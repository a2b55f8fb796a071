#pragma once

#include "ingest/core/abort_token.hpp"
#include "ingest/import/types.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace ingest::import {

/**
 * @brief Discovers importable files under a set of source paths (step 1)
 */
class Scanner {
public:
    struct Options {
        std::function<void(std::size_t files_found, const std::string& current_path)> on_progress;
        AbortToken abort;
    };

    /**
     * @brief Walks every source (directory or single file) in order
     *
     * Files within a directory are reported in lexicographic path order so
     * ids are reproducible for the same tree. A raised abort flag stops the
     * walk and returns what was found so far.
     */
    ScanResult scan(const std::vector<std::filesystem::path>& sources,
                    const std::string& session_id,
                    const Options& options = {}) const;

    static FileType detect_type(const std::string& extension);

    /// True for OS clutter (.DS_Store, Thumbs.db, ...), hidden files and unwanted extensions.
    static bool should_skip(const std::filesystem::path& path);

private:
    static void collect_directory(const std::filesystem::path& root,
                                  std::vector<std::filesystem::path>& out);
};

} // namespace ingest::import
