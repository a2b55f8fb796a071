#pragma once

#include "ingest/core/result.hpp"
#include "ingest/import/types.hpp"

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ingest::import {

/**
 * @brief Persists import session snapshots between runs
 *
 * save() is an upsert keyed by session id. list_resumable() returns only
 * paused sessions; failed and cancelled sessions are kept for inspection
 * but never offered for resume.
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual Result<void> save(const ImportSessionInfo& info) = 0;
    virtual Result<ImportSessionInfo> load(const std::string& session_id) const = 0;
    virtual Result<void> remove(const std::string& session_id) = 0;
    virtual std::vector<ImportSessionInfo> list() const = 0;

    std::vector<ImportSessionInfo> list_resumable() const;
};

class InMemorySessionStore : public SessionStore {
public:
    Result<void> save(const ImportSessionInfo& info) override;
    Result<ImportSessionInfo> load(const std::string& session_id) const override;
    Result<void> remove(const std::string& session_id) override;
    std::vector<ImportSessionInfo> list() const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ImportSessionInfo> sessions_;
};

/**
 * @brief One JSON document per session: <state_dir>/<session_id>.json
 *
 * Writes go to a sibling .tmp file which is then renamed over the target,
 * so a crash mid-save leaves the previous snapshot intact.
 */
class JsonSessionStore : public SessionStore {
public:
    explicit JsonSessionStore(std::filesystem::path state_dir);

    Result<void> save(const ImportSessionInfo& info) override;
    Result<ImportSessionInfo> load(const std::string& session_id) const override;
    Result<void> remove(const std::string& session_id) override;
    std::vector<ImportSessionInfo> list() const override;

    [[nodiscard]] const std::filesystem::path& state_dir() const noexcept { return state_dir_; }

private:
    [[nodiscard]] std::filesystem::path path_for(const std::string& session_id) const;
    Result<ImportSessionInfo> read_file(const std::filesystem::path& path) const;

    std::filesystem::path state_dir_;
    mutable std::shared_mutex mutex_;
};

} // namespace ingest::import
