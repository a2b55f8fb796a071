#include "ingest/import/session_store.hpp"

#include "ingest/import/serialization.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace ingest::import {

std::vector<ImportSessionInfo> SessionStore::list_resumable() const {
    auto sessions = list();
    sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
                                  [](const ImportSessionInfo& info) {
                                      return info.status != ImportStatus::Paused;
                                  }),
                   sessions.end());
    return sessions;
}

// ════════════════════════════════════════════════════════
// InMemorySessionStore
// ════════════════════════════════════════════════════════

Result<void> InMemorySessionStore::save(const ImportSessionInfo& info) {
    if (info.session_id.empty()) {
        return Err<void>(std::string("Session id is empty"));
    }
    std::unique_lock lock(mutex_);
    sessions_[info.session_id] = info;
    return Ok();
}

Result<ImportSessionInfo> InMemorySessionStore::load(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<ImportSessionInfo>(std::string("Session not found: " + session_id));
    }
    return Ok(it->second);
}

Result<void> InMemorySessionStore::remove(const std::string& session_id) {
    std::unique_lock lock(mutex_);
    if (sessions_.erase(session_id) == 0) {
        return Err<void>(std::string("Session not found: " + session_id));
    }
    return Ok();
}

std::vector<ImportSessionInfo> InMemorySessionStore::list() const {
    std::shared_lock lock(mutex_);
    std::vector<ImportSessionInfo> result;
    result.reserve(sessions_.size());
    for (const auto& [id, info] : sessions_) {
        result.push_back(info);
    }
    return result;
}

// ════════════════════════════════════════════════════════
// JsonSessionStore
// ════════════════════════════════════════════════════════

JsonSessionStore::JsonSessionStore(fs::path state_dir) : state_dir_(std::move(state_dir)) {}

fs::path JsonSessionStore::path_for(const std::string& session_id) const {
    return state_dir_ / (session_id + ".json");
}

Result<void> JsonSessionStore::save(const ImportSessionInfo& info) {
    if (info.session_id.empty()) {
        return Err<void>(std::string("Session id is empty"));
    }

    std::unique_lock lock(mutex_);
    std::error_code ec;
    fs::create_directories(state_dir_, ec);
    if (ec) {
        return Err<void>(std::string("Failed to create state directory: " + ec.message()));
    }

    const auto target = path_for(info.session_id);
    auto staging = target;
    staging += ".tmp";

    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(std::string("Failed to open " + staging.string()));
        }
        output << session_to_json(info).dump(2);
        if (!output) {
            return Err<void>(std::string("Failed to write " + staging.string()));
        }
    }

    fs::rename(staging, target, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Err<void>(std::string("Failed to commit session " + info.session_id));
    }

    spdlog::debug("[SessionStore] Saved {} ({})", info.session_id, to_string(info.status));
    return Ok();
}

Result<ImportSessionInfo> JsonSessionStore::read_file(const fs::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<ImportSessionInfo>(std::string("Session not found: " + path.stem().string()));
    }

    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    auto parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<ImportSessionInfo>(std::string("Invalid JSON in " + path.string()));
    }
    return session_from_json(parsed);
}

Result<ImportSessionInfo> JsonSessionStore::load(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    return read_file(path_for(session_id));
}

Result<void> JsonSessionStore::remove(const std::string& session_id) {
    std::unique_lock lock(mutex_);
    std::error_code ec;
    if (!fs::remove(path_for(session_id), ec)) {
        return Err<void>(std::string("Session not found: " + session_id));
    }
    return Ok();
}

std::vector<ImportSessionInfo> JsonSessionStore::list() const {
    std::shared_lock lock(mutex_);
    std::vector<ImportSessionInfo> result;

    std::error_code ec;
    fs::directory_iterator it(state_dir_, ec);
    if (ec) {
        return result;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
            continue;
        }
        auto loaded = read_file(entry.path());
        if (loaded.is_ok()) {
            result.push_back(loaded.take());
        } else {
            spdlog::warn("[SessionStore] Skipping {}: {}", entry.path().string(), loaded.error());
        }
    }
    return result;
}

} // namespace ingest::import
