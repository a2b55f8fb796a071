/**
 * @file events.hpp
 * @brief Events published while a batch is imported
 *
 * NAMING CONVENTION:
 * Events are past-tense or describe a state snapshot: FileCopiedEvent,
 * ImportProgressEvent.
 */

#pragma once

#include "ingest/import/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ingest::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Progress snapshot, emitted at every step boundary and per file
 *
 * WHO SUBSCRIBES:
 * - CLI (progress line)
 * - Metrics bridge (session gauges)
 */
struct ImportProgressEvent {
    import::ImportProgress progress;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Emitted once per session when it reaches a terminal or paused state
 */
struct ImportCompletedEvent {
    import::ImportCompletion completion;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Emitted when a network failure pauses a session
 */
struct ImportPausedEvent {
    std::string session_id;
    int last_step = 0;
    std::string reason;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// ════════════════════════════════════════════════════════
// File Events
// ════════════════════════════════════════════════════════

struct FileCopiedEvent {
    std::string session_id;
    std::string file_id;
    std::string filename;
    std::uint64_t bytes = 0;
    std::uint32_t retry_count = 0;
    bool success = false;
    std::string error;
};

struct FileValidatedEvent {
    std::string session_id;
    std::string file_id;
    std::string filename;
    bool valid = false;
    std::string error;
};

struct FileRolledBackEvent {
    std::string session_id;
    std::string file_id;
    std::string archive_path;
    std::string reason;
};

// ════════════════════════════════════════════════════════
// Monitoring Events
// ════════════════════════════════════════════════════════

/**
 * @brief Mirror of an alert fired by the AlertManager
 */
struct AlertRaisedEvent {
    std::string alert_id; ///< rule id, or manual_<ms> for manual alerts
    std::string name;
    std::string severity;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

} // namespace ingest::events
