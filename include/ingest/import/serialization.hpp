#pragma once

#include "ingest/core/result.hpp"
#include "ingest/import/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace ingest::import {

using json = nlohmann::json;

json scanned_file_to_json(const ScannedFile& file);
ScannedFile scanned_file_from_json(const json& j);

json hashed_file_to_json(const HashedFile& file);
HashedFile hashed_file_from_json(const json& j);

json copied_file_to_json(const CopiedFile& file);
CopiedFile copied_file_from_json(const json& j);

json validated_file_to_json(const ValidatedFile& file);
ValidatedFile validated_file_from_json(const json& j);

json progress_to_json(const ImportProgress& progress);

/**
 * @brief Full session snapshot including per-step results and partial outcomes
 */
json session_to_json(const ImportSessionInfo& info);

/// Missing keys fall back to defaults; a wrongly typed value is an error.
Result<ImportSessionInfo> session_from_json(const json& j);

} // namespace ingest::import
