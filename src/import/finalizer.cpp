#include "ingest/import/finalizer.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace ingest::import {

FinalizationResult Finalizer::finalize(const std::vector<ValidatedFile>& files,
                                       const AbortToken& abort,
                                       const std::function<void(std::size_t, std::size_t)>& on_progress) {
    const auto started = std::chrono::steady_clock::now();
    FinalizationResult result;

    for (std::size_t i = 0; i < files.size(); ++i) {
        if (abort.aborted()) {
            spdlog::info("[Finalizer] Aborted with {} files left", files.size() - i);
            break;
        }

        const auto& file = files[i];
        if (!file.is_valid) {
            continue;
        }

        auto recorded = writer_.record(file);
        if (recorded.is_ok()) {
            result.files.push_back(recorded.take());
            ++result.total_finalized;
        } else {
            ++result.total_errors;
            spdlog::error("[Finalizer] Failed to catalogue {}: {}", file.filename(), recorded.error());
        }

        if (on_progress) {
            on_progress(i + 1, files.size());
        }
    }

    result.finalize_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    spdlog::info("[Finalizer] Catalogued {} files ({} errors)", result.total_finalized, result.total_errors);
    return result;
}

} // namespace ingest::import
