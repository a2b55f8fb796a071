#include "ingest/import/network_error_tracker.hpp"

#include "ingest/core/io_error.hpp"

#include <spdlog/spdlog.h>

namespace ingest::import {

void NetworkErrorTracker::record_network_error(const std::string& message) {
    ++consecutive_;
    if (consecutive_ < threshold_) {
        spdlog::warn("[NetworkErrorTracker] {} consecutive network errors (abort at {})", consecutive_, threshold_);
        return;
    }

    const auto count = consecutive_;
    consecutive_ = 0;
    spdlog::error("[NetworkErrorTracker] Network appears down after {} consecutive errors: {}", count, message);
    throw NetworkFailureError(count, message);
}

} // namespace ingest::import
