#pragma once

#include "ingest/import/types.hpp"

#include <cstddef>
#include <string>

namespace ingest::import {

/**
 * @brief Counts consecutive per-file transport failures within one batch
 *
 * Any success or non-transport failure resets the count. Reaching the
 * threshold throws NetworkFailureError once and starts counting afresh.
 */
class NetworkErrorTracker {
public:
    explicit NetworkErrorTracker(std::size_t threshold = kNetworkAbortThreshold)
        : threshold_(threshold == 0 ? 1 : threshold) {}

    void record_success() noexcept { consecutive_ = 0; }
    void record_non_network() noexcept { consecutive_ = 0; }

    /// Throws NetworkFailureError when the threshold is reached.
    void record_network_error(const std::string& message);

    void reset() noexcept { consecutive_ = 0; }

    [[nodiscard]] std::size_t consecutive() const noexcept { return consecutive_; }
    [[nodiscard]] std::size_t threshold() const noexcept { return threshold_; }

private:
    std::size_t threshold_;
    std::size_t consecutive_ = 0;
};

} // namespace ingest::import
