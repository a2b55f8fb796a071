#pragma once

#include "ingest/import/types.hpp"

#include <array>
#include <chrono>
#include <string>

namespace ingest::import {

/// Share of the overall percent owned by each step (scan, hash, copy, validate, finalize).
constexpr std::array<double, kTotalSteps> kStepWeights{5.0, 35.0, 40.0, 15.0, 5.0};

/**
 * @brief Builds the single normalized progress record for a batch
 *
 * Overall percent is the sum of the weights of completed steps plus the
 * current step's weight scaled by its own completion fraction. The
 * remaining-time estimate extrapolates from elapsed time and that percent.
 */
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(std::string session_id, Clock::time_point started = Clock::now());

    /// Overall percent (0..100) for `step` (1-based) at `fraction` (0..1) through it.
    [[nodiscard]] static double overall_percent(int step, double fraction) noexcept;

    void set_totals(std::size_t files_total, std::uint64_t bytes_total);
    void set_counts(std::size_t duplicates, std::size_t errors);

    ImportProgress update(ImportStatus status,
                          int step,
                          std::size_t done,
                          std::size_t total,
                          const std::string& current_file = {},
                          std::uint64_t bytes_processed = 0,
                          Clock::time_point now = Clock::now());

    [[nodiscard]] const ImportProgress& last() const noexcept { return last_; }

private:
    ImportProgress last_;
    Clock::time_point started_;
};

} // namespace ingest::import
