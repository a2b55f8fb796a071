#include "ingest/import/progress.hpp"

#include <algorithm>

namespace ingest::import {

ProgressTracker::ProgressTracker(std::string session_id, Clock::time_point started)
    : started_(started) {
    last_.session_id = std::move(session_id);
}

double ProgressTracker::overall_percent(int step, double fraction) noexcept {
    if (step <= 0) {
        return 0.0;
    }
    if (step > kTotalSteps) {
        return 100.0;
    }

    double percent = 0.0;
    for (int i = 0; i < step - 1; ++i) {
        percent += kStepWeights[static_cast<std::size_t>(i)];
    }
    percent += kStepWeights[static_cast<std::size_t>(step - 1)] * std::clamp(fraction, 0.0, 1.0);
    return std::min(percent, 100.0);
}

void ProgressTracker::set_totals(std::size_t files_total, std::uint64_t bytes_total) {
    last_.files_total = files_total;
    last_.bytes_total = bytes_total;
}

void ProgressTracker::set_counts(std::size_t duplicates, std::size_t errors) {
    last_.duplicates_found = duplicates;
    last_.errors_found = errors;
}

ImportProgress ProgressTracker::update(ImportStatus status,
                                       int step,
                                       std::size_t done,
                                       std::size_t total,
                                       const std::string& current_file,
                                       std::uint64_t bytes_processed,
                                       Clock::time_point now) {
    const double fraction = total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total);

    last_.status = status;
    last_.step = step;
    last_.percent = status == ImportStatus::Completed ? 100.0 : overall_percent(step, fraction);
    last_.current_file = current_file;
    last_.files_processed = done;
    if (bytes_processed > 0) {
        last_.bytes_processed = bytes_processed;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_).count();
    if (last_.percent > 0.0 && last_.percent < 100.0) {
        last_.estimated_remaining_ms =
            static_cast<std::int64_t>(static_cast<double>(elapsed) * (100.0 - last_.percent) / last_.percent);
    } else {
        last_.estimated_remaining_ms = 0;
    }
    return last_;
}

} // namespace ingest::import
