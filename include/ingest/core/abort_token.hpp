#pragma once

#include <atomic>
#include <memory>

namespace ingest {

/**
 * @brief Shared cooperative cancellation flag
 *
 * Copies share the same flag. Services check aborted() before starting
 * each file; in-flight work is allowed to finish.
 */
class AbortToken {
public:
    AbortToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void abort() noexcept { flag_->store(true); }
    [[nodiscard]] bool aborted() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace ingest
