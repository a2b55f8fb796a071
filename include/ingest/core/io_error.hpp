#pragma once

#include "ingest/core/result.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ingest {

/**
 * @brief File-system failure with the originating errno preserved
 *
 * The code decides retryability; the message is what ends up on the
 * file record and in the batch summary.
 */
struct IoError {
    std::error_code code;
    std::string message;

    static IoError from(std::error_code ec, const std::string& context);
};

template<typename T>
using IoResult = Result<T, IoError>;

enum class ErrorClass {
    Retryable, ///< Transport hiccup: reset, timeout, busy, stale handle...
    Fatal      ///< Local and permanent: permission, disk full, missing path
};

/**
 * @brief Classifies an error code against the transient transport list
 *
 * EAGAIN, ECONNRESET, ETIMEDOUT, EBUSY, EIO, ENETUNREACH, EPIPE, ENOTCONN,
 * EHOSTDOWN, EHOSTUNREACH, ENETDOWN, ECONNABORTED and ESTALE are retryable.
 */
ErrorClass classify(const std::error_code& ec) noexcept;

inline bool is_retryable(const std::error_code& ec) noexcept {
    return classify(ec) == ErrorClass::Retryable;
}

/**
 * @brief Raised when consecutive retryable errors cross the abort threshold
 *
 * The only exception the import services let escape a batch. The
 * orchestrator turns it into a paused, resumable session.
 */
class NetworkFailureError : public std::runtime_error {
public:
    NetworkFailureError(std::size_t consecutive_errors, std::string last_error);

    std::size_t consecutive_errors() const noexcept { return consecutive_errors_; }
    const std::string& last_error() const noexcept { return last_error_; }

private:
    std::size_t consecutive_errors_;
    std::string last_error_;
};

} // namespace ingest
