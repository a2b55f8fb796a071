#include "ingest/core/io_error.hpp"

#include <cerrno>

namespace ingest {

IoError IoError::from(std::error_code ec, const std::string& context) {
    IoError error;
    error.code = ec;
    error.message = context.empty() ? ec.message() : context + ": " + ec.message();
    return error;
}

ErrorClass classify(const std::error_code& ec) noexcept {
    if (!ec) {
        return ErrorClass::Fatal;
    }

    // system_category codes map onto generic conditions on POSIX
    const auto condition = ec.default_error_condition();
    if (condition.category() != std::generic_category()) {
        return ErrorClass::Fatal;
    }

    switch (condition.value()) {
        case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case ECONNRESET:
        case ETIMEDOUT:
        case EBUSY:
        case EIO:
        case ENETUNREACH:
        case EPIPE:
        case ENOTCONN:
#if defined(EHOSTDOWN)
        case EHOSTDOWN:
#endif
        case EHOSTUNREACH:
        case ENETDOWN:
        case ECONNABORTED:
#if defined(ESTALE)
        case ESTALE:
#endif
            return ErrorClass::Retryable;
        default:
            return ErrorClass::Fatal;
    }
}

NetworkFailureError::NetworkFailureError(std::size_t consecutive_errors, std::string last_error)
    : std::runtime_error("Network appears down - " + std::to_string(consecutive_errors) +
                         " consecutive errors. Last: " + last_error),
      consecutive_errors_(consecutive_errors),
      last_error_(std::move(last_error)) {}

} // namespace ingest
