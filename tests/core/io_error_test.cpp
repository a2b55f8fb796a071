#include "ingest/core/io_error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <system_error>

using ingest::ErrorClass;
using ingest::IoError;
using ingest::NetworkFailureError;
using ingest::classify;
using ingest::is_retryable;

namespace {

std::error_code errno_code(int value) {
    return std::error_code(value, std::generic_category());
}

} // namespace

TEST(IoErrorTest, TransportErrorsAreRetryable) {
    for (int code : {EAGAIN, ECONNRESET, ETIMEDOUT, EBUSY, EIO, ENETUNREACH, EPIPE,
                     ENOTCONN, EHOSTUNREACH, ENETDOWN, ECONNABORTED}) {
        EXPECT_EQ(classify(errno_code(code)), ErrorClass::Retryable) << "errno " << code;
    }
}

TEST(IoErrorTest, LocalErrorsAreFatal) {
    for (int code : {EACCES, EPERM, ENOSPC, ENOENT, EISDIR, EROFS}) {
        EXPECT_EQ(classify(errno_code(code)), ErrorClass::Fatal) << "errno " << code;
    }
}

TEST(IoErrorTest, SystemCategoryMapsToGenericCondition) {
    EXPECT_TRUE(is_retryable(std::error_code(ECONNRESET, std::system_category())));
    EXPECT_FALSE(is_retryable(std::error_code(EACCES, std::system_category())));
}

TEST(IoErrorTest, EmptyCodeIsFatal) {
    EXPECT_EQ(classify(std::error_code{}), ErrorClass::Fatal);
}

TEST(IoErrorTest, MessageIncludesContext) {
    auto error = IoError::from(errno_code(ENOENT), "open /tmp/missing");
    EXPECT_EQ(error.code, errno_code(ENOENT));
    EXPECT_EQ(error.message.rfind("open /tmp/missing: ", 0), 0u);
}

TEST(IoErrorTest, NetworkFailureCarriesDetails) {
    NetworkFailureError error(5, "Connection reset");
    EXPECT_EQ(error.consecutive_errors(), 5u);
    EXPECT_EQ(error.last_error(), "Connection reset");
    EXPECT_NE(std::string(error.what()).find("5 consecutive errors"), std::string::npos);
}
