#include "ingest/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using ingest::Err;
using ingest::Ok;
using ingest::Result;

TEST(ResultTest, HoldsValue) {
    auto result = Ok(42);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.value_or(7), 42);
}

TEST(ResultTest, HoldsError) {
    auto result = Err<int>(std::string("boom"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), "boom");
    EXPECT_EQ(result.value_or(7), 7);
}

TEST(ResultTest, SameValueAndErrorType) {
    Result<std::string> ok = Ok(std::string("value"));
    Result<std::string> err = Err<std::string>(std::string("error"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, TakeMovesValueOut) {
    auto result = Ok(std::string("payload"));
    std::string taken = result.take();
    EXPECT_EQ(taken, "payload");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok = Ok();
    Result<void> err = Err<void>(std::string("failed"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "failed");
}
