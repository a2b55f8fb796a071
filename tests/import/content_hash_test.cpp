#include "ingest/import/content_hash.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using ingest::import::ContentHash;
using ingest::import::hash_bytes;
using ingest::import::hash_stream;

TEST(ContentHashTest, KnownVectors) {
    EXPECT_EQ(hash_bytes(""), "cbf29ce484222325");
    EXPECT_EQ(hash_bytes("a"), "af63dc4c8601ec8c");
    EXPECT_EQ(hash_bytes("foobar"), "85944171f73967e8");
}

TEST(ContentHashTest, AlwaysSixteenLowercaseHexChars) {
    const auto hash = hash_bytes("some media bytes");
    ASSERT_EQ(hash.size(), 16u);
    for (char c : hash) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << hash;
    }
}

TEST(ContentHashTest, StreamingMatchesOneShot) {
    std::string data(100000, '\0');
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>(i * 31 % 251);
    }

    std::istringstream input(data);
    EXPECT_EQ(hash_stream(input, 4096), hash_bytes(data));

    ContentHash incremental;
    incremental.update(data.data(), 10);
    incremental.update(data.data() + 10, data.size() - 10);
    EXPECT_EQ(incremental.hex(), hash_bytes(data));
}

TEST(ContentHashTest, DifferentContentDifferentHash) {
    EXPECT_NE(hash_bytes("frame-1"), hash_bytes("frame-2"));
}

TEST(ContentHashTest, ResetRestartsDigest) {
    ContentHash hash;
    hash.update("abc", 3);
    hash.reset();
    EXPECT_EQ(hash.hex(), hash_bytes(""));
}
