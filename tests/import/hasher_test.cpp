#include "ingest/import/hasher.hpp"

#include "ingest/import/catalog.hpp"
#include "ingest/import/content_hash.hpp"
#include "ingest/import/scanner.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <memory>
#include <thread>

using ingest::import::Hasher;
using ingest::import::HashOptions;
using ingest::import::InMemoryCatalog;
using ingest::import::Scanner;
using ingest::import::TimeoutRunner;
using ingest::import::hash_bytes;
using namespace ingest::import::testing;

namespace {

ingest::import::ScanResult scan_dir(const fs::path& root) {
    Scanner scanner;
    return scanner.scan({root}, "hash");
}

} // namespace

TEST(HasherTest, HashDependsOnlyOnContent) {
    const auto root = create_temp_dir("ingest_hasher");
    write_file(root / "a" / "first.mov", "same content");
    write_file(root / "b" / "renamed.mp4", "same content");

    FaultyFileOperations ops;
    TimeoutRunner runner;
    Hasher hasher(ops, runner);

    auto result = hasher.hash_batch(scan_dir(root).files);
    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_EQ(*result.files[0].hash, hash_bytes("same content"));
    EXPECT_EQ(*result.files[1].hash, *result.files[0].hash);
}

TEST(HasherTest, FlagsLaterCopiesWithinBatch) {
    const auto root = create_temp_dir("ingest_hasher");
    write_file(root / "1.jpg", "pixels");
    write_file(root / "2.jpg", "other pixels");
    write_file(root / "3.jpg", "pixels");

    FaultyFileOperations ops;
    TimeoutRunner runner;
    Hasher hasher(ops, runner);

    auto result = hasher.hash_batch(scan_dir(root).files);
    EXPECT_EQ(result.total_hashed, 3u);
    EXPECT_EQ(result.total_duplicates, 1u);
    EXPECT_FALSE(result.files[0].is_duplicate);
    EXPECT_FALSE(result.files[1].is_duplicate);
    EXPECT_TRUE(result.files[2].is_duplicate);
    EXPECT_EQ(result.files[2].duplicate_in, "batch");
}

TEST(HasherTest, FlagsContentAlreadyInCatalog) {
    const auto root = create_temp_dir("ingest_hasher");
    write_file(root / "clip.mov", "archived before");

    InMemoryCatalog catalog;
    catalog.add_existing(hash_bytes("archived before"), "/archive/video/ab/old.mov");

    FaultyFileOperations ops;
    TimeoutRunner runner;
    Hasher hasher(ops, runner, &catalog);

    auto result = hasher.hash_batch(scan_dir(root).files);
    ASSERT_TRUE(result.files[0].is_duplicate);
    EXPECT_EQ(result.files[0].duplicate_in, "/archive/video/ab/old.mov");
}

TEST(HasherTest, HashFailureStaysInBatch) {
    const auto root = create_temp_dir("ingest_hasher");
    write_file(root / "ok.jpg", "fine");
    write_file(root / "locked.jpg", "locked");

    FaultyFileOperations ops;
    ops.set_hash_failure([](const fs::path& path) -> std::optional<int> {
        if (path.filename() == "locked.jpg") {
            return EACCES;
        }
        return std::nullopt;
    });
    TimeoutRunner runner;
    Hasher hasher(ops, runner);

    auto result = hasher.hash_batch(scan_dir(root).files);
    ASSERT_EQ(result.files.size(), 2u);
    EXPECT_EQ(result.total_errors, 1u);
    EXPECT_EQ(result.total_hashed, 1u);
    EXPECT_TRUE(result.files[0].hash_error.has_value());
    EXPECT_FALSE(result.files[0].hash.has_value());
}

TEST(HasherTest, DeferredHashingLeavesHashesEmpty) {
    const auto root = create_temp_dir("ingest_hasher");
    write_file(root / "clip.mov", "network bytes");

    FaultyFileOperations ops;
    TimeoutRunner runner;
    Hasher hasher(ops, runner);

    HashOptions options;
    options.defer_hashing = true;
    auto result = hasher.hash_batch(scan_dir(root).files, options);

    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_FALSE(result.files[0].hash.has_value());
    EXPECT_EQ(result.total_hashed, 0u);
    EXPECT_EQ(ops.hash_calls.load(), 0);
}

TEST(HasherTest, MarkDuplicatesKeepsExistingFlags) {
    FaultyFileOperations ops;
    TimeoutRunner runner;
    Hasher hasher(ops, runner);

    std::vector<ingest::import::HashedFile> files(3);
    files[0].hash = "aaaa";
    files[1].hash = "aaaa";
    files[1].is_duplicate = true;
    files[1].duplicate_in = "batch";
    files[2].hash = "aaaa";

    EXPECT_EQ(hasher.mark_duplicates(files), 1u);
    EXPECT_FALSE(files[0].is_duplicate);
    EXPECT_TRUE(files[2].is_duplicate);
}

TEST(HasherTest, StalledHashTimesOutAndOutlivesHasher) {
    const auto root = create_temp_dir("ingest_hasher");
    write_file(root / "slow.jpg", "slow");
    write_file(root / "slower.jpg", "slower");
    const auto scanned = scan_dir(root).files;

    FaultyFileOperations ops;
    ops.hash_stall_ms = 200;
    TimeoutRunner runner(1);
    auto hasher = std::make_unique<Hasher>(ops, runner, nullptr, std::chrono::milliseconds{20});

    // The second call is still queued behind the first when it is abandoned
    auto first = hasher->hash_file(scanned[0], 64 * 1024);
    auto second = hasher->hash_file(scanned[1], 64 * 1024);
    EXPECT_NE(first.hash_error.value_or("").find("timed out"), std::string::npos);
    EXPECT_NE(second.hash_error.value_or("").find("timed out"), std::string::npos);

    hasher.reset();
    std::this_thread::sleep_for(std::chrono::milliseconds{250});
    EXPECT_GE(ops.hash_calls.load(), 1);
}
