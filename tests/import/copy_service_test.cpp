#include "ingest/import/copy_service.hpp"

#include "ingest/import/content_hash.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <string>
#include <vector>

using ingest::NetworkFailureError;
using ingest::import::CopiedFile;
using ingest::import::CopyOptions;
using ingest::import::CopyService;
using ingest::import::FileType;
using ingest::import::HashedFile;
using ingest::import::TimeoutRunner;
using ingest::import::hash_bytes;
using namespace ingest::import::testing;

namespace {

HashedFile make_file(const fs::path& dir, const std::string& name, const std::string& content,
                     FileType type = FileType::Video, bool with_hash = true) {
    HashedFile file;
    file.scanned.id = "copy-" + name;
    file.scanned.filename = name;
    file.scanned.source_path = dir / name;
    file.scanned.extension = fs::path(name).extension().string().substr(1);
    file.scanned.size = content.size();
    file.scanned.type = type;
    write_file(file.scanned.source_path, content);
    if (with_hash) {
        file.hash = hash_bytes(content);
    }
    return file;
}

std::optional<int> always(int code, const fs::path&) {
    return code;
}

} // namespace

TEST(CopyServiceTest, CopiesIntoContentAddressedLayout) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto file = make_file(source, "clip.mov", "frame data");

    FaultyFileOperations ops;
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy());

    auto copied = copier.copy_file(file, sequential_storage());
    ASSERT_TRUE(copied.copied()) << copied.copy_error.value_or("");

    const auto hash = *file.hash;
    EXPECT_EQ(*copied.archive_path, archive / "video" / hash.substr(0, 2) / (hash + ".mov"));
    EXPECT_EQ(read_file(*copied.archive_path), "frame data");
    EXPECT_EQ(copied.category, "video");
    EXPECT_EQ(copied.bucket, hash.substr(0, 2));
    EXPECT_EQ(copied.retry_count, 0u);
    EXPECT_TRUE(fs::is_empty(copier.staging_dir()));
}

TEST(CopyServiceTest, RetriesTransportErrorsUpToLimit) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto file = make_file(source, "clip.mov", "data");

    FaultyFileOperations ops;
    ops.set_copy_failure([](const fs::path& p) { return always(ECONNRESET, p); });
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy(3, 10));

    auto copied = copier.copy_file(file, sequential_storage());
    EXPECT_FALSE(copied.copied());
    EXPECT_TRUE(copied.copy_error.has_value());
    EXPECT_FALSE(copied.archive_path.has_value());
    EXPECT_EQ(ops.copy_calls.load(), 4);
    EXPECT_EQ(copied.retry_count, 3u);
    EXPECT_EQ(copier.consecutive_errors(), 1u);
}

TEST(CopyServiceTest, RecoversAfterTransientFailures) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto file = make_file(source, "clip.mov", "data");

    FaultyFileOperations ops;
    int failures_left = 2;
    ops.set_copy_failure([&failures_left](const fs::path&) -> std::optional<int> {
        if (failures_left > 0) {
            --failures_left;
            return ETIMEDOUT;
        }
        return std::nullopt;
    });
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy());

    auto copied = copier.copy_file(file, sequential_storage());
    ASSERT_TRUE(copied.copied());
    EXPECT_EQ(copied.retry_count, 2u);
    EXPECT_EQ(ops.copy_calls.load(), 3);
    EXPECT_EQ(copier.consecutive_errors(), 0u);
}

TEST(CopyServiceTest, FatalErrorIsNotRetried) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto file = make_file(source, "clip.mov", "data");

    FaultyFileOperations ops;
    ops.set_copy_failure([](const fs::path& p) { return always(EACCES, p); });
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy());

    auto copied = copier.copy_file(file, sequential_storage());
    EXPECT_FALSE(copied.copied());
    EXPECT_EQ(ops.copy_calls.load(), 1);
    EXPECT_EQ(copied.retry_count, 0u);
    EXPECT_EQ(copier.consecutive_errors(), 0u);
}

TEST(CopyServiceTest, ConsecutiveNetworkFailuresAbortBatch) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    std::vector<HashedFile> files;
    for (int i = 0; i < 5; ++i) {
        files.push_back(make_file(source, "clip" + std::to_string(i) + ".mov", "content " + std::to_string(i)));
    }

    FaultyFileOperations ops;
    ops.set_copy_failure([](const fs::path& p) { return always(ENETUNREACH, p); });
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy(0, 3));

    std::vector<std::string> completed;
    CopyOptions options;
    options.storage = sequential_storage();
    options.on_file_complete = [&completed](const CopiedFile& f) { completed.push_back(f.id()); };

    EXPECT_THROW(copier.copy_batch(files, options), NetworkFailureError);
    EXPECT_EQ(completed.size(), 3u);
    EXPECT_EQ(ops.copy_calls.load(), 3);
}

TEST(CopyServiceTest, SuccessBetweenFailuresKeepsBatchAlive) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    std::vector<HashedFile> files{
        make_file(source, "bad1.mov", "1"),
        make_file(source, "bad2.mov", "2"),
        make_file(source, "good.mov", "3"),
        make_file(source, "bad3.mov", "4"),
        make_file(source, "bad4.mov", "5"),
    };

    FaultyFileOperations ops;
    ops.set_copy_failure([](const fs::path& p) -> std::optional<int> {
        if (p.filename().string().rfind("bad", 0) == 0) {
            return ECONNRESET;
        }
        return std::nullopt;
    });
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy(0, 3));

    CopyOptions options;
    options.storage = sequential_storage();
    auto result = copier.copy_batch(files, options);
    EXPECT_EQ(result.total_copied, 1u);
    EXPECT_EQ(result.total_errors, 4u);
}

TEST(CopyServiceTest, SkipsDuplicatesAndUnhashedFiles) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto keep = make_file(source, "keep.jpg", "a", FileType::Image);
    auto dup = make_file(source, "dup.jpg", "a", FileType::Image);
    dup.is_duplicate = true;
    dup.duplicate_in = "batch";
    auto broken = make_file(source, "broken.jpg", "b", FileType::Image);
    broken.hash.reset();
    broken.hash_error = "Failed to open";

    FaultyFileOperations ops;
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy());

    CopyOptions options;
    options.storage = sequential_storage();
    auto result = copier.copy_batch({keep, dup, broken}, options);

    ASSERT_EQ(result.files.size(), 3u);
    EXPECT_TRUE(result.files[0].copied());
    EXPECT_EQ(result.files[1].copy_error, "Duplicate");
    EXPECT_EQ(result.files[2].copy_error, "Failed to open");
    EXPECT_EQ(result.total_copied, 1u);
    EXPECT_EQ(result.total_errors, 1u);
    EXPECT_EQ(ops.copy_calls.load(), 1);
}

TEST(CopyServiceTest, ParallelBatchPreservesOrder) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    std::vector<HashedFile> files;
    for (int i = 0; i < 9; ++i) {
        files.push_back(make_file(source, "img" + std::to_string(i) + ".jpg", "pixels " + std::to_string(i),
                                  FileType::Image));
    }

    FaultyFileOperations ops;
    TimeoutRunner runner(5);
    CopyService copier(ops, runner, archive, fast_policy());

    CopyOptions options;
    options.storage = ingest::import::StorageClassifier::config_for_type(ingest::import::StorageType::Local);
    auto result = copier.copy_batch(files, options);

    EXPECT_EQ(result.strategy, "parallel");
    EXPECT_EQ(result.total_copied, 9u);
    for (std::size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(result.files[i].id(), files[i].id());
        EXPECT_EQ(read_file(*result.files[i].archive_path), "pixels " + std::to_string(i));
    }
}

TEST(CopyServiceTest, HashesInlineWhenHashWasDeferred) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto file = make_file(source, "remote.mov", "over the wire", FileType::Video, false);

    FaultyFileOperations ops;
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy());

    auto copied = copier.copy_file(file, sequential_storage());
    ASSERT_TRUE(copied.copied());
    EXPECT_EQ(copied.hashed.hash, hash_bytes("over the wire"));
    EXPECT_EQ(ops.hash_calls.load(), 0);
}

TEST(CopyServiceTest, AbortCancelsRemainingFiles) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    std::vector<HashedFile> files{make_file(source, "a.mov", "a"), make_file(source, "b.mov", "b")};

    FaultyFileOperations ops;
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy());

    CopyOptions options;
    options.storage = sequential_storage();
    options.on_file_complete = [&options](const CopiedFile&) { options.abort.abort(); };

    auto result = copier.copy_batch(files, options);
    EXPECT_TRUE(result.files[0].copied());
    EXPECT_EQ(result.files[1].copy_error, "Cancelled");
}

TEST(CopyServiceTest, RollbackRemovesArchivedFile) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto file = make_file(source, "clip.mov", "data");

    FaultyFileOperations ops;
    TimeoutRunner runner;
    CopyService copier(ops, runner, archive, fast_policy());

    auto copied = copier.copy_file(file, sequential_storage());
    ASSERT_TRUE(copied.copied());
    ASSERT_TRUE(copier.rollback(*copied.archive_path).is_ok());
    EXPECT_FALSE(fs::exists(*copied.archive_path));
}

TEST(CopyServiceTest, StalledCopyTimesOutAndIsRetried) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    auto file = make_file(source, "clip.mov", "data");

    FaultyFileOperations ops;
    ops.copy_stall_ms = 300;
    auto policy = fast_policy(1, 10);
    policy.timeout = std::chrono::milliseconds{30};
    TimeoutRunner runner(4);
    CopyService copier(ops, runner, archive, policy);

    const auto started = std::chrono::steady_clock::now();
    auto copied = copier.copy_file(file, sequential_storage());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds{250});
    EXPECT_FALSE(copied.copied());
    EXPECT_EQ(copied.retry_count, 1u);
    EXPECT_NE(copied.copy_error.value_or("").find("timed out"), std::string::npos);
    EXPECT_EQ(ops.copy_calls.load(), 2);
}

TEST(CopyServiceTest, TimeoutsCountTowardNetworkThreshold) {
    const auto source = create_temp_dir("ingest_copy_src");
    const auto archive = create_temp_dir("ingest_copy_archive");
    std::vector<HashedFile> files{
        make_file(source, "a.mov", "a"),
        make_file(source, "b.mov", "b"),
        make_file(source, "c.mov", "c"),
    };

    FaultyFileOperations ops;
    ops.copy_stall_ms = 300;
    auto policy = fast_policy(0, 2);
    policy.timeout = std::chrono::milliseconds{20};
    TimeoutRunner runner(4);
    CopyService copier(ops, runner, archive, policy);

    CopyOptions options;
    options.storage = sequential_storage();
    EXPECT_THROW(copier.copy_batch(files, options), NetworkFailureError);
    EXPECT_EQ(ops.copy_calls.load(), 2);
}
