#include "ingest/import/session_store.hpp"

#include "ingest/import/serialization.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>

using ingest::import::CopiedFile;
using ingest::import::FileType;
using ingest::import::ImportSessionInfo;
using ingest::import::ImportStatus;
using ingest::import::InMemorySessionStore;
using ingest::import::JsonSessionStore;
using ingest::import::ScannedFile;
using ingest::import::SessionStore;
using ingest::import::session_from_json;
using ingest::import::session_to_json;
using namespace ingest::import::testing;

namespace {

ImportSessionInfo paused_session(const std::string& id) {
    ImportSessionInfo info;
    info.session_id = id;
    info.status = ImportStatus::Paused;
    info.can_resume = true;
    info.last_step = 2;
    info.source_paths = {"/Volumes/TeamShare/day1"};
    info.archive_root = "/archive";
    info.total_files = 2;
    info.total_bytes = 300;
    info.error = "network unavailable, resumable: Connection reset";
    info.started_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

    ingest::import::ScanResult scan;
    ScannedFile file;
    file.id = id + "-1";
    file.filename = "clip.mov";
    file.source_path = "/Volumes/TeamShare/day1/clip.mov";
    file.extension = "mov";
    file.size = 100;
    file.type = FileType::Video;
    file.modified_time = 1699999999;
    scan.files.push_back(file);
    scan.total_files = 1;
    scan.total_bytes = 100;
    scan.video_files = 1;
    info.scan_result = scan;

    ingest::import::HashResult hash;
    ingest::import::HashedFile hashed;
    hashed.scanned = file;
    hash.files.push_back(hashed);
    info.hash_result = hash;

    CopiedFile copied;
    copied.hashed = hashed;
    copied.hashed.hash = "0123456789abcdef";
    copied.archive_path = "/archive/video/01/0123456789abcdef.mov";
    copied.category = "video";
    copied.bucket = "01";
    copied.retry_count = 2;
    info.partial_copies.push_back(copied);
    return info;
}

void expect_round_trip(const ImportSessionInfo& expected, const ImportSessionInfo& actual) {
    EXPECT_EQ(actual.session_id, expected.session_id);
    EXPECT_EQ(actual.status, expected.status);
    EXPECT_EQ(actual.last_step, expected.last_step);
    EXPECT_EQ(actual.can_resume, expected.can_resume);
    EXPECT_EQ(actual.source_paths, expected.source_paths);
    EXPECT_EQ(actual.error, expected.error);
    EXPECT_EQ(actual.started_at, expected.started_at);
    EXPECT_FALSE(actual.completed_at.has_value());
    ASSERT_TRUE(actual.scan_result.has_value());
    ASSERT_EQ(actual.scan_result->files.size(), 1u);
    EXPECT_EQ(actual.scan_result->files[0].source_path, expected.scan_result->files[0].source_path);
    EXPECT_EQ(actual.scan_result->files[0].type, FileType::Video);
    EXPECT_EQ(actual.scan_result->files[0].modified_time, 1699999999);
    ASSERT_TRUE(actual.hash_result.has_value());
    EXPECT_FALSE(actual.hash_result->files[0].hash.has_value());
    EXPECT_FALSE(actual.copy_result.has_value());
    ASSERT_EQ(actual.partial_copies.size(), 1u);
    EXPECT_EQ(*actual.partial_copies[0].archive_path, *expected.partial_copies[0].archive_path);
    EXPECT_EQ(actual.partial_copies[0].retry_count, 2u);
    EXPECT_EQ(*actual.partial_copies[0].hashed.hash, "0123456789abcdef");
    EXPECT_TRUE(actual.partial_copies[0].copied());
}

} // namespace

TEST(SessionSerializationTest, RoundTripsThroughJson) {
    const auto info = paused_session("import-1");
    auto parsed = session_from_json(session_to_json(info));
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    expect_round_trip(info, parsed.value());
}

TEST(SessionSerializationTest, RejectsMalformedDocuments) {
    EXPECT_TRUE(session_from_json(nlohmann::json::array()).is_error());
    EXPECT_TRUE(session_from_json(nlohmann::json{{"status", "paused"}}).is_error());
    EXPECT_TRUE(session_from_json(nlohmann::json{{"session_id", "x"}, {"status", "sleeping"}}).is_error());
}

TEST(SessionStoreTest, InMemoryUpsertAndResumableFilter) {
    InMemorySessionStore store;
    auto paused = paused_session("import-1");
    auto failed = paused_session("import-2");
    failed.status = ImportStatus::Failed;
    failed.can_resume = false;

    ASSERT_TRUE(store.save(paused).is_ok());
    ASSERT_TRUE(store.save(failed).is_ok());
    paused.total_files = 99;
    ASSERT_TRUE(store.save(paused).is_ok());

    EXPECT_EQ(store.list().size(), 2u);
    auto resumable = store.list_resumable();
    ASSERT_EQ(resumable.size(), 1u);
    EXPECT_EQ(resumable[0].session_id, "import-1");
    EXPECT_EQ(resumable[0].total_files, 99u);

    ASSERT_TRUE(store.remove("import-1").is_ok());
    EXPECT_TRUE(store.load("import-1").is_error());
}

TEST(SessionStoreTest, JsonStorePersistsAcrossInstances) {
    const auto dir = create_temp_dir("ingest_sessions");
    const auto info = paused_session("import-7");
    {
        JsonSessionStore store(dir / "state");
        ASSERT_TRUE(store.save(info).is_ok());
    }

    JsonSessionStore reopened(dir / "state");
    auto loaded = reopened.load("import-7");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    expect_round_trip(info, loaded.value());

    EXPECT_FALSE(fs::exists(dir / "state" / "import-7.json.tmp"));
    EXPECT_EQ(reopened.list_resumable().size(), 1u);
}

TEST(SessionStoreTest, JsonStoreSkipsCorruptFiles) {
    const auto dir = create_temp_dir("ingest_sessions");
    JsonSessionStore store(dir);
    ASSERT_TRUE(store.save(paused_session("import-1")).is_ok());
    write_file(dir / "garbage.json", "{ not json");

    auto sessions = store.list();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].session_id, "import-1");
    EXPECT_TRUE(store.load("garbage").is_error());
}

TEST(SessionStoreTest, MissingSessionIsAnError) {
    const auto dir = create_temp_dir("ingest_sessions");
    std::unique_ptr<SessionStore> store = std::make_unique<JsonSessionStore>(dir);
    EXPECT_TRUE(store->load("nope").is_error());
    EXPECT_TRUE(store->remove("nope").is_error());
}
