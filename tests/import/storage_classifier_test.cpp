#include "ingest/import/storage_classifier.hpp"

#include <gtest/gtest.h>

using ingest::import::StorageClassifier;
using ingest::import::StorageType;

TEST(StorageClassifierTest, NetworkPrefixes) {
    StorageClassifier classifier;
    EXPECT_TRUE(classifier.is_network_path("smb://nas/share/clip.mov"));
    EXPECT_TRUE(classifier.is_network_path("NFS://server/export"));
    EXPECT_TRUE(classifier.is_network_path("afp://mac/share"));
    EXPECT_TRUE(classifier.is_network_path("cifs://host/share"));
    EXPECT_TRUE(classifier.is_network_path("//nas/share"));
    EXPECT_TRUE(classifier.is_network_path("\\\\nas\\share"));
}

TEST(StorageClassifierTest, KnownVolumesAreLocal) {
    StorageClassifier classifier;
    EXPECT_FALSE(classifier.is_network_path("/Volumes/Macintosh HD/Users/me"));
    EXPECT_FALSE(classifier.is_network_path("/Volumes/SDCARD/DCIM/100CANON"));
    EXPECT_FALSE(classifier.is_network_path("/Volumes/EOS_DIGITAL/DCIM"));
    EXPECT_FALSE(classifier.is_network_path("/Volumes/Untitled"));
    EXPECT_FALSE(classifier.is_network_path("/Volumes/GoPro Hero"));
}

TEST(StorageClassifierTest, UnknownVolumeIsNetwork) {
    StorageClassifier classifier;
    EXPECT_TRUE(classifier.is_network_path("/Volumes/TeamShare/projects"));
    EXPECT_EQ(classifier.classify("/Volumes/TeamShare"), StorageType::Network);
}

TEST(StorageClassifierTest, OnlyVolumeNameIsInspected) {
    StorageClassifier classifier;
    // A DCIM folder below an unknown volume does not make it local
    EXPECT_TRUE(classifier.is_network_path("/Volumes/TeamShare/DCIM/clip.mov"));
    EXPECT_EQ(StorageClassifier::volume_name("/Volumes/TeamShare/DCIM"), "TeamShare");
    EXPECT_FALSE(StorageClassifier::volume_name("/home/me/Volumes/x").has_value());
}

TEST(StorageClassifierTest, EmptyVolumeNameIsNetwork) {
    StorageClassifier classifier;
    EXPECT_EQ(StorageClassifier::volume_name("/Volumes/"), "");
    EXPECT_TRUE(classifier.is_network_path("/Volumes/"));
    EXPECT_TRUE(classifier.is_network_path("/Volumes//DCIM"));
}

TEST(StorageClassifierTest, MountPointsAreNetwork) {
    StorageClassifier classifier;
    EXPECT_TRUE(classifier.is_network_path("/mnt/nas/footage"));
    EXPECT_TRUE(classifier.is_network_path("/media/share"));
}

TEST(StorageClassifierTest, EverythingElseIsLocal) {
    StorageClassifier classifier;
    EXPECT_FALSE(classifier.is_network_path("/home/me/footage"));
    EXPECT_FALSE(classifier.is_network_path("relative/path"));
    EXPECT_FALSE(classifier.is_network_path(""));
}

TEST(StorageClassifierTest, CustomVolumePattern) {
    StorageClassifier classifier;
    ASSERT_TRUE(classifier.is_network_path("/Volumes/RaidArray"));
    classifier.add_local_volume_pattern("Raid");
    EXPECT_FALSE(classifier.is_network_path("/Volumes/RaidArray"));
}

TEST(StorageClassifierTest, ConfigForType) {
    auto network = StorageClassifier::config_for_type(StorageType::Network);
    EXPECT_EQ(network.buffer_size, 1024u * 1024u);
    EXPECT_EQ(network.concurrency, 1u);
    EXPECT_EQ(network.operation_delay.count(), 50);

    auto local = StorageClassifier::config_for_type(StorageType::Local);
    EXPECT_EQ(local.buffer_size, 64u * 1024u);
    EXPECT_EQ(local.concurrency, 4u);
    EXPECT_EQ(local.operation_delay.count(), 0);
}

TEST(StorageClassifierTest, BatchUsesMostConstrainedPolicy) {
    StorageClassifier classifier;
    EXPECT_EQ(classifier.config_for_paths({"/home/a", "/mnt/nas/b"}).type, StorageType::Network);
    EXPECT_EQ(classifier.config_for_paths({"/home/a", "/tmp/b"}).type, StorageType::Local);
    EXPECT_EQ(classifier.config_for_paths({}).type, StorageType::Local);
}
