#include <gtest/gtest.h>
#include "backup/backup_manifest.hpp"
#include "common/utils.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using namespace testing_support;

TEST(BackupManifestTest, CatalogCountsFilesAndSkipsItself) {
    TempDir dir;
    writeFile(dir.path() / "a.txt", "12345");
    writeFile(dir.path() / "nested/b.txt", "123");
    writeFile(dir.path() / BackupManifest::kFileName, "{}");

    BackupManifest manifest;
    manifest.catalog(dir.path());

    EXPECT_EQ(manifest.fileCount, 2u);
    EXPECT_EQ(manifest.totalSize, 8u);
    EXPECT_EQ(manifest.fileCount, manifest.files.size());
    ASSERT_EQ(manifest.files.count("nested/b.txt"), 1u);
    EXPECT_EQ(manifest.files.at("nested/b.txt").size, 3u);
    EXPECT_EQ(manifest.files.count(BackupManifest::kFileName), 0u);
}

TEST(BackupManifestTest, UnchangedNeedsSameSizeAndMtime) {
    BackupManifest manifest;
    manifest.files["x"] = {10, 1700000000.25};

    EXPECT_TRUE(manifest.isUnchanged("x", 10, 1700000000.25));
    EXPECT_FALSE(manifest.isUnchanged("x", 11, 1700000000.25));
    EXPECT_FALSE(manifest.isUnchanged("x", 10, 1700000001.25));
    EXPECT_FALSE(manifest.isUnchanged("y", 10, 1700000000.25));
}

TEST(BackupManifestTest, SaveAndLoadKeepsRecordedFields) {
    TempDir dir;
    writeFile(dir.path() / "data.bin", "abcdef");

    BackupManifest manifest;
    manifest.createdAt = "2024-01-01T00:00:00";
    manifest.sourceHostname = "old-box";
    manifest.backupMode = "smart";
    manifest.catalog(dir.path());
    manifest.checksums["data.bin"] = "deadbeef";
    ASSERT_TRUE(manifest.save(dir.path() / BackupManifest::kFileName));

    auto loaded = BackupManifest::load(dir.path() / BackupManifest::kFileName);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->version, BackupManifest::kVersion);
    EXPECT_EQ(loaded->sourceHostname, "old-box");
    EXPECT_EQ(loaded->backupMode, "smart");
    EXPECT_EQ(loaded->fileCount, 1u);
    EXPECT_EQ(loaded->totalSize, 6u);
    EXPECT_EQ(loaded->checksums.at("data.bin"), "deadbeef");
    EXPECT_TRUE(loaded->isUnchanged("data.bin", 6, utils::modificationTime(dir.path() / "data.bin")));
}

TEST(BackupManifestTest, LoadOfMissingOrBrokenFileIsEmpty) {
    TempDir dir;
    EXPECT_FALSE(BackupManifest::load(dir.path() / "nothing.json").has_value());

    writeFile(dir.path() / "broken.json", "{ not json");
    EXPECT_FALSE(BackupManifest::load(dir.path() / "broken.json").has_value());
}
