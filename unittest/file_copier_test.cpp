#include <gtest/gtest.h>
#include "backup/file_copier.hpp"
#include "common/utils.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using namespace testing_support;

TEST(ExclusionFilterTest, MatchesAnyPathComponent) {
    ExclusionFilter filter({"Cache", "*.log", "*.tmp"});

    EXPECT_TRUE(filter.excludes("Cache/x.jpg"));
    EXPECT_TRUE(filter.excludes("Media/Cache/y"));
    EXPECT_TRUE(filter.excludes("Logs/server.log"));
    EXPECT_TRUE(filter.excludes("upload.tmp"));
    EXPECT_FALSE(filter.excludes("Media/poster.jpg"));
    EXPECT_FALSE(filter.excludes("Cached/poster.jpg"));
}

TEST(FileCopierTest, PlanSkipsExcludedDirectories) {
    TempDir source;
    TempDir destination;
    writeFile(source.path() / "keep.txt", "1234");
    writeFile(source.path() / "Cache/a/b/c.bin", "xxxxxxxx");
    writeFile(source.path() / "sub/drop.log", "log");

    FileCopier copier(ExclusionFilter({"Cache", "*.log"}));
    CopyPlan plan = copier.plan(source.path(), destination.path());

    ASSERT_EQ(plan.items.size(), 1u);
    EXPECT_EQ(plan.items[0].relativePath, "keep.txt");
    EXPECT_EQ(plan.totalBytes, 4u);
    EXPECT_EQ(plan.items[0].destination, destination.path() / "keep.txt");
}

TEST(FileCopierTest, PlanLeavesOutFilesRecordedInManifest) {
    TempDir source;
    writeFile(source.path() / "old.txt", "same");
    writeFile(source.path() / "new.txt", "fresh");

    BackupManifest previous;
    previous.files["old.txt"] = {4, utils::modificationTime(source.path() / "old.txt")};

    FileCopier copier;
    CopyPlan plan = copier.plan(source.path(), source.path() / "out", &previous);

    ASSERT_EQ(plan.items.size(), 1u);
    EXPECT_EQ(plan.items[0].relativePath, "new.txt");
    EXPECT_EQ(plan.skipped, 1u);
}

TEST(FileCopierTest, CopyPreservesContentAndMtime) {
    TempDir dir;
    writeFile(dir.path() / "src/file.bin", "payload");

    CopyItem item;
    item.source = dir.path() / "src/file.bin";
    item.destination = dir.path() / "deep/er/file.bin";
    item.relativePath = "file.bin";
    item.size = 7;

    std::string error;
    ASSERT_TRUE(FileCopier::copyFile(item, error)) << error;
    EXPECT_EQ(readFile(item.destination), "payload");
    EXPECT_DOUBLE_EQ(utils::modificationTime(item.destination), utils::modificationTime(item.source));
}

TEST(FileCopierTest, CopyOfMissingSourceReportsError) {
    TempDir dir;
    CopyItem item;
    item.source = dir.path() / "missing";
    item.destination = dir.path() / "out";

    std::string error;
    EXPECT_FALSE(FileCopier::copyFile(item, error));
    EXPECT_FALSE(error.empty());
}

TEST(FileCopierTest, MeasureSumsFilesAndDirectories) {
    TempDir dir;
    writeFile(dir.path() / "a/one", std::string(10, '1'));
    writeFile(dir.path() / "a/two", std::string(20, '2'));
    writeFile(dir.path() / "single", std::string(5, '5'));

    FileCopier copier;
    EXPECT_EQ(copier.measure({(dir.path() / "a").string(), (dir.path() / "single").string()}), 35u);
    EXPECT_EQ(copier.measure({(dir.path() / "absent").string()}), 0u);
}
