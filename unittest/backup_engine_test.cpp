#include <gtest/gtest.h>
#include "backup/backup_engine.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace testing_support;

class BackupEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_ = makeTestContext(data_.path());
        test_.context->settings.layout.excludePatterns.clear();
        app_ = data_.path() / "Plex Media Server";
        writeFile(app_ / "one.txt", std::string(100, 'a'));
        writeFile(app_ / "two/two.txt", std::string(100, 'b'));
        writeFile(app_ / "two/three/three.txt", std::string(100, 'c'));
        engine_ = std::make_unique<BackupEngine>(test_.context);
    }

    BackupOptions options(BackupMode mode) const {
        BackupOptions result;
        result.destination = destination_.path().string();
        result.mode = mode;
        result.verify = false;
        return result;
    }

    void runToEnd(BackupMode mode) {
        ASSERT_TRUE(engine_->start(options(mode)));
        ASSERT_TRUE(engine_->waitFor(std::chrono::seconds(30)));
    }

    TempDir data_;
    TempDir destination_;
    fs::path app_;
    TestContext test_;
    std::unique_ptr<BackupEngine> engine_;
};

TEST_F(BackupEngineTest, HotBackupCopiesEveryFile) {
    runToEnd(BackupMode::HOT);

    auto progress = engine_->getProgress();
    EXPECT_EQ(progress.status, BackupStatus::COMPLETED);
    EXPECT_EQ(progress.filesDone, 3u);
    EXPECT_EQ(progress.bytesDone, 300u);
    EXPECT_EQ(engine_->getState(), Job::State::COMPLETED);

    auto manifest = engine_->getManifest();
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->fileCount, 3u);
    EXPECT_EQ(manifest->totalSize, 300u);
    EXPECT_EQ(manifest->files.count(BackupManifest::kFileName), 0u);

    fs::path root = engine_->backupRoot();
    EXPECT_EQ(readFile(root / "two/three/three.txt"), std::string(100, 'c'));
    EXPECT_TRUE(fs::exists(root / BackupManifest::kFileName));
    EXPECT_EQ(test_.service->stopCalls.load(), 0);
}

TEST_F(BackupEngineTest, IncrementalCopiesOnlyChangedFiles) {
    runToEnd(BackupMode::HOT);
    writeFile(app_ / "one.txt", std::string(120, 'z'));

    runToEnd(BackupMode::INCREMENTAL);

    auto progress = engine_->getProgress();
    EXPECT_EQ(progress.status, BackupStatus::COMPLETED);
    EXPECT_EQ(progress.filesDone, 1u);
    EXPECT_EQ(progress.bytesDone, 120u);
}

TEST_F(BackupEngineTest, IncrementalIsIdempotent) {
    runToEnd(BackupMode::INCREMENTAL);
    runToEnd(BackupMode::INCREMENTAL);

    auto progress = engine_->getProgress();
    EXPECT_EQ(progress.status, BackupStatus::COMPLETED);
    EXPECT_EQ(progress.filesDone, 0u);
}

TEST_F(BackupEngineTest, ExclusionPatternsSkipClutter) {
    test_.context->settings.layout.excludePatterns = {"Cache", "*.log"};
    engine_ = std::make_unique<BackupEngine>(test_.context);
    writeFile(app_ / "Cache/big.bin", std::string(1000, 'x'));
    writeFile(app_ / "two/server.log", "noise");

    runToEnd(BackupMode::HOT);

    fs::path root = engine_->backupRoot();
    EXPECT_EQ(engine_->getProgress().filesDone, 3u);
    EXPECT_FALSE(fs::exists(root / "Cache"));
    EXPECT_FALSE(fs::exists(root / "two/server.log"));
}

TEST_F(BackupEngineTest, ColdBackupRestartsService) {
    runToEnd(BackupMode::COLD);

    EXPECT_EQ(engine_->getProgress().status, BackupStatus::COMPLETED);
    EXPECT_EQ(test_.service->stopCalls.load(), 1);
    EXPECT_EQ(test_.service->startCalls.load(), 1);
    EXPECT_TRUE(test_.service->isRunning());
}

TEST_F(BackupEngineTest, SmartBackupLeavesStoppedServiceAlone) {
    test_.service->setRunning(false);
    runToEnd(BackupMode::SMART);

    EXPECT_EQ(engine_->getProgress().status, BackupStatus::COMPLETED);
    EXPECT_EQ(test_.service->stopCalls.load(), 0);
    EXPECT_EQ(test_.service->startCalls.load(), 0);
}

TEST_F(BackupEngineTest, CancelledColdBackupStillRestartsService) {
    for (int i = 0; i < 200; ++i) {
        writeFile(app_ / ("bulk/file" + std::to_string(i) + ".bin"), std::string(4096, 'q'));
    }

    std::atomic<bool> cancelRequested{false};
    engine_->addProgressObserver([this, &cancelRequested](const BackupProgress& progress) {
        if (progress.status == BackupStatus::COPYING && progress.filesDone > 0 && !cancelRequested.exchange(true)) {
            engine_->cancel();
        }
    });

    runToEnd(BackupMode::COLD);

    EXPECT_EQ(engine_->getProgress().status, BackupStatus::CANCELLED);
    EXPECT_EQ(engine_->getState(), Job::State::CANCELLED);
    EXPECT_EQ(test_.service->stopCalls.load(), 1);
    EXPECT_EQ(test_.service->startCalls.load(), 1);
    EXPECT_TRUE(test_.service->isRunning());
}

TEST_F(BackupEngineTest, ThrowingObserverDoesNotStopBackup) {
    std::atomic<int> laterCalls{0};
    engine_->addProgressObserver([](const BackupProgress&) { throw std::runtime_error("observer broke"); });
    engine_->addProgressObserver([&laterCalls](const BackupProgress&) { laterCalls++; });

    runToEnd(BackupMode::HOT);

    EXPECT_EQ(engine_->getProgress().status, BackupStatus::COMPLETED);
    EXPECT_GT(laterCalls.load(), 0);
}

TEST_F(BackupEngineTest, BytesNeverRegress) {
    std::mutex mutex;
    std::vector<uint64_t> seen;
    bool withinTotal = true;
    engine_->addProgressObserver([&](const BackupProgress& progress) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(progress.bytesDone);
        if (progress.bytesDone > progress.bytesTotal) {
            withinTotal = false;
        }
    });

    runToEnd(BackupMode::SMART);

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(seen.empty());
    for (size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GE(seen[i], seen[i - 1]);
    }
    EXPECT_TRUE(withinTotal);
}

TEST_F(BackupEngineTest, SecondStartWhileRunningIsRefused) {
    for (int i = 0; i < 300; ++i) {
        writeFile(app_ / ("bulk/file" + std::to_string(i) + ".bin"), std::string(8192, 'q'));
    }

    ASSERT_TRUE(engine_->start(options(BackupMode::HOT)));
    bool second = engine_->start(options(BackupMode::HOT));
    if (engine_->isRunning()) {
        EXPECT_FALSE(second);
    }
    engine_->wait();
}

TEST_F(BackupEngineTest, MissingDataDirectoryFails) {
    test_.context->settings.layout.dataDirectory = (data_.path() / "absent").string();
    test_.context->pathResolver = std::make_shared<FixedPathResolver>(test_.context->settings.layout);
    engine_ = std::make_unique<BackupEngine>(test_.context);

    runToEnd(BackupMode::HOT);

    EXPECT_EQ(engine_->getProgress().status, BackupStatus::FAILED);
    EXPECT_EQ(engine_->getState(), Job::State::FAILED);
    EXPECT_FALSE(engine_->getError().empty());
}

TEST_F(BackupEngineTest, VerificationWarnsAboutMissingCriticalFiles) {
    auto withVerify = options(BackupMode::HOT);
    withVerify.verify = true;
    ASSERT_TRUE(engine_->start(withVerify));
    engine_->wait();

    auto progress = engine_->getProgress();
    EXPECT_EQ(progress.status, BackupStatus::COMPLETED);
    bool warned = false;
    for (const auto& warning : progress.warnings) {
        if (warning.find("Critical file missing") != std::string::npos) {
            warned = true;
        }
    }
    EXPECT_TRUE(warned);
}

TEST_F(BackupEngineTest, EstimateSizeHonoursExclusions) {
    test_.context->settings.layout.excludePatterns = {"three"};
    BackupEngine engine(test_.context);
    EXPECT_EQ(engine.estimateSize({app_.string()}), 200u);
}
