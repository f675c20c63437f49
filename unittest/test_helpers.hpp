#pragma once

#include "adapters/compression_adapter.hpp"
#include "adapters/database_adapter.hpp"
#include "adapters/path_resolver.hpp"
#include "adapters/preferences_adapter.hpp"
#include "adapters/service_controller.hpp"
#include "common/app_context.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace testing_support {

class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("servershift_test_" + utils::randomHex(12));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::stringstream ss;
    ss << input.rdbuf();
    return ss.str();
}

class FakeServiceController : public ServiceController {
public:
    bool isRunning() override { return running_.load(); }
    bool stop() override {
        stopCalls++;
        running_.store(false);
        return true;
    }
    bool start() override {
        startCalls++;
        running_.store(true);
        return true;
    }
    std::string getLastError() const override { return ""; }

    void setRunning(bool running) { running_.store(running); }

    std::atomic<int> stopCalls{0};
    std::atomic<int> startCalls{0};

private:
    std::atomic<bool> running_{true};
};

class FakeDatabase : public DatabaseAdapter {
public:
    IntegrityResult checkIntegrity(const std::string&) override { return {true, "ok"}; }

    bool remapPaths(const std::string& dbPath, const std::map<std::string, std::string>& mapping) override {
        std::lock_guard<std::mutex> lock(mutex_);
        remapCalls.push_back({dbPath, mapping});
        return !failRemap;
    }

    bool exportSummary(const std::string&, const std::string& outputFile) override {
        writeFile(outputFile, "{\"sections\": []}");
        return true;
    }

    std::string getLastError() const override { return failRemap ? "remap refused" : ""; }

    struct RemapCall {
        std::string dbPath;
        std::map<std::string, std::string> mapping;
    };

    std::vector<RemapCall> remapCalls;
    bool failRemap = false;

private:
    std::mutex mutex_;
};

class FakePreferences : public PreferencesAdapter {
public:
    bool backup(const std::string& directory) override {
        writeFile(std::filesystem::path(directory) / kSnapshotFile, "snapshot");
        return true;
    }
    bool regenerateIdentity(const std::string&) override {
        regenerateCalls++;
        return true;
    }
    std::string getLastError() const override { return ""; }

    static constexpr const char* kSnapshotFile = "preferences_snapshot.xml";

    std::atomic<int> regenerateCalls{0};
};

// The "archive" is the sorted list of files the directory held when compressed.
class FakeCompression : public CompressionAdapter {
public:
    bool compress(const std::string& directory, const std::string& archivePath, ArchiveFormat) override {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(directory)) {
            if (entry.is_regular_file()) {
                names.push_back(std::filesystem::relative(entry.path(), directory).generic_string());
            }
        }
        std::sort(names.begin(), names.end());
        std::string listing;
        for (const auto& name : names) {
            listing += name + "\n";
        }
        writeFile(archivePath, listing);
        return true;
    }
    bool decompress(const std::string&, const std::string&) override { return false; }
    std::string getLastError() const override { return "not an archive"; }
};

struct TestContext {
    std::shared_ptr<AppContext> context;
    std::shared_ptr<FakeServiceController> service;
    std::shared_ptr<FakeDatabase> database;
    std::shared_ptr<FakePreferences> preferences;
};

// Fakes for every collaborator, quiet discovery and the portable copy path.
inline TestContext makeTestContext(const std::filesystem::path& dataDirectory) {
    Settings settings;
    settings.layout.dataDirectory = dataDirectory.string();
    settings.backup.mirrorTool = "none";
    settings.backup.progressIntervalMs = 0;
    settings.network.enableServiceRecords = false;
    settings.network.enableBroadcast = false;
    settings.network.enableSubnetProbe = false;
    settings.network.listenPort = 0;
    settings.network.listenWindowMs = 50;
    settings.network.tickIntervalMs = 100;
    settings.migration.discoveryTimeoutSeconds = 2;
    settings.migration.connectTimeoutSeconds = 5;
    settings.migration.remoteRestoreTimeoutSeconds = 10;

    TestContext test;
    test.service = std::make_shared<FakeServiceController>();
    test.database = std::make_shared<FakeDatabase>();
    test.preferences = std::make_shared<FakePreferences>();

    test.context = std::make_shared<AppContext>();
    test.context->settings = settings;
    test.context->hostname = "test-host";
    test.context->platform = utils::platformName();
    test.context->instanceId = utils::randomHex(8);
    test.context->pathResolver = std::make_shared<FixedPathResolver>(settings.layout);
    test.context->serviceController = test.service;
    test.context->database = test.database;
    test.context->preferences = test.preferences;
    return test;
}

// <data>/Plex Media Server with a database, preferences, one media bundle and excluded clutter.
inline std::filesystem::path makeAppTree(const std::filesystem::path& dataDirectory) {
    auto app = dataDirectory / "Plex Media Server";
    writeFile(app / "Preferences.xml", "<Preferences MachineIdentifier=\"abc\"/>");
    writeFile(app / "Plug-in Support/Databases/com.plexapp.plugins.library.db", std::string(100, 'd'));
    writeFile(app / "Media/localhost/0/a.bundle/poster.jpg", std::string(50, 'p'));
    writeFile(app / "Cache/PhotoTranscoder/x.jpg", "cached");
    writeFile(app / "Logs/Plex Media Server.log", "log line");
    return app;
}

} // namespace testing_support
