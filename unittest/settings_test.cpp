#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "common/settings.hpp"
#include "test_helpers.hpp"

using namespace testing_support;
using json = nlohmann::json;

TEST(SettingsTest, DefaultsMatchTheWireProtocol) {
    Settings settings;
    EXPECT_EQ(settings.network.transferPort, 52400);
    EXPECT_EQ(settings.network.broadcastPort, 52401);
    EXPECT_EQ(settings.network.tickIntervalMs, 5000);
    EXPECT_EQ(settings.network.peerTtlSeconds, 60);
    EXPECT_EQ(settings.layout.backupDirName, "Plex Media Server");
}

TEST(SettingsTest, MissingKeysKeepDefaultsAndUnknownKeysAreIgnored) {
    json object = {
        {"log_level", "debug"},
        {"network", {{"transfer_port", 6000}, {"not_a_setting", true}}},
        {"something_else", 1}
    };

    Settings settings = Settings::fromJson(object);
    EXPECT_EQ(settings.logLevel, "debug");
    EXPECT_EQ(settings.network.transferPort, 6000);
    EXPECT_EQ(settings.network.broadcastPort, 52401);
    EXPECT_EQ(settings.migration.discoveryTimeoutSeconds, 60);
}

TEST(SettingsTest, SaveThenLoadKeepsValues) {
    TempDir dir;
    Settings settings;
    settings.layout.dataDirectory = "/srv/appdata";
    settings.layout.excludePatterns = {"Cache"};
    settings.backup.mirrorTool = "rsync";
    settings.network.enableSubnetProbe = false;
    settings.migration.remoteRestoreTimeoutSeconds = 42;

    auto path = (dir.path() / "settings.json").string();
    ASSERT_TRUE(settings.save(path));

    Settings loaded = Settings::load(path);
    EXPECT_EQ(loaded.layout.dataDirectory, "/srv/appdata");
    EXPECT_EQ(loaded.layout.excludePatterns, std::vector<std::string>{"Cache"});
    EXPECT_EQ(loaded.backup.mirrorTool, "rsync");
    EXPECT_FALSE(loaded.network.enableSubnetProbe);
    EXPECT_EQ(loaded.migration.remoteRestoreTimeoutSeconds, 42);
}

TEST(SettingsTest, MalformedFileRaisesConfigurationError) {
    TempDir dir;
    writeFile(dir.path() / "bad.json", "{ \"network\": ");
    EXPECT_THROW(Settings::load((dir.path() / "bad.json").string()), ConfigurationError);
    EXPECT_THROW(Settings::load((dir.path() / "absent.json").string()), ConfigurationError);
}

TEST(SettingsTest, WrongTypesRaiseConfigurationError) {
    json object = {{"network", {{"transfer_port", "not a number"}}}};
    EXPECT_THROW(Settings::fromJson(object), ConfigurationError);
    EXPECT_THROW(Settings::fromJson(json::array()), ConfigurationError);
}
