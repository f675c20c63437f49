#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Where the managed application keeps its state, relative to its data directory.
struct LayoutSettings {
    std::string dataDirectory;
    std::string backupDirName = "Plex Media Server";
    std::string databasesDir = "Plug-in Support/Databases";
    std::string mainDatabase = "com.plexapp.plugins.library.db";
    std::string preferencesFile = "Preferences.xml";
    std::vector<std::string> criticalFiles = {
        "Preferences.xml",
        "Plug-in Support/Databases/com.plexapp.plugins.library.db",
        "Plug-in Support/Databases/com.plexapp.plugins.library.blobs.db"
    };
    std::vector<std::string> excludePatterns = {
        "Cache",
        "Crash Reports",
        "Diagnostics",
        "Logs",
        "Updates",
        "*.tmp",
        "*.log",
        "Transcode",
        "plexmediaserver.pid",
        ".plex.pid"
    };
};

struct ServiceSettings {
    std::string statusCommand = "systemctl is-active --quiet plexmediaserver";
    std::string stopCommand = "systemctl stop plexmediaserver";
    std::string startCommand = "systemctl start plexmediaserver";
    int commandTimeoutSeconds = 60;
    int settleSeconds = 3;  // grace period after a stop
};

struct BackupSettings {
    std::string mirrorTool = "auto";  // auto, rsync, robocopy, none
    int mirrorThreads = 8;
    int mirrorRetries = 3;
    int mirrorRetryWaitSeconds = 5;
    int progressIntervalMs = 1000;
};

struct NetworkSettings {
    int transferPort = 52400;
    int broadcastPort = 52401;  // destination of announcements
    int listenPort = 52401;     // where announcements are received
    std::string broadcastAddress = "255.255.255.255";
    int tickIntervalMs = 5000;
    int listenWindowMs = 2000;
    int peerTtlSeconds = 60;
    int managedServicePort = 32400;
    int probeStride = 10;
    int probeTimeoutMs = 500;
    int serviceRecordWindowMs = 1000;
    bool enableServiceRecords = true;
    bool enableBroadcast = true;
    bool enableSubnetProbe = true;
    bool probeIdentity = true;
    std::vector<std::string> serviceTypes = {
        "_plexmediasvr._tcp.local",
        "_servershift._tcp.local"
    };
};

struct MigrationSettings {
    std::string scratchDirectory;  // empty: system temp directory
    int discoveryTimeoutSeconds = 60;
    int connectTimeoutSeconds = 30;
    int remoteRestoreTimeoutSeconds = 600;
};

struct Settings {
    std::string logPath = "/tmp/servershift.log";
    std::string logLevel = "info";
    LayoutSettings layout;
    ServiceSettings service;
    BackupSettings backup;
    NetworkSettings network;
    MigrationSettings migration;

    nlohmann::json toJson() const;
    // Missing keys keep their defaults. Throws ConfigurationError on type mismatches.
    static Settings fromJson(const nlohmann::json& json);

    static Settings load(const std::string& path);
    bool save(const std::string& path) const;
};
