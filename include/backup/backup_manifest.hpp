#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ManifestEntry {
    uint64_t size = 0;
    double mtime = 0.0;  // seconds since the epoch
};

// Catalog of a backup tree, stored inside the tree it describes.
struct BackupManifest {
    static constexpr const char* kFileName = "backup_manifest.json";
    static constexpr const char* kVersion = "2.0.0";

    std::string version = kVersion;
    std::string createdAt;
    std::string sourcePlatform;
    std::string sourceHostname;
    std::string machineIdentifier;
    std::string serverName;
    std::string backupMode;
    uint64_t totalSize = 0;
    uint64_t fileCount = 0;
    std::map<std::string, ManifestEntry> files;     // '/'-separated relative paths
    std::map<std::string, std::string> checksums;   // relative path -> SHA-256

    // Replaces files with every regular file under root (the manifest itself excluded)
    // and recomputes the totals.
    void catalog(const std::filesystem::path& root);

    // True when relativePath is recorded with the same size and mtime.
    bool isUnchanged(const std::string& relativePath, uint64_t size, double mtime) const;

    nlohmann::json toJson() const;
    static BackupManifest fromJson(const nlohmann::json& json);

    bool save(const std::filesystem::path& path) const;
    static std::optional<BackupManifest> load(const std::filesystem::path& path);
};
