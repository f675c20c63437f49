#include "backup/backup_manifest.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cmath>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Tolerates the rounding of a JSON round-trip on sub-second timestamps
constexpr double kMtimeTolerance = 1e-6;

} // namespace

void BackupManifest::catalog(const fs::path& root) {
    files.clear();
    totalSize = 0;
    fileCount = 0;

    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            Logger::warning("Skipping unreadable entry while cataloguing " + root.string() + ": " + ec.message());
            ec.clear();
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        std::string relative = fs::relative(it->path(), root, ec).generic_string();
        if (ec || relative == kFileName) {
            ec.clear();
            continue;
        }

        ManifestEntry entry;
        entry.size = it->file_size(ec);
        if (ec) {
            ec.clear();
            continue;
        }
        entry.mtime = utils::modificationTime(it->path());
        files[relative] = entry;
        totalSize += entry.size;
        ++fileCount;
    }
}

bool BackupManifest::isUnchanged(const std::string& relativePath, uint64_t size, double mtime) const {
    auto it = files.find(relativePath);
    if (it == files.end()) {
        return false;
    }
    return it->second.size == size && std::fabs(it->second.mtime - mtime) < kMtimeTolerance;
}

json BackupManifest::toJson() const {
    json fileMap = json::object();
    for (const auto& [path, entry] : files) {
        fileMap[path] = {{"size", entry.size}, {"mtime", entry.mtime}};
    }

    return {
        {"version", version},
        {"created_at", createdAt},
        {"source_platform", sourcePlatform},
        {"source_hostname", sourceHostname},
        {"machine_identifier", machineIdentifier},
        {"server_name", serverName},
        {"backup_mode", backupMode},
        {"total_size", totalSize},
        {"file_count", fileCount},
        {"files", fileMap},
        {"checksums", checksums}
    };
}

BackupManifest BackupManifest::fromJson(const json& object) {
    BackupManifest manifest;
    manifest.version = object.value("version", std::string(kVersion));
    manifest.createdAt = object.value("created_at", "");
    manifest.sourcePlatform = object.value("source_platform", "");
    manifest.sourceHostname = object.value("source_hostname", "");
    manifest.machineIdentifier = object.value("machine_identifier", "");
    manifest.serverName = object.value("server_name", "");
    manifest.backupMode = object.value("backup_mode", "");

    if (object.contains("files")) {
        for (const auto& [path, entry] : object.at("files").items()) {
            ManifestEntry value;
            value.size = entry.value("size", static_cast<uint64_t>(0));
            value.mtime = entry.value("mtime", 0.0);
            manifest.files[path] = value;
            manifest.totalSize += value.size;
        }
    }
    manifest.fileCount = manifest.files.size();

    if (object.contains("checksums")) {
        manifest.checksums = object.at("checksums").get<std::map<std::string, std::string>>();
    }
    return manifest;
}

bool BackupManifest::save(const fs::path& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Failed to write manifest: " + path.string());
        return false;
    }
    file << toJson().dump(2);
    return file.good();
}

std::optional<BackupManifest> BackupManifest::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json object;
        file >> object;
        return fromJson(object);
    } catch (const json::exception& e) {
        Logger::warning("Ignoring unreadable manifest " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}
