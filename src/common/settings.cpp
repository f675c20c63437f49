#include "common/settings.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {

template <typename T>
void readValue(const json& object, const char* key, T& target) {
    if (object.contains(key) && !object.at(key).is_null()) {
        target = object.at(key).get<T>();
    }
}

} // namespace

json Settings::toJson() const {
    json result;
    result["log_path"] = logPath;
    result["log_level"] = logLevel;
    result["layout"] = {
        {"data_directory", layout.dataDirectory},
        {"backup_dir_name", layout.backupDirName},
        {"databases_dir", layout.databasesDir},
        {"main_database", layout.mainDatabase},
        {"preferences_file", layout.preferencesFile},
        {"critical_files", layout.criticalFiles},
        {"exclude_patterns", layout.excludePatterns}
    };
    result["service"] = {
        {"status_command", service.statusCommand},
        {"stop_command", service.stopCommand},
        {"start_command", service.startCommand},
        {"command_timeout_seconds", service.commandTimeoutSeconds},
        {"settle_seconds", service.settleSeconds}
    };
    result["backup"] = {
        {"mirror_tool", backup.mirrorTool},
        {"mirror_threads", backup.mirrorThreads},
        {"mirror_retries", backup.mirrorRetries},
        {"mirror_retry_wait_seconds", backup.mirrorRetryWaitSeconds},
        {"progress_interval_ms", backup.progressIntervalMs}
    };
    result["network"] = {
        {"transfer_port", network.transferPort},
        {"broadcast_port", network.broadcastPort},
        {"listen_port", network.listenPort},
        {"broadcast_address", network.broadcastAddress},
        {"tick_interval_ms", network.tickIntervalMs},
        {"listen_window_ms", network.listenWindowMs},
        {"peer_ttl_seconds", network.peerTtlSeconds},
        {"managed_service_port", network.managedServicePort},
        {"probe_stride", network.probeStride},
        {"probe_timeout_ms", network.probeTimeoutMs},
        {"service_record_window_ms", network.serviceRecordWindowMs},
        {"enable_service_records", network.enableServiceRecords},
        {"enable_broadcast", network.enableBroadcast},
        {"enable_subnet_probe", network.enableSubnetProbe},
        {"probe_identity", network.probeIdentity},
        {"service_types", network.serviceTypes}
    };
    result["migration"] = {
        {"scratch_directory", migration.scratchDirectory},
        {"discovery_timeout_seconds", migration.discoveryTimeoutSeconds},
        {"connect_timeout_seconds", migration.connectTimeoutSeconds},
        {"remote_restore_timeout_seconds", migration.remoteRestoreTimeoutSeconds}
    };
    return result;
}

Settings Settings::fromJson(const json& object) {
    Settings settings;
    if (!object.is_object()) {
        throw ConfigurationError("Settings root must be a JSON object");
    }

    try {
        readValue(object, "log_path", settings.logPath);
        readValue(object, "log_level", settings.logLevel);

        if (object.contains("layout")) {
            const auto& section = object.at("layout");
            readValue(section, "data_directory", settings.layout.dataDirectory);
            readValue(section, "backup_dir_name", settings.layout.backupDirName);
            readValue(section, "databases_dir", settings.layout.databasesDir);
            readValue(section, "main_database", settings.layout.mainDatabase);
            readValue(section, "preferences_file", settings.layout.preferencesFile);
            readValue(section, "critical_files", settings.layout.criticalFiles);
            readValue(section, "exclude_patterns", settings.layout.excludePatterns);
        }

        if (object.contains("service")) {
            const auto& section = object.at("service");
            readValue(section, "status_command", settings.service.statusCommand);
            readValue(section, "stop_command", settings.service.stopCommand);
            readValue(section, "start_command", settings.service.startCommand);
            readValue(section, "command_timeout_seconds", settings.service.commandTimeoutSeconds);
            readValue(section, "settle_seconds", settings.service.settleSeconds);
        }

        if (object.contains("backup")) {
            const auto& section = object.at("backup");
            readValue(section, "mirror_tool", settings.backup.mirrorTool);
            readValue(section, "mirror_threads", settings.backup.mirrorThreads);
            readValue(section, "mirror_retries", settings.backup.mirrorRetries);
            readValue(section, "mirror_retry_wait_seconds", settings.backup.mirrorRetryWaitSeconds);
            readValue(section, "progress_interval_ms", settings.backup.progressIntervalMs);
        }

        if (object.contains("network")) {
            const auto& section = object.at("network");
            readValue(section, "transfer_port", settings.network.transferPort);
            readValue(section, "broadcast_port", settings.network.broadcastPort);
            readValue(section, "listen_port", settings.network.listenPort);
            readValue(section, "broadcast_address", settings.network.broadcastAddress);
            readValue(section, "tick_interval_ms", settings.network.tickIntervalMs);
            readValue(section, "listen_window_ms", settings.network.listenWindowMs);
            readValue(section, "peer_ttl_seconds", settings.network.peerTtlSeconds);
            readValue(section, "managed_service_port", settings.network.managedServicePort);
            readValue(section, "probe_stride", settings.network.probeStride);
            readValue(section, "probe_timeout_ms", settings.network.probeTimeoutMs);
            readValue(section, "service_record_window_ms", settings.network.serviceRecordWindowMs);
            readValue(section, "enable_service_records", settings.network.enableServiceRecords);
            readValue(section, "enable_broadcast", settings.network.enableBroadcast);
            readValue(section, "enable_subnet_probe", settings.network.enableSubnetProbe);
            readValue(section, "probe_identity", settings.network.probeIdentity);
            readValue(section, "service_types", settings.network.serviceTypes);
        }

        if (object.contains("migration")) {
            const auto& section = object.at("migration");
            readValue(section, "scratch_directory", settings.migration.scratchDirectory);
            readValue(section, "discovery_timeout_seconds", settings.migration.discoveryTimeoutSeconds);
            readValue(section, "connect_timeout_seconds", settings.migration.connectTimeoutSeconds);
            readValue(section, "remote_restore_timeout_seconds", settings.migration.remoteRestoreTimeoutSeconds);
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid settings: ") + e.what());
    }

    if (settings.network.probeStride < 1) {
        throw ConfigurationError("network.probe_stride must be at least 1");
    }
    if (settings.network.tickIntervalMs < 0 || settings.network.listenWindowMs < 0) {
        throw ConfigurationError("network intervals must not be negative");
    }

    return settings;
}

Settings Settings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open settings file: " + path);
    }

    json object;
    try {
        file >> object;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Failed to parse settings file " + path + ": " + e.what());
    }
    return fromJson(object);
}

bool Settings::save(const std::string& path) const {
    try {
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            Logger::error("Failed to open settings file for writing: " + path);
            return false;
        }
        file << toJson().dump(4);
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to write settings: " + std::string(e.what()));
        return false;
    }
}
