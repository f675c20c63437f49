#pragma once

#include "adapters/compression_adapter.hpp"
#include "backup/backup_types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class MigrationMode {
    LOCAL_BACKUP,
    LOCAL_RESTORE,
    NETWORK_PUSH,
    NETWORK_PULL,
    FULL_MIGRATION
};

enum class MigrationPhase {
    IDLE,
    INITIALIZING,
    DISCOVERING,
    CONNECTING,
    BACKING_UP,
    TRANSFERRING,
    EXTRACTING,
    REMAPPING_PATHS,
    UPDATING_PREFERENCES,
    STOPPING_TARGET,
    RESTORING,
    STARTING_TARGET,
    VERIFYING,
    COMPLETED,
    FAILED,
    CANCELLED
};

std::string migrationModeToString(MigrationMode mode);
std::optional<MigrationMode> parseMigrationMode(const std::string& name);
std::string migrationPhaseToString(MigrationPhase phase);

// Immutable once handed to the coordinator.
struct MigrationConfig {
    MigrationMode mode = MigrationMode::LOCAL_BACKUP;
    std::string sourcePath;   // backup tree or archive to restore
    std::string targetPath;   // backup destination, restore target or receive directory
    std::string targetHost;
    int targetPort = 52400;
    BackupMode backupMode = BackupMode::SMART;
    bool compress = false;
    ArchiveFormat compressionFormat = ArchiveFormat::ZIP;
    bool verifyBackup = true;
    bool stopService = true;
    std::map<std::string, std::string> pathMappings;  // old prefix -> new prefix
    bool preserveMachineId = false;
    std::string reportPath;   // written at the end of the run when set

    nlohmann::json toJson() const;
};

struct MigrationProgress {
    MigrationPhase phase = MigrationPhase::IDLE;
    std::string phaseDescription;
    double overallPercent = 0.0;
    double phasePercent = 0.0;
    std::string currentOperation;
    uint64_t bytesTotal = 0;
    uint64_t bytesDone = 0;
    uint64_t filesTotal = 0;
    uint64_t filesDone = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::chrono::system_clock::time_point startTime{};
    std::optional<std::chrono::system_clock::time_point> endTime;

    double elapsedSeconds() const;
    nlohmann::json toJson() const;
};

struct MigrationResult {
    bool success = false;
    MigrationPhase outcome = MigrationPhase::IDLE;        // COMPLETED, FAILED or CANCELLED
    MigrationPhase phaseReached = MigrationPhase::IDLE;   // last working phase entered
    std::vector<MigrationPhase> phases;                   // in the order they ran
    std::string backupPath;
    double durationSeconds = 0.0;
    uint64_t bytesTransferred = 0;
    uint64_t filesTransferred = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    nlohmann::json sourceInfo = nlohmann::json::object();
    nlohmann::json targetInfo = nlohmann::json::object();

    bool visited(MigrationPhase phase) const;
    nlohmann::json toJson() const;
};
