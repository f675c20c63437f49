#include "migration/migration_types.hpp"
#include "common/utils.hpp"
#include <algorithm>

using json = nlohmann::json;

std::string migrationModeToString(MigrationMode mode) {
    switch (mode) {
        case MigrationMode::LOCAL_BACKUP: return "local_backup";
        case MigrationMode::LOCAL_RESTORE: return "local_restore";
        case MigrationMode::NETWORK_PUSH: return "network_push";
        case MigrationMode::NETWORK_PULL: return "network_pull";
        case MigrationMode::FULL_MIGRATION: return "full_migration";
    }
    return "local_backup";
}

std::optional<MigrationMode> parseMigrationMode(const std::string& name) {
    if (name == "local_backup") return MigrationMode::LOCAL_BACKUP;
    if (name == "local_restore") return MigrationMode::LOCAL_RESTORE;
    if (name == "network_push") return MigrationMode::NETWORK_PUSH;
    if (name == "network_pull") return MigrationMode::NETWORK_PULL;
    if (name == "full_migration") return MigrationMode::FULL_MIGRATION;
    return std::nullopt;
}

std::string migrationPhaseToString(MigrationPhase phase) {
    switch (phase) {
        case MigrationPhase::IDLE: return "idle";
        case MigrationPhase::INITIALIZING: return "initializing";
        case MigrationPhase::DISCOVERING: return "discovering";
        case MigrationPhase::CONNECTING: return "connecting";
        case MigrationPhase::BACKING_UP: return "backing_up";
        case MigrationPhase::TRANSFERRING: return "transferring";
        case MigrationPhase::EXTRACTING: return "extracting";
        case MigrationPhase::REMAPPING_PATHS: return "remapping_paths";
        case MigrationPhase::UPDATING_PREFERENCES: return "updating_preferences";
        case MigrationPhase::STOPPING_TARGET: return "stopping_target";
        case MigrationPhase::RESTORING: return "restoring";
        case MigrationPhase::STARTING_TARGET: return "starting_target";
        case MigrationPhase::VERIFYING: return "verifying";
        case MigrationPhase::COMPLETED: return "completed";
        case MigrationPhase::FAILED: return "failed";
        case MigrationPhase::CANCELLED: return "cancelled";
    }
    return "idle";
}

json MigrationConfig::toJson() const {
    return {
        {"mode", migrationModeToString(mode)},
        {"source_path", sourcePath},
        {"target_path", targetPath},
        {"target_host", targetHost},
        {"target_port", targetPort},
        {"backup_mode", backupModeToString(backupMode)},
        {"compress", compress},
        {"compression_format", archiveFormatToString(compressionFormat)},
        {"verify_backup", verifyBackup},
        {"stop_service", stopService},
        {"path_mappings", pathMappings},
        {"preserve_machine_id", preserveMachineId},
        {"report_path", reportPath}
    };
}

double MigrationProgress::elapsedSeconds() const {
    if (startTime.time_since_epoch().count() == 0) {
        return 0.0;
    }
    auto end = endTime.value_or(std::chrono::system_clock::now());
    return std::chrono::duration<double>(end - startTime).count();
}

json MigrationProgress::toJson() const {
    return {
        {"phase", migrationPhaseToString(phase)},
        {"phase_description", phaseDescription},
        {"overall_percent", overallPercent},
        {"phase_percent", phasePercent},
        {"current_operation", currentOperation},
        {"bytes_total", bytesTotal},
        {"bytes_done", bytesDone},
        {"files_total", filesTotal},
        {"files_done", filesDone},
        {"elapsed_seconds", elapsedSeconds()},
        {"errors", errors},
        {"warnings", warnings}
    };
}

bool MigrationResult::visited(MigrationPhase phase) const {
    return std::find(phases.begin(), phases.end(), phase) != phases.end();
}

json MigrationResult::toJson() const {
    json phaseNames = json::array();
    for (auto phase : phases) {
        phaseNames.push_back(migrationPhaseToString(phase));
    }

    return {
        {"success", success},
        {"outcome", migrationPhaseToString(outcome)},
        {"phase_reached", migrationPhaseToString(phaseReached)},
        {"phases", phaseNames},
        {"backup_path", backupPath},
        {"duration_seconds", durationSeconds},
        {"bytes_transferred", bytesTransferred},
        {"files_transferred", filesTransferred},
        {"errors", errors},
        {"warnings", warnings},
        {"source_info", sourceInfo},
        {"target_info", targetInfo}
    };
}
